#include <sortid/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace sortid::log {

// Callable from any thread. Settings are atomics and each record is written
// with a single stdio call, so lines from different threads do not interleave.

static bool detect_color() {
    return isatty(fileno(stderr)) != 0;
}

static std::atomic<Level> s_level{Info};
static std::atomic<bool> s_color_enabled{detect_color()};
static std::mutex s_prefix_mutex;
static std::string s_prefix;

void set_level(Level lvl) {
    s_level.store(lvl);
}

Level get_level() {
    return s_level.load();
}

void set_color_enabled(bool enabled) {
    s_color_enabled.store(enabled);
}

bool is_color_enabled() {
    return s_color_enabled.load();
}

void configure(Level lvl, std::optional<bool> color) {
    set_level(lvl);
    set_color_enabled(color.has_value() ? *color : detect_color());
}

void set_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(s_prefix_mutex);
    s_prefix = prefix;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
    }
    return "";
}

static std::string format_args(const char* fmt, va_list args) {
    va_list sizing;
    va_copy(sizing, args);
    int n = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (n <= 0) return std::string();

    std::string out(static_cast<size_t>(n) + 1, '\0');
    std::vsnprintf(&out[0], out.size(), fmt, args);
    out.resize(static_cast<size_t>(n));
    return out;
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level.load()) return;

    std::string line;
    {
        std::lock_guard<std::mutex> lock(s_prefix_mutex);
        if (!s_prefix.empty()) {
            line = s_prefix + ": ";
        }
    }
    if (s_color_enabled.load()) {
        line += level_color(lvl);
        line += level_name(lvl);
        line += "\033[0m";
    } else {
        line += level_name(lvl);
    }
    line += ": ";
    line += format_args(fmt, args);
    line += '\n';

    std::fputs(line.c_str(), stderr);
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace sortid::log
