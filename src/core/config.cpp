#include <sortid/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sortid {

const char* output_format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::Text:    return "text";
        case OutputFormat::Integer: return "integer";
        case OutputFormat::Uuid:    return "uuid";
        case OutputFormat::Hex:     return "hex";
    }
    return "unknown";
}

Result<OutputFormat> parse_output_format(const std::string& s) {
    if (s == "text") return Result<OutputFormat>::ok(OutputFormat::Text);
    if (s == "integer") return Result<OutputFormat>::ok(OutputFormat::Integer);
    if (s == "uuid") return Result<OutputFormat>::ok(OutputFormat::Uuid);
    if (s == "hex") return Result<OutputFormat>::ok(OutputFormat::Hex);
    return SortidError{SortidError::Config,
        "unknown output format '" + s + "'",
        "expected one of: text, integer, uuid, hex"};
}

Result<log::Level> parse_log_level(const std::string& s) {
    if (s == "trace") return Result<log::Level>::ok(log::Trace);
    if (s == "debug") return Result<log::Level>::ok(log::Debug);
    if (s == "info") return Result<log::Level>::ok(log::Info);
    if (s == "warn") return Result<log::Level>::ok(log::Warn);
    if (s == "error") return Result<log::Level>::ok(log::Error);
    return SortidError{SortidError::Config,
        "unknown log level '" + s + "'",
        "expected one of: trace, debug, info, warn, error"};
}

Result<uint64_t> parse_u64_arg(const std::string& flag, const std::string& text) {
    auto invalid = [&] {
        return SortidError{SortidError::InvalidArg,
            "invalid value '" + text + "' for " + flag,
            "expected a non-negative integer"};
    };
    if (text.empty() || text[0] == '-' || text[0] == '+' ||
        std::isspace(static_cast<unsigned char>(text[0]))) {
        return invalid();
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return invalid();
    }
    return Result<uint64_t>::ok(static_cast<uint64_t>(v));
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SortidError{SortidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [generate] section
    if (auto gen = doc["generate"].as_table()) {
        if (auto v = (*gen)["count"].value<int64_t>()) {
            if (*v < 1 || *v > UINT32_MAX) {
                return SortidError{SortidError::Config,
                    "generate.count must be between 1 and 4294967295",
                    "got " + std::to_string(*v)};
            }
            cfg.generate.count = static_cast<uint32_t>(*v);
            cfg.count_set = true;
        }
        if (auto v = (*gen)["monotonic"].value<bool>()) {
            cfg.generate.monotonic = *v;
            cfg.monotonic_set = true;
        }
        if (auto v = (*gen)["format"].value<std::string>()) {
            auto fmt = parse_output_format(*v);
            if (fmt.is_err()) return std::move(fmt).error();
            cfg.generate.format = fmt.value();
            cfg.format_set = true;
        }
    }

    // [random] section
    if (auto rnd = doc["random"].as_table()) {
        if (auto v = (*rnd)["source"].value<std::string>()) {
            if (*v == "system") {
                cfg.random.source = RandomKind::System;
            } else if (*v == "seeded") {
                cfg.random.source = RandomKind::Seeded;
            } else {
                return SortidError{SortidError::Config,
                    "unknown random source '" + *v + "'",
                    "expected one of: system, seeded"};
            }
            cfg.source_set = true;
        }
        if (auto v = (*rnd)["seed"].value<int64_t>()) {
            cfg.random.seed = static_cast<uint64_t>(*v);
            cfg.seed_set = true;
        }
    }

    // [decode] section
    if (auto dec = doc["decode"].as_table()) {
        if (auto v = (*dec)["case"].value<std::string>()) {
            if (*v == "insensitive") {
                cfg.decode_case = base32::CaseMode::Insensitive;
            } else if (*v == "upper") {
                cfg.decode_case = base32::CaseMode::UpperOnly;
            } else {
                return SortidError{SortidError::Config,
                    "unknown decode case policy '" + *v + "'",
                    "expected one of: insensitive, upper"};
            }
            cfg.decode_case_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = parse_log_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.logging.level = lvl.value();
            cfg.level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.logging.color = *v;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SortidError{SortidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.count_set) {
        generate.count = other.generate.count;
        count_set = true;
    }
    if (other.monotonic_set) {
        generate.monotonic = other.generate.monotonic;
        monotonic_set = true;
    }
    if (other.format_set) {
        generate.format = other.generate.format;
        format_set = true;
    }
    if (other.source_set) {
        random.source = other.random.source;
        source_set = true;
    }
    if (other.seed_set) {
        random.seed = other.random.seed;
        seed_set = true;
    }
    if (other.decode_case_set) {
        decode_case = other.decode_case;
        decode_case_set = true;
    }
    if (other.level_set) {
        logging.level = other.logging.level;
        level_set = true;
    }
    if (other.logging.color.has_value()) {
        logging.color = other.logging.color;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local,
                         const std::optional<Config>& explicit_layer) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    if (explicit_layer.has_value()) result.merge(explicit_layer.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.sortid/config.toml";
}

} // namespace sortid
