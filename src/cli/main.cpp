// sortid: generate or inspect ULIDs from the command line.
//
//     sortid                      # one ULID
//     sortid -n 5 -m              # five monotonic ULIDs
//     sortid --format uuid        # print as UUID
//     sortid 01ARZ3NDEKTSV4RRFFQ69G5FAV   # inspect
//
// Settings come from ~/.sortid/config.toml, then ./sortid.toml, then the file
// given with --config; command-line flags win over all of them.

#include <sortid/config.hpp>
#include <sortid/format.hpp>
#include <sortid/generator.hpp>
#include <sortid/log.hpp>
#include <sortid/random.hpp>
#include <sortid/result.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace sortid;

static const char* usage_text =
    "usage: sortid [options] [ULID...]\n"
    "\n"
    "Without ULID arguments, generate identifiers. With arguments, inspect them.\n"
    "\n"
    "options:\n"
    "  -n, --count N        number of ULIDs to generate\n"
    "  -m, --monotonic      strictly increasing output within a millisecond\n"
    "  -f, --format FORMAT  text | integer | uuid | hex\n"
    "      --seed N         deterministic random source\n"
    "      --upper-only     reject lowercase input when inspecting\n"
    "      --config PATH    extra configuration file\n"
    "  -v, --verbose        debug logging\n"
    "  -q, --quiet          errors only\n"
    "  -h, --help           show this help\n";

struct CliOptions {
    std::optional<uint32_t> count;
    bool monotonic = false;
    std::optional<OutputFormat> format;
    std::optional<uint64_t> seed;
    bool upper_only = false;
    std::string config_path;
    std::optional<log::Level> level;
    bool help = false;
    std::vector<std::string> ulids;
};

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

static Result<CliOptions> parse_args(int argc, char** argv) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return SortidError{SortidError::InvalidArg,
                    "missing value for " + flag, usage_text};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-n" || arg == "--count") {
            SORTID_TRY_ASSIGN(text, next_value(arg));
            SORTID_TRY_ASSIGN(n, parse_u64_arg(arg, text));
            if (n < 1 || n > UINT32_MAX) {
                return SortidError{SortidError::InvalidArg,
                    "count must be between 1 and 4294967295"};
            }
            opts.count = static_cast<uint32_t>(n);
        } else if (arg == "-m" || arg == "--monotonic") {
            opts.monotonic = true;
        } else if (arg == "-f" || arg == "--format") {
            SORTID_TRY_ASSIGN(text, next_value(arg));
            auto fmt = parse_output_format(text);
            if (fmt.is_err()) {
                auto err = std::move(fmt).error();
                err.code = SortidError::InvalidArg;
                return err;
            }
            opts.format = fmt.value();
        } else if (arg == "--seed") {
            SORTID_TRY_ASSIGN(text, next_value(arg));
            SORTID_TRY_ASSIGN(seed, parse_u64_arg(arg, text));
            opts.seed = seed;
        } else if (arg == "--upper-only") {
            opts.upper_only = true;
        } else if (arg == "--config") {
            SORTID_TRY_ASSIGN(text, next_value(arg));
            opts.config_path = text;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.level = log::Debug;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.level = log::Error;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return SortidError{SortidError::InvalidArg,
                "unknown option '" + arg + "'", "run 'sortid --help' for usage"};
        } else {
            opts.ulids.push_back(arg);
        }
    }

    if (!opts.ulids.empty() && opts.count.has_value()) {
        return SortidError{SortidError::InvalidArg,
            "--count cannot be combined with ULID arguments",
            "pass either ULIDs to inspect or a count to generate"};
    }

    return Result<CliOptions>::ok(std::move(opts));
}

// ---------------------------------------------------------------------------
// Configuration layers
// ---------------------------------------------------------------------------

static Result<std::optional<Config>> load_optional(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    SORTID_TRY_ASSIGN(cfg, Config::load(path));
    log::debug("loaded config %s", path.c_str());
    return Result<std::optional<Config>>::ok(std::move(cfg));
}

static Result<Config> load_config(const CliOptions& opts) {
    SORTID_TRY_ASSIGN(global, load_optional(global_config_path()));
    SORTID_TRY_ASSIGN(local, load_optional(LOCAL_CONFIG_NAME));

    std::optional<Config> explicit_layer;
    if (!opts.config_path.empty()) {
        SORTID_TRY_ASSIGN(cfg, Config::load(opts.config_path));
        explicit_layer = std::move(cfg);
    }

    Config cfg = Config::effective(global, local, explicit_layer);

    if (opts.count) cfg.generate.count = *opts.count;
    if (opts.monotonic) cfg.generate.monotonic = true;
    if (opts.format) cfg.generate.format = *opts.format;
    if (opts.seed) {
        cfg.random.source = RandomKind::Seeded;
        cfg.random.seed = *opts.seed;
    }
    if (opts.upper_only) cfg.decode_case = base32::CaseMode::UpperOnly;
    if (opts.level) cfg.logging.level = *opts.level;

    return Result<Config>::ok(std::move(cfg));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static Status run_generate(const Config& cfg, RandomSource& rng) {
    const auto& gen = cfg.generate;
    log::debug("generating %u ULID(s), monotonic=%s, format=%s", gen.count,
               gen.monotonic ? "true" : "false", output_format_name(gen.format));

    if (!gen.monotonic) {
        for (uint32_t i = 0; i < gen.count; ++i) {
            SORTID_TRY_ASSIGN(id, generate(rng));
            std::cout << format_ulid(id, gen.format) << "\n";
        }
        return ok_status();
    }

    MonotonicGenerator mono;
    uint32_t produced = 0;
    while (produced < gen.count) {
        auto r = mono.generate(rng);
        if (r.is_err()) {
            if (r.error().code != SortidError::MonotonicOverflow) {
                return std::move(r).error();
            }
            // The failed attempt is not counted; the next millisecond resets
            // the payload
            log::warn("random space exhausted for this millisecond, sleeping 1 ms");
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        std::cout << format_ulid(r.value(), gen.format) << "\n";
        ++produced;
    }
    return ok_status();
}

// Returns the number of arguments that failed to decode
static int run_inspect(const std::vector<std::string>& values, base32::CaseMode mode) {
    int failures = 0;
    for (const auto& text : values) {
        auto r = Ulid::parse(text, mode);
        if (r.is_err()) {
            std::cerr << text << " is not a valid ULID\n" << r.error().format() << "\n";
            ++failures;
            continue;
        }
        std::cout << describe(r.value()) << "\n";
    }
    return failures;
}

int main(int argc, char** argv) {
    log::set_prefix("sortid");

    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 2;
    }
    if (opts.value().help) {
        std::cout << usage_text;
        return 0;
    }

    auto cfg = load_config(opts.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    log::configure(cfg.value().logging.level, cfg.value().logging.color);

    if (!opts.value().ulids.empty()) {
        return run_inspect(opts.value().ulids, cfg.value().decode_case) == 0 ? 0 : 1;
    }

    auto rng = make_random_source(cfg.value().random);
    auto status = run_generate(cfg.value(), *rng);
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
