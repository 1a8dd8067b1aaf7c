#pragma once

#include <sortid/base32.hpp>
#include <sortid/log.hpp>
#include <sortid/result.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace sortid {

// Output representation for generated identifiers
enum class OutputFormat { Text, Integer, Uuid, Hex };

enum class RandomKind { System, Seeded };

struct GenerateConfig {
    uint32_t count = 1;
    bool monotonic = false;
    OutputFormat format = OutputFormat::Text;
};

struct RandomConfig {
    RandomKind source = RandomKind::System;
    uint64_t seed = 0;
};

struct LogConfig {
    log::Level level = log::Info;
    std::optional<bool> color;  // unset: detect from the terminal
};

// Layered configuration: global (~/.sortid/config.toml) < local (./sortid.toml)
// < an explicit --config file. Later layers override earlier ones field by
// field; only fields a layer actually sets take part in the merge.
struct Config {
    GenerateConfig generate;
    RandomConfig random;
    base32::CaseMode decode_case = base32::CaseMode::Insensitive;
    LogConfig logging;

    // Track which fields were explicitly set (for merge)
    bool count_set = false;
    bool monotonic_set = false;
    bool format_set = false;
    bool source_set = false;
    bool seed_set = false;
    bool decode_case_set = false;
    bool level_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> local -> explicit
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local,
                            const std::optional<Config>& explicit_layer = std::nullopt);
};

const char* output_format_name(OutputFormat f);
Result<OutputFormat> parse_output_format(const std::string& s);
Result<log::Level> parse_log_level(const std::string& s);

// Command-line numbers: plain ASCII digits only, no sign or surrounding
// whitespace. Errors are InvalidArg and name `flag`.
Result<uint64_t> parse_u64_arg(const std::string& flag, const std::string& text);

// Discover the global config file path: ~/.sortid/config.toml
std::string global_config_path();

// Name of the per-directory config file
constexpr const char* LOCAL_CONFIG_NAME = "sortid.toml";

} // namespace sortid
