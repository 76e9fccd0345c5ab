#pragma once

#include <ulid/result.hpp>
#include <ulid/log.hpp>
#include <string>

namespace ulid {

// Upper bound on ids printed by one generate call, from config or -n
constexpr int MAX_GENERATE_COUNT = 1000000;

enum class OutputFormat { Text, Hex };

const char* output_format_name(OutputFormat f);

// Settings for the ulid tool, read from TOML:
//
//   [log]       level = "info", color = true
//   [generate]  count = 1, format = "text" | "hex"
//   [store]     path = "..."
struct Config {
    log::Level log_level = log::Info;
    bool color = true;
    int generate_count = 1;
    OutputFormat format = OutputFormat::Text;
    std::string store_path;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool color_set = false;
    bool generate_count_set = false;
    bool format_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);
};

// ~/.ulid/config.toml
std::string default_config_path();

} // namespace ulid
