#pragma once

#include <ulidkit/log.hpp>
#include <ulidkit/result.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ulidkit {

struct LogConfig {
    log::Level level = log::Warn;
    bool color = false;
};

struct GenerateConfig {
    int64_t count = 1;
    bool monotonic = false;
};

struct OutputConfig {
    bool verbose = false;
};

// Settings for the ulidkit command-line tool, read from TOML:
//
//   [log]       level = "debug", color = true
//   [generate]  count = 5, monotonic = true
//   [output]    verbose = true
//
// Layered: global (~/.ulidkit/config.toml) then local (./ulidkit.toml);
// the local file wins.
struct Config {
    LogConfig logging;
    GenerateConfig generate;
    OutputConfig output;
    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool count_set = false;
    bool monotonic_set = false;
    bool verbose_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// ~/.ulidkit/config.toml, or empty if HOME is unset
std::string global_config_path();

// ulidkit.toml in the working directory
std::string local_config_path();

} // namespace ulidkit
