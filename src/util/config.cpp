#include <ulidkit/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace ulidkit {

static UlidError type_error(const std::string& key, const char* expected) {
    return UlidError{UlidError::Config,
        "config key '" + key + "' must be " + expected};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UlidError{UlidError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto section = doc["log"].as_table()) {
        if (auto node = (*section)["level"]) {
            auto name = node.value<std::string>();
            if (!name) return type_error("log.level", "a string");
            auto lvl = log::parse_level(*name);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.logging.level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto node = (*section)["color"]) {
            auto v = node.value<bool>();
            if (!v) return type_error("log.color", "a boolean");
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    // [generate] section
    if (auto section = doc["generate"].as_table()) {
        if (auto node = (*section)["count"]) {
            if (!node.is_integer()) return type_error("generate.count", "an integer");
            int64_t count = *node.value<int64_t>();
            if (count < 1) {
                return UlidError{UlidError::Config,
                    "config key 'generate.count' must be at least 1",
                    "got " + std::to_string(count)};
            }
            cfg.generate.count = count;
            cfg.count_set = true;
        }
        if (auto node = (*section)["monotonic"]) {
            auto v = node.value<bool>();
            if (!v) return type_error("generate.monotonic", "a boolean");
            cfg.generate.monotonic = *v;
            cfg.monotonic_set = true;
        }
    }

    // [output] section
    if (auto section = doc["output"].as_table()) {
        if (auto node = (*section)["verbose"]) {
            auto v = node.value<bool>();
            if (!v) return type_error("output.verbose", "a boolean");
            cfg.output.verbose = *v;
            cfg.verbose_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UlidError{UlidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().hint = "in " + path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
    if (other.count_set) {
        generate.count = other.generate.count;
        count_set = true;
    }
    if (other.monotonic_set) {
        generate.monotonic = other.generate.monotonic;
        monotonic_set = true;
    }
    if (other.verbose_set) {
        output.verbose = other.output.verbose;
        verbose_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ulidkit/config.toml";
}

std::string local_config_path() {
    return "ulidkit.toml";
}

} // namespace ulidkit
