#include <sieve/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>

namespace sieve {

static SieveError type_error(const std::string& key, const char* expected) {
    return SieveError{SieveError::Config,
        "config key '" + key + "' must be " + expected};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SieveError{SieveError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [rules] section
    if (auto rules = doc["rules"].as_table()) {
        if (auto node = (*rules)["file"]) {
            auto v = node.value<std::string>();
            if (!v) return type_error("rules.file", "a string");
            cfg.rules.file = *v;
            cfg.rules_file_set = true;
        }
        if (auto node = (*rules)["cache"]) {
            auto v = node.value<bool>();
            if (!v) return type_error("rules.cache", "a boolean");
            cfg.rules.cache = *v;
            cfg.rules_cache_set = true;
        }
        if (auto node = (*rules)["ignore-case"]) {
            auto v = node.value<bool>();
            if (!v) return type_error("rules.ignore-case", "a boolean");
            cfg.rules.ignore_case = *v;
            cfg.rules_ignore_case_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"]) {
            auto v = node.value<std::string>();
            if (!v) return type_error("log.level", "a string");
            if (!log::parse_level(*v, cfg.logging.level)) {
                return SieveError{SieveError::Config,
                    "unknown log level '" + *v + "'",
                    "use one of: trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
        if (auto node = (*lg)["color"]) {
            auto v = node.value<bool>();
            if (!v) return type_error("log.color", "a boolean");
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SieveError{SieveError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.rules_file_set) {
        rules.file = other.rules.file;
        rules_file_set = true;
    }
    if (other.rules_cache_set) {
        rules.cache = other.rules.cache;
        rules_cache_set = true;
    }
    if (other.rules_ignore_case_set) {
        rules.ignore_case = other.rules.ignore_case;
        rules_ignore_case_set = true;
    }
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& file,
                         const Config& flags) {
    Config result;
    if (file.has_value()) result.merge(file.value());
    result.merge(flags);
    return result;
}

GlobOptions Config::glob_options() const {
    GlobOptions opts;
    opts.case_insensitive = rules.ignore_case;
    return opts;
}

} // namespace sieve
