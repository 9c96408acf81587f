#pragma once

#include <sieve/glob.hpp>
#include <sieve/log.hpp>
#include <sieve/result.hpp>
#include <optional>
#include <string>

namespace sieve {

struct RulesConfig {
    std::string file = ".stignore";
    bool cache = true;
    bool ignore_case = false;
};

struct LogConfig {
    log::Level level = log::Info;
    bool color = true;
};

// Settings from a sieve.toml file:
//
//   [rules]
//   file = ".stignore"
//   cache = true
//   ignore-case = false
//
//   [log]
//   level = "info"
//   color = true
struct Config {
    RulesConfig rules;
    LogConfig logging;
    // Track which fields were explicitly set (for merge)
    bool rules_file_set = false;
    bool rules_cache_set = false;
    bool rules_ignore_case_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // Layer command-line settings over an optional config file:
    // defaults -> file -> flags
    static Config effective(const std::optional<Config>& file,
                            const Config& flags);

    GlobOptions glob_options() const;
};

} // namespace sieve
