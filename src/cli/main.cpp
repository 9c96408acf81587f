// sieve: report which paths a rule file ignores.
//
//     sieve -f .stignore build/out.o src/main.c
//     find . -type f | sieve -f .stignore
//     sieve -f .stignore --patterns
//
// Settings come from sieve.toml (or --config); flags override them.

#include <sieve/config.hpp>
#include <sieve/log.hpp>
#include <sieve/matcher.hpp>
#include <sieve/result.hpp>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace sieve;

namespace {

const char* kDefaultConfig = "sieve.toml";

const char* kUsage =
    "usage: sieve [options] [path...]\n"
    "\n"
    "Reads paths from the arguments, or one per line from stdin.\n"
    "\n"
    "options:\n"
    "  -f, --file <rules>     rule file (default .stignore)\n"
    "  -c, --config <file>    TOML config (default ./sieve.toml if present)\n"
    "  -p, --patterns         print the compiled predicates and exit\n"
    "  -i, --ignore-case      case-insensitive matching\n"
    "      --no-cache         do not memoize results\n"
    "  -q, --quiet            no output; exit 0 if the single path is ignored, 2 if kept\n"
    "  -v, --verbose          debug logging\n"
    "  -h, --help             show this help\n";

struct Options {
    std::optional<std::string> rules_file;
    std::optional<std::string> config_file;
    bool patterns = false;
    bool ignore_case = false;
    bool no_cache = false;
    bool quiet = false;
    bool verbose = false;
    bool help = false;
    std::vector<std::string> paths;
};

Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto need_value = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return SieveError{SieveError::InvalidArg,
                    "option " + flag + " requires a value", "see sieve --help"};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (arg == "-f" || arg == "--file") {
            auto v = need_value(arg);
            if (v.is_err()) return std::move(v).error();
            opts.rules_file = v.value();
        } else if (arg == "-c" || arg == "--config") {
            auto v = need_value(arg);
            if (v.is_err()) return std::move(v).error();
            opts.config_file = v.value();
        } else if (arg == "-p" || arg == "--patterns") {
            opts.patterns = true;
        } else if (arg == "-i" || arg == "--ignore-case") {
            opts.ignore_case = true;
        } else if (arg == "--no-cache") {
            opts.no_cache = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--") {
            for (i++; i < argc; i++) opts.paths.push_back(argv[i]);
        } else if (arg.size() > 1 && arg[0] == '-') {
            return SieveError{SieveError::InvalidArg,
                "unknown option: " + arg, "see sieve --help"};
        } else {
            opts.paths.push_back(arg);
        }
    }

    if (opts.quiet && opts.paths.size() != 1 && !opts.patterns && !opts.help) {
        return SieveError{SieveError::InvalidArg,
            "--quiet takes exactly one path"};
    }
    return Result<Options>::ok(std::move(opts));
}

// Explicit --config must exist; the default one is optional.
Result<std::optional<Config>> load_config(const Options& opts) {
    std::optional<std::string> path = opts.config_file;
    std::error_code ec;
    if (!path && fs::exists(kDefaultConfig, ec)) path = kDefaultConfig;
    if (!path) return Result<std::optional<Config>>::ok(std::nullopt);

    auto cfg = Config::load(*path);
    if (cfg.is_err()) return std::move(cfg).error();
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

// Settings given on the command line, marked as set so they win the merge.
Config flag_config(const Options& opts) {
    Config flags;
    if (opts.rules_file) {
        flags.rules.file = *opts.rules_file;
        flags.rules_file_set = true;
    }
    if (opts.ignore_case) {
        flags.rules.ignore_case = true;
        flags.rules_ignore_case_set = true;
    }
    if (opts.no_cache) {
        flags.rules.cache = false;
        flags.rules_cache_set = true;
    }
    if (opts.verbose) {
        flags.logging.level = log::Debug;
        flags.log_level_set = true;
    }
    return flags;
}

} // namespace

int main(int argc, char** argv) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) {
        std::fprintf(stderr, "%s\n", parsed.error().format().c_str());
        return 1;
    }
    const Options& opts = parsed.value();

    if (opts.help) {
        std::fputs(kUsage, stdout);
        return 0;
    }

    auto cfg_result = load_config(opts);
    if (cfg_result.is_err()) {
        std::fprintf(stderr, "%s\n", cfg_result.error().format().c_str());
        return 1;
    }
    Config cfg = Config::effective(cfg_result.value(), flag_config(opts));

    if (cfg.log_color_set) log::set_color_enabled(cfg.logging.color);
    log::set_level(cfg.logging.level);

    CacheRegistry registry;
    auto loaded = Matcher::load(cfg.rules.file,
                                cfg.rules.cache ? &registry : nullptr,
                                cfg.glob_options());
    if (loaded.is_err()) {
        log::error("failed to load rules from %s", cfg.rules.file.c_str());
        std::fprintf(stderr, "%s\n", loaded.error().format().c_str());
        return 1;
    }
    const Matcher& matcher = loaded.value();

    if (opts.patterns) {
        for (const auto& p : matcher.patterns()) {
            std::printf("%s\n", p.c_str());
        }
        return 0;
    }

    if (opts.quiet) {
        return matcher.match(opts.paths.front()) ? 0 : 2;
    }

    auto report = [&](const std::string& path) {
        std::printf("%s %s\n", matcher.match(path) ? "ignored" : "kept", path.c_str());
    };

    if (!opts.paths.empty()) {
        for (const auto& p : opts.paths) report(p);
    } else {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            report(line);
        }
    }

    if (matcher.cache()) {
        log::debug("cache holds %zu results", matcher.cache()->size());
    }
    return 0;
}
