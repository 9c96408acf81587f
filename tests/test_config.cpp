#include <catch2/catch.hpp>
#include <sieve/config.hpp>

using namespace sieve;

// ===== Parsing =====

TEST_CASE("parse config with rules section", "[config]") {
    auto r = Config::parse(R"(
[rules]
file = "conf/ignore.txt"
cache = false
ignore-case = true
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().rules.file == "conf/ignore.txt");
    REQUIRE(r.value().rules.cache == false);
    REQUIRE(r.value().rules.ignore_case == true);
    REQUIRE(r.value().glob_options().case_insensitive);
}

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().logging.level == log::Debug);
    REQUIRE(r.value().logging.color == false);
    REQUIRE(r.value().log_level_set);
}

TEST_CASE("parse empty config keeps defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().rules.file == ".stignore");
    REQUIRE(r.value().rules.cache == true);
    REQUIRE(r.value().rules.ignore_case == false);
    REQUIRE(r.value().logging.level == log::Info);
    REQUIRE_FALSE(r.value().rules_file_set);
}

TEST_CASE("parse ignores unknown keys", "[config]") {
    auto r = Config::parse(R"(
[rules]
file = "x"
colour = "blue"

[other]
a = 1
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().rules.file == "x");
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SieveError::Parse);
}

TEST_CASE("parse rejects wrong value types", "[config]") {
    auto r = Config::parse("[rules]\ncache = \"yes\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SieveError::Config);
    REQUIRE(r.error().message.find("rules.cache") != std::string::npos);
}

TEST_CASE("parse rejects unknown log level", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SieveError::Config);
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("load missing config file", "[config]") {
    auto r = Config::load("/nonexistent_dir_xyz_123/sieve.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SieveError::IO);
}

// ===== Merge =====

TEST_CASE("merge overrides only explicitly set fields", "[config]") {
    auto base = Config::parse(R"(
[rules]
file = "base.txt"
cache = false

[log]
level = "warn"
)").value();

    auto over = Config::parse(R"(
[rules]
ignore-case = true
)").value();

    base.merge(over);
    REQUIRE(base.rules.file == "base.txt");
    REQUIRE(base.rules.cache == false);
    REQUIRE(base.rules.ignore_case == true);
    REQUIRE(base.logging.level == log::Warn);
}

TEST_CASE("merge replaces set values", "[config]") {
    auto base = Config::parse("[rules]\nfile = \"a\"\n").value();
    auto over = Config::parse("[rules]\nfile = \"b\"\n[log]\ncolor = false\n").value();
    base.merge(over);
    REQUIRE(base.rules.file == "b");
    REQUIRE(base.logging.color == false);
    REQUIRE(base.log_color_set);
}

// ===== Layering =====

static Config cli_flags(const std::string& file, bool no_cache) {
    Config flags;
    flags.rules.file = file;
    flags.rules_file_set = true;
    if (no_cache) {
        flags.rules.cache = false;
        flags.rules_cache_set = true;
    }
    return flags;
}

TEST_CASE("effective layers flags over the config file", "[config]") {
    auto file = Config::parse(R"(
[rules]
file = "from-file.txt"
ignore-case = true

[log]
level = "warn"
)").value();

    auto cfg = Config::effective(file, cli_flags("from-flag.txt", true));
    REQUIRE(cfg.rules.file == "from-flag.txt");
    REQUIRE(cfg.rules.cache == false);
    REQUIRE(cfg.rules.ignore_case == true);
    REQUIRE(cfg.logging.level == log::Warn);
}

TEST_CASE("effective keeps file values the flags leave unset", "[config]") {
    auto file = Config::parse("[rules]\nfile = \"kept.txt\"\ncache = false\n").value();

    Config no_flags;
    auto cfg = Config::effective(file, no_flags);
    REQUIRE(cfg.rules.file == "kept.txt");
    REQUIRE(cfg.rules.cache == false);
    REQUIRE(cfg.rules_file_set);
}

TEST_CASE("effective without a config file uses defaults and flags", "[config]") {
    auto cfg = Config::effective(std::nullopt, cli_flags("x.txt", false));
    REQUIRE(cfg.rules.file == "x.txt");
    REQUIRE(cfg.rules.cache == true);
    REQUIRE(cfg.logging.level == log::Info);
    REQUIRE_FALSE(cfg.log_color_set);
}
