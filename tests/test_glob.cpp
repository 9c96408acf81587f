#include <catch2/catch.hpp>
#include <sieve/glob.hpp>

using namespace sieve;

static bool gm(const std::string& pattern, const std::string& path,
               GlobOptions opts = {}) {
    auto g = GlobPattern::compile(pattern, opts);
    REQUIRE(g.is_ok());
    return g.value().matches(path);
}

// ---- Literal matching ----

TEST_CASE("glob literal exact match", "[glob]") {
    REQUIRE(gm("foo/bar.c", "foo/bar.c"));
    REQUIRE_FALSE(gm("foo/bar.c", "foo/baz.c"));
}

TEST_CASE("glob literal must consume whole path", "[glob]") {
    REQUIRE_FALSE(gm("foo", "foo/bar"));
    REQUIRE_FALSE(gm("foo", "xfoo"));
    REQUIRE_FALSE(gm("foo/", "foo"));
}

TEST_CASE("glob literal case sensitivity", "[glob]") {
    REQUIRE_FALSE(gm("Foo.c", "foo.c"));
}

// ---- Wildcards ----

TEST_CASE("glob star matches within one segment", "[glob]") {
    REQUIRE(gm("src/*.o", "src/main.o"));
    REQUIRE_FALSE(gm("src/*.o", "src/sub/main.o"));
    REQUIRE(gm("src/*.o", "src/.o"));
}

TEST_CASE("glob question mark single char", "[glob]") {
    REQUIRE(gm("file?.txt", "file1.txt"));
    REQUIRE_FALSE(gm("file?.txt", "file12.txt"));
    REQUIRE_FALSE(gm("a?b", "a/b"));
}

// ---- Double-star ----

TEST_CASE("glob doublestar crosses separators", "[glob]") {
    REQUIRE(gm("**/*.o", "a/b/c/d.o"));
    REQUIRE(gm("**", "a/b/c"));
    REQUIRE(gm("**", ""));
}

TEST_CASE("glob doublestar prefix needs a separator", "[glob]") {
    REQUIRE(gm("**/foo", "a/b/foo"));
    REQUIRE(gm("**/foo", "/foo"));
    REQUIRE_FALSE(gm("**/foo", "foo"));
}

TEST_CASE("glob doublestar suffix needs a child", "[glob]") {
    REQUIRE(gm("out/**", "out/a.txt"));
    REQUIRE(gm("out/**", "out/a/b/c.txt"));
    REQUIRE(gm("out/**", "out/"));
    REQUIRE_FALSE(gm("out/**", "out"));
}

TEST_CASE("glob doublestar in middle", "[glob]") {
    REQUIRE(gm("src/**/test.c", "src/a/b/test.c"));
    REQUIRE_FALSE(gm("src/**/test.c", "src/test.c"));
}

TEST_CASE("glob runs of stars collapse", "[glob]") {
    REQUIRE(gm("***", "a/b"));
    REQUIRE(gm("a*" "**", "a/b/c"));
}

// ---- Character classes ----

TEST_CASE("glob char class set and range", "[glob]") {
    REQUIRE(gm("[abc].c", "a.c"));
    REQUIRE_FALSE(gm("[abc].c", "d.c"));
    REQUIRE(gm("[a-z].c", "m.c"));
    REQUIRE_FALSE(gm("[a-z].c", "M.c"));
}

TEST_CASE("glob char class negation", "[glob]") {
    REQUIRE(gm("[!0-9].c", "a.c"));
    REQUIRE_FALSE(gm("[!0-9].c", "5.c"));
    REQUIRE(gm("[^0-9].c", "a.c"));
    REQUIRE_FALSE(gm("[^0-9].c", "5.c"));
}

TEST_CASE("glob char class literal bracket and dash", "[glob]") {
    REQUIRE(gm("[]a]", "]"));
    REQUIRE(gm("[a-]", "-"));
    REQUIRE_FALSE(gm("[a-]", "b"));
}

TEST_CASE("glob char class never matches separator", "[glob]") {
    REQUIRE_FALSE(gm("a[/]b", "a/b"));
    REQUIRE_FALSE(gm("a[!x]b", "a/b"));
}

// ---- Escapes ----

TEST_CASE("glob backslash escapes wildcards", "[glob]") {
    REQUIRE(gm("a\\*b", "a*b"));
    REQUIRE_FALSE(gm("a\\*b", "axb"));
    REQUIRE(gm("\\[x]", "[x]"));
}

// ---- Case folding ----

TEST_CASE("glob case-insensitive option", "[glob]") {
    GlobOptions opts;
    opts.case_insensitive = true;
    REQUIRE(gm("*.LOG", "debug.log", opts));
    REQUIRE(gm("[A-Z]x", "qx", opts));
    REQUIRE(gm("[a-z]x", "QX", opts));

    auto g = GlobPattern::compile("*.LOG", opts);
    REQUIRE(g.value().source() == "(?i)*.LOG");
    REQUIRE(g.value().text() == "*.LOG");
}

TEST_CASE("glob source of case-sensitive pattern is its text", "[glob]") {
    auto g = GlobPattern::compile("**/build");
    REQUIRE(g.is_ok());
    REQUIRE(g.value().source() == "**/build");
    REQUIRE_FALSE(g.value().case_insensitive());
}

// ---- Errors ----

TEST_CASE("glob rejects malformed patterns", "[glob]") {
    for (const char* bad : {"[abc", "[!", "[]", "[z-a]", "abc\\", "a\tb", "x\x7f"}) {
        auto g = GlobPattern::compile(bad);
        INFO(bad);
        REQUIRE(g.is_err());
        REQUIRE(g.error().code == SieveError::Pattern);
    }
}

// ---- Paths ----

TEST_CASE("normalize_path", "[glob]") {
    REQUIRE(normalize_path("a\\b//c") == "a/b/c");
    REQUIRE(normalize_path("./a/b") == "a/b");
    REQUIRE(normalize_path("out/") == "out/");
    REQUIRE(normalize_path("build") == "build");
}

// ---- UTF-8 ----

TEST_CASE("glob question mark consumes a whole UTF-8 character", "[glob]") {
    REQUIRE(gm("?.txt", "a.txt"));
    REQUIRE(gm("?.txt", "\xC3\xA9.txt"));            // é
    REQUIRE(gm("?", "\xE2\x82\xAC"));                // €
    REQUIRE(gm("?", "\xF0\x9F\x93\x81"));            // 📁
    REQUIRE_FALSE(gm("??.txt", "\xC3\xA9.txt"));
}

TEST_CASE("glob char class holds multi-byte members", "[glob]") {
    REQUIRE(gm("[\xC3\xA9" "a]bc", "\xC3\xA9" "bc"));   // [éa]bc vs ébc
    REQUIRE(gm("[\xC3\xA9" "a]bc", "abc"));
    REQUIRE_FALSE(gm("[\xC3\xA9" "a]bc", "\xC3\xA8" "bc")); // è
    REQUIRE(gm("[!\xC3\xA9]x", "\xC3\xA8x"));
    REQUIRE_FALSE(gm("[!\xC3\xA9]x", "\xC3\xA9x"));
}

TEST_CASE("glob char class ranges over code points", "[glob]") {
    // [а-я] (Cyrillic)
    REQUIRE(gm("[\xD0\xB0-\xD1\x8F]", "\xD0\xB6"));       // ж
    REQUIRE_FALSE(gm("[\xD0\xB0-\xD1\x8F]", "z"));
    auto g = GlobPattern::compile("[\xD1\x8F-\xD0\xB0]");  // [я-а]
    REQUIRE(g.is_err());
    REQUIRE(g.error().code == SieveError::Pattern);
}

TEST_CASE("glob star spans multi-byte characters", "[glob]") {
    REQUIRE(gm("caf*", "caf\xC3\xA9"));
    REQUIRE(gm("*\xC3\xA9", "r\xC3\xA9sum\xC3\xA9"));
    REQUIRE_FALSE(gm("caf*", "caf\xC3\xA9/x"));
}

TEST_CASE("glob case-insensitive folds non-ASCII letters", "[glob]") {
    GlobOptions opts;
    opts.case_insensitive = true;
    REQUIRE(gm("\xC3\x89" "a", "\xC3\xA9" "a", opts));          // Éa vs éa
    REQUIRE(gm("\xC3\xA9" "A", "\xC3\x89" "a", opts));          // éA vs Éa
    REQUIRE(gm("\xD0\x9F\xD0\xB0\xD0\xBF\xD0\xBA\xD0\xB0",      // Папка
               "\xD0\xBF\xD0\xB0\xD0\xBF\xD0\xBA\xD0\xB0", opts)); // папка
    REQUIRE(gm("\xCE\xA3", "\xCF\x82", opts));                  // Σ vs ς
    REQUIRE(gm("[\xC3\xA0-\xC3\xBE]", "\xC3\x89", opts));       // [à-þ] vs É
    REQUIRE(gm("\xC5\x81", "\xC5\x82", opts));                  // Ł vs ł

    REQUIRE_FALSE(gm("\xC3\x89" "a", "\xC3\xA9" "a"));
}

TEST_CASE("glob treats invalid UTF-8 bytes as single characters", "[glob]") {
    REQUIRE(gm("?", "\xFF"));
    REQUIRE(gm("a?b", "a\xC3" "b"));       // truncated sequence
    REQUIRE(gm("\xFF*", "\xFF\xFE"));
}
