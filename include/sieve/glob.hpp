#pragma once

#include <sieve/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace sieve {

struct GlobOptions {
    // Simple case folding: ASCII, Latin-1, Latin Extended-A, Greek, Cyrillic
    bool case_insensitive = false;
};

// A compiled glob. The whole path must be consumed for a match.
// Patterns and paths are UTF-8; wildcards and classes work on whole
// characters. Invalid UTF-8 bytes stand for themselves.
// Supports: * (any chars except /), ? (single char except /),
//           ** (any chars including /), [abc], [a-z], [!0-9], [^0-9],
//           and \ to escape the next character.
class GlobPattern {
public:
    static Result<GlobPattern> compile(const std::string& text,
                                       GlobOptions opts = {});

    bool matches(const std::string& path) const;

    // Text as written in the rule (after rule-level rewriting).
    const std::string& text() const { return text_; }

    // Canonical form used for diagnostics and fingerprints; carries a
    // "(?i)" prefix when compiled case-insensitively.
    std::string source() const;

    bool case_insensitive() const { return fold_case_; }

private:
    struct Token {
        enum Kind { Literal, AnyChar, Star, DoubleStar, Class };
        Kind kind = Literal;
        char32_t ch = 0;
        bool negate = false;
        std::vector<std::pair<char32_t, char32_t>> ranges;
    };

    GlobPattern() = default;

    bool token_accepts(const Token& tok, char32_t c) const;

    std::vector<Token> tokens_;
    std::string text_;
    bool fold_case_ = false;
};

// Normalize a path for matching: backslashes become '/', repeated '/'
// collapse, and a leading "./" is dropped. A trailing '/' is kept.
std::string normalize_path(const std::string& p);

} // namespace sieve
