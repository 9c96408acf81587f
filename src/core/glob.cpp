#include <sieve/glob.hpp>

namespace sieve {

// ---- UTF-8 ----

// Decode the character at `pos` and advance past it. A byte that does not
// start a well-formed sequence decodes to its own value.
static char32_t decode_utf8(const std::string& s, size_t& pos) {
    auto b0 = static_cast<unsigned char>(s[pos]);
    size_t len = 0;
    char32_t cp = 0;
    if (b0 < 0x80) {
        pos++;
        return b0;
    } else if ((b0 & 0xE0) == 0xC0) {
        len = 2;
        cp = b0 & 0x1F;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3;
        cp = b0 & 0x0F;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4;
        cp = b0 & 0x07;
    } else {
        pos++;
        return b0;
    }

    if (pos + len > s.size()) {
        pos++;
        return b0;
    }
    for (size_t k = 1; k < len; k++) {
        auto b = static_cast<unsigned char>(s[pos + k]);
        if ((b & 0xC0) != 0x80) {
            pos++;
            return b0;
        }
        cp = (cp << 6) | (b & 0x3F);
    }

    // Reject overlong forms and surrogates
    static const char32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_for_len[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        pos++;
        return b0;
    }
    pos += len;
    return cp;
}

static std::vector<char32_t> decode_all(const std::string& s) {
    std::vector<char32_t> out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) out.push_back(decode_utf8(s, pos));
    return out;
}

static std::string encode_utf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

// ---- Case folding ----

static bool in(char32_t c, char32_t lo, char32_t hi) {
    return c >= lo && c <= hi;
}

static char32_t simple_lower(char32_t c) {
    if (in(c, 'A', 'Z')) return c + 0x20;
    if (c < 0xC0) return c;
    if (in(c, 0xC0, 0xDE) && c != 0xD7) return c + 0x20;
    // Latin Extended-A alternates upper/lower, with the parity flipping
    // after U+0138 and U+0149. U+0130/U+0131 (Turkish i) stay unfolded.
    if ((in(c, 0x100, 0x12F) || in(c, 0x132, 0x137) || in(c, 0x14A, 0x177)) && c % 2 == 0) return c + 1;
    if ((in(c, 0x139, 0x148) || in(c, 0x179, 0x17E)) && c % 2 == 1) return c + 1;
    if (c == 0x178) return 0xFF;
    // Greek; final sigma folds with sigma
    if (in(c, 0x391, 0x3AB) && c != 0x3A2) return c + 0x20;
    if (c == 0x3C2) return 0x3C3;
    // Cyrillic
    if (in(c, 0x400, 0x40F)) return c + 0x50;
    if (in(c, 0x410, 0x42F)) return c + 0x20;
    if ((in(c, 0x460, 0x481) || in(c, 0x48A, 0x4BF)) && c % 2 == 0) return c + 1;
    return c;
}

static char32_t simple_upper(char32_t c) {
    if (in(c, 'a', 'z')) return c - 0x20;
    if (c < 0xE0) return c;
    if (in(c, 0xE0, 0xFE) && c != 0xF7) return c - 0x20;
    if (c == 0xFF) return 0x178;
    if ((in(c, 0x101, 0x12F) || in(c, 0x133, 0x137) || in(c, 0x14B, 0x177)) && c % 2 == 1) return c - 1;
    if ((in(c, 0x13A, 0x148) || in(c, 0x17A, 0x17E)) && c % 2 == 0) return c - 1;
    if (in(c, 0x3B1, 0x3CB)) return c == 0x3C2 ? 0x3A3 : c - 0x20;
    if (in(c, 0x430, 0x44F)) return c - 0x20;
    if (in(c, 0x450, 0x45F)) return c - 0x50;
    if ((in(c, 0x461, 0x481) || in(c, 0x48B, 0x4BF)) && c % 2 == 1) return c - 1;
    return c;
}

// ---- Compilation ----

static bool is_control(char32_t c) {
    return c < 0x20 || c == 0x7f;
}

static SieveError pattern_error(const std::string& text, const std::string& what) {
    return SieveError(SieveError::Pattern,
        "invalid glob \"" + text + "\": " + what);
}

// Parse a character class body starting just past '['. On success `pos`
// points past the closing ']'.
static Result<std::vector<std::pair<char32_t, char32_t>>> parse_class(
    const std::string& text, size_t& pos, bool& negate)
{
    std::vector<std::pair<char32_t, char32_t>> ranges;
    negate = false;
    if (pos < text.size() && (text[pos] == '!' || text[pos] == '^')) {
        negate = true;
        pos++;
    }

    bool first = true;
    while (pos < text.size()) {
        if (text[pos] == ']' && !first) {
            pos++;
            return Result<std::vector<std::pair<char32_t, char32_t>>>::ok(std::move(ranges));
        }
        first = false;

        if (text[pos] == '\\') {
            if (pos + 1 >= text.size()) break;
            pos++;
        }
        char32_t lo = decode_utf8(text, pos);
        if (is_control(lo)) {
            return pattern_error(text, "control character in character class");
        }

        char32_t hi = lo;
        // A '-' followed by ']' is a literal dash, not a range.
        if (pos + 1 < text.size() && text[pos] == '-' && text[pos + 1] != ']') {
            pos++;
            if (text[pos] == '\\') {
                if (pos + 1 >= text.size()) break;
                pos++;
            }
            hi = decode_utf8(text, pos);
            if (hi < lo) {
                return pattern_error(text,
                    "reversed range " + encode_utf8(lo) + "-" + encode_utf8(hi));
            }
        }
        ranges.emplace_back(lo, hi);
    }

    return pattern_error(text, "unterminated character class");
}

// ---- GlobPattern ----

Result<GlobPattern> GlobPattern::compile(const std::string& text, GlobOptions opts) {
    GlobPattern glob;
    glob.text_ = text;
    glob.fold_case_ = opts.case_insensitive;

    size_t pos = 0;
    while (pos < text.size()) {
        Token tok;

        switch (text[pos]) {
            case '*':
                pos++;
                tok.kind = Token::Star;
                if (pos < text.size() && text[pos] == '*') {
                    tok.kind = Token::DoubleStar;
                    // Any run of two or more stars is one '**'
                    while (pos < text.size() && text[pos] == '*') pos++;
                }
                break;
            case '?':
                pos++;
                tok.kind = Token::AnyChar;
                break;
            case '[': {
                pos++;
                auto ranges = parse_class(text, pos, tok.negate);
                if (ranges.is_err()) return std::move(ranges).error();
                tok.kind = Token::Class;
                tok.ranges = std::move(ranges).value();
                break;
            }
            case '\\':
                if (pos + 1 >= text.size()) {
                    return pattern_error(text, "trailing backslash");
                }
                pos++;
                tok.ch = decode_utf8(text, pos);
                break;
            default:
                tok.ch = decode_utf8(text, pos);
                break;
        }

        if (tok.kind == Token::Literal && is_control(tok.ch)) {
            return pattern_error(text, "control character in pattern");
        }

        // Collapse adjacent stars of different widths into the wider one.
        if (!glob.tokens_.empty() &&
            (tok.kind == Token::Star || tok.kind == Token::DoubleStar)) {
            auto& prev = glob.tokens_.back();
            if (prev.kind == Token::Star || prev.kind == Token::DoubleStar) {
                if (tok.kind == Token::DoubleStar) prev.kind = Token::DoubleStar;
                continue;
            }
        }
        glob.tokens_.push_back(std::move(tok));
    }

    return Result<GlobPattern>::ok(std::move(glob));
}

bool GlobPattern::token_accepts(const Token& tok, char32_t c) const {
    switch (tok.kind) {
        case Token::Literal:
            return fold_case_ ? simple_lower(tok.ch) == simple_lower(c) : tok.ch == c;
        case Token::AnyChar:
            return c != '/';
        case Token::Class: {
            if (c == '/') return false;
            char32_t lower = fold_case_ ? simple_lower(c) : c;
            char32_t upper = fold_case_ ? simple_upper(c) : c;
            bool hit = false;
            for (const auto& r : tok.ranges) {
                if (in(c, r.first, r.second) || in(lower, r.first, r.second) ||
                    in(upper, r.first, r.second)) {
                    hit = true;
                    break;
                }
            }
            return tok.negate ? !hit : hit;
        }
        case Token::Star:
        case Token::DoubleStar:
            break;
    }
    return false;
}

bool GlobPattern::matches(const std::string& path) const {
    const std::vector<char32_t> chars = decode_all(path);

    // next[j]: tokens after i match chars[j..]; cur[j]: tokens from i match chars[j..]
    const size_t m = chars.size();
    std::vector<char> next(m + 1, 0);
    std::vector<char> cur(m + 1, 0);
    next[m] = 1;

    for (size_t i = tokens_.size(); i-- > 0;) {
        const Token& tok = tokens_[i];
        cur[m] = (tok.kind == Token::Star || tok.kind == Token::DoubleStar) ? next[m] : 0;
        for (size_t j = m; j-- > 0;) {
            char32_t c = chars[j];
            switch (tok.kind) {
                case Token::Star:
                    cur[j] = next[j] || (c != '/' && cur[j + 1]);
                    break;
                case Token::DoubleStar:
                    cur[j] = next[j] || cur[j + 1];
                    break;
                default:
                    cur[j] = token_accepts(tok, c) && next[j + 1];
                    break;
            }
        }
        std::swap(cur, next);
    }

    return next[0] != 0;
}

std::string GlobPattern::source() const {
    if (fold_case_) return "(?i)" + text_;
    return text_;
}

// ---- Paths ----

std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        // Collapse consecutive slashes
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    while (out.size() > 2 && out[0] == '.' && out[1] == '/') {
        out.erase(0, 2);
    }
    return out;
}

} // namespace sieve
