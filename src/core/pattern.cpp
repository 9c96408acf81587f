#include <sieve/pattern.hpp>

namespace sieve {

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string Predicate::describe() const {
    if (selects()) return source();
    return "(?exclude)" + source();
}

std::vector<std::string> PatternCompiler::expand_line(const std::string& line) {
    if (starts_with(line, "#")) return {line};
    if (ends_with(line, "/**")) return {line};
    if (ends_with(line, "/")) return {line, line + "**"};
    return {line, line + "/**"};
}

Status PatternCompiler::add(const std::string& glob_text, Polarity polarity,
                            const std::string& rule, RuleSet& out) const {
    auto glob = GlobPattern::compile(glob_text, opts_);
    if (glob.is_err()) {
        return SieveError(SieveError::Pattern,
            "invalid pattern \"" + rule + "\" in ignore file",
            glob.error().message);
    }
    out.emplace_back(std::move(glob).value(), polarity);
    return ok_status();
}

Status PatternCompiler::compile(const std::string& text, RuleSet& out) const {
    std::string rule = text;
    Polarity polarity = Polarity::Select;
    if (starts_with(rule, "!")) {
        rule.erase(0, 1);
        polarity = Polarity::Deselect;
    }

    if (starts_with(rule, "/")) {
        return add(rule.substr(1), polarity, text, out);
    }

    if (starts_with(rule, "**/")) {
        SIEVE_TRY(add(rule, polarity, text, out));
        return add(rule.substr(3), polarity, text, out);
    }

    if (starts_with(rule, kIncludeDirective)) {
        std::string target = rule.substr(std::string(kIncludeDirective).size());
        if (!include_) {
            return SieveError(SieveError::IO,
                "cannot include \"" + target + "\": no include resolver",
                "parse rules through IncludeResolver to use #include");
        }
        auto included = include_(target);
        if (included.is_err()) return std::move(included).error();
        for (auto& pred : included.value()) {
            out.push_back(std::move(pred));
        }
        return ok_status();
    }

    SIEVE_TRY(add(rule, polarity, text, out));
    return add("**/" + rule, polarity, text, out);
}

Status PatternCompiler::compile_line(const std::string& line, RuleSet& out) const {
    for (const auto& variant : expand_line(line)) {
        SIEVE_TRY(compile(variant, out));
    }
    return ok_status();
}

} // namespace sieve
