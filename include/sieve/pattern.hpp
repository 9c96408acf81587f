#pragma once

#include <sieve/glob.hpp>
#include <sieve/result.hpp>
#include <functional>
#include <string>
#include <vector>

namespace sieve {

enum class Polarity {
    Select,     // a match means the path is ignored
    Deselect    // a match means the path is explicitly kept ("!pattern")
};

// One compiled path test plus its polarity. Immutable.
class Predicate {
public:
    Predicate(GlobPattern glob, Polarity polarity)
        : glob_(std::move(glob)), polarity_(polarity) {}

    bool matches(const std::string& path) const { return glob_.matches(path); }

    Polarity polarity() const { return polarity_; }
    bool selects() const { return polarity_ == Polarity::Select; }

    // Canonical text of the compiled glob.
    std::string source() const { return glob_.source(); }

    // source(), prefixed with "(?exclude)" for Deselect predicates.
    std::string describe() const;

private:
    GlobPattern glob_;
    Polarity polarity_;
};

// Ordered predicate list; the first predicate that matches decides.
using RuleSet = std::vector<Predicate>;

// Produces the predicates of an "#include <target>" directive. The target is
// the raw text after the directive, still relative to the including file.
using IncludeHandler = std::function<Result<RuleSet>(const std::string& target)>;

class PatternCompiler {
public:
    explicit PatternCompiler(GlobOptions opts = {}) : opts_(opts) {}

    void set_include_handler(IncludeHandler handler) { include_ = std::move(handler); }

    // Compile one preprocessed rule variant, appending its predicates to
    // `out`. Forms, first match wins:
    //   !text        -> deselect polarity, continue with text
    //   /text        -> root anchored, one predicate
    //   **/text      -> as given, plus text without the leading **/
    //   #include f   -> splice the predicates of f
    //   text         -> as given, plus **/text
    Status compile(const std::string& text, RuleSet& out) const;

    // Expand one trimmed rule line into its variants, then compile each.
    Status compile_line(const std::string& line, RuleSet& out) const;

    // Line preprocessing:
    //   "dir/**" -> itself
    //   "dir/"   -> "dir/", "dir/**"
    //   "#..."   -> itself
    //   "name"   -> "name", "name/**"
    static std::vector<std::string> expand_line(const std::string& line);

    static constexpr const char* kIncludeDirective = "#include ";

private:
    Status add(const std::string& glob_text, Polarity polarity,
               const std::string& rule, RuleSet& out) const;

    GlobOptions opts_;
    IncludeHandler include_;
};

} // namespace sieve
