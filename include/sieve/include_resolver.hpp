#pragma once

#include <sieve/pattern.hpp>
#include <sieve/result.hpp>
#include <istream>
#include <string>
#include <unordered_set>

namespace sieve {

// Loads rule files for one construction, following "#include" directives.
// Every file touched during the load is remembered; reaching one again, by a
// cycle or by a second include of the same file, fails with SieveError::Cycle.
// One resolver serves exactly one load.
class IncludeResolver {
public:
    explicit IncludeResolver(GlobOptions opts = {});

    IncludeResolver(const IncludeResolver&) = delete;
    IncludeResolver& operator=(const IncludeResolver&) = delete;

    // Open `file`, mark it seen, and compile its rules.
    Result<RuleSet> load_file(const std::string& file);

    // Compile rules from an already open stream. `name` is the logical file
    // name: includes resolve against its directory and it counts as seen.
    Result<RuleSet> load_stream(std::istream& in, const std::string& name);

    // Resolve an include target relative to the including file and load it.
    Result<RuleSet> resolve(const std::string& target, const std::string& including_file);

    // Canonical identifier of a rule file, used for the seen set and as the
    // cache registry key.
    static std::string canonical_id(const std::string& file);

    const std::unordered_set<std::string>& seen() const { return seen_; }

private:
    Result<RuleSet> parse(std::istream& in, const std::string& current_file);

    GlobOptions opts_;
    std::unordered_set<std::string> seen_;
    int depth_ = 0;
};

} // namespace sieve
