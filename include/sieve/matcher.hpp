#pragma once

#include <sieve/cache.hpp>
#include <sieve/glob.hpp>
#include <sieve/pattern.hpp>
#include <sieve/result.hpp>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace sieve {

// Evaluates paths against an ordered rule set. The first predicate that
// matches decides the result, so "!keep.log" only overrides "*.log" when it
// comes earlier in the expanded rule list. A path no predicate matches is
// not ignored.
//
// match() is safe to call from many threads once construction is done.
class Matcher {
public:
    Matcher() = default;
    explicit Matcher(RuleSet rules, std::shared_ptr<ResultCache> cache = nullptr);

    // Load rules from a file, following includes. With a registry, the
    // matcher is bound to the registry's cache for this file, reusing it
    // when the compiled rules did not change since the last load.
    static Result<Matcher> load(const std::string& file,
                                CacheRegistry* registry = nullptr,
                                GlobOptions opts = {});

    // Load rules from an open stream. `name` anchors relative includes and
    // counts as already loaded, so the stream cannot include itself.
    static Result<Matcher> parse(std::istream& in, const std::string& name,
                                 GlobOptions opts = {});

    bool match(const std::string& path) const;

    // One line per predicate in evaluation order; deselecting predicates
    // carry an "(?exclude)" prefix.
    std::vector<std::string> patterns() const;

    Fingerprint fingerprint() const { return fingerprint_of(rules_); }

    const RuleSet& predicates() const { return rules_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

    const std::shared_ptr<ResultCache>& cache() const { return cache_; }

private:
    bool evaluate(const std::string& path) const;

    RuleSet rules_;
    std::shared_ptr<ResultCache> cache_;
};

} // namespace sieve
