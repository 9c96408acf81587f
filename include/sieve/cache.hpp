#pragma once

#include <sieve/pattern.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sieve {

// Ordered (canonical text, polarity) pairs identifying a rule set.
using Fingerprint = std::vector<std::pair<std::string, Polarity>>;

Fingerprint fingerprint_of(const RuleSet& rules);

// Memoized match results for one rule set. All access is serialized by a
// single mutex, so a cache may be shared by matchers on many threads.
class ResultCache {
public:
    explicit ResultCache(Fingerprint fp) : fingerprint_(std::move(fp)) {}

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    std::optional<bool> get(const std::string& path) const;
    void set(const std::string& path, bool result);

    size_t size() const;

    const Fingerprint& fingerprint() const { return fingerprint_; }

private:
    const Fingerprint fingerprint_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, bool> entries_;
};

// Current cache per rule source (the canonical rule file path). Reloading a
// source with an unchanged fingerprint hands back the warm cache; any change
// replaces it with an empty one, so a cache only ever holds paths queried
// since the last real rule change.
class CacheRegistry {
public:
    CacheRegistry() = default;

    CacheRegistry(const CacheRegistry&) = delete;
    CacheRegistry& operator=(const CacheRegistry&) = delete;

    std::shared_ptr<ResultCache> bind(const std::string& source,
                                      const Fingerprint& fp);

    // Cache currently registered for `source`, or null.
    std::shared_ptr<ResultCache> find(const std::string& source) const;

    void forget(const std::string& source);
    void clear();
    size_t size() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<ResultCache>> caches_;
};

} // namespace sieve
