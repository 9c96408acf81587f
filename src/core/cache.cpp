#include <sieve/cache.hpp>
#include <sieve/log.hpp>

namespace sieve {

Fingerprint fingerprint_of(const RuleSet& rules) {
    Fingerprint fp;
    fp.reserve(rules.size());
    for (const auto& pred : rules) {
        fp.emplace_back(pred.source(), pred.polarity());
    }
    return fp;
}

// ---- ResultCache ----

std::optional<bool> ResultCache::get(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(path);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void ResultCache::set(const std::string& path, bool result) {
    std::lock_guard<std::mutex> lock(mu_);
    entries_[path] = result;
}

size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

// ---- CacheRegistry ----

std::shared_ptr<ResultCache> CacheRegistry::bind(const std::string& source,
                                                 const Fingerprint& fp) {
    std::lock_guard<std::mutex> lock(mu_);

    auto it = caches_.find(source);
    if (it != caches_.end() && it->second->fingerprint() == fp) {
        log::debug("rules for %s unchanged, reusing cache (%zu entries)",
                   source.c_str(), it->second->size());
        return it->second;
    }

    if (it != caches_.end()) {
        log::debug("rules for %s changed, dropping cache", source.c_str());
    }
    auto fresh = std::make_shared<ResultCache>(fp);
    caches_[source] = fresh;
    return fresh;
}

std::shared_ptr<ResultCache> CacheRegistry::find(const std::string& source) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = caches_.find(source);
    if (it == caches_.end()) return nullptr;
    return it->second;
}

void CacheRegistry::forget(const std::string& source) {
    std::lock_guard<std::mutex> lock(mu_);
    caches_.erase(source);
}

void CacheRegistry::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    caches_.clear();
}

size_t CacheRegistry::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return caches_.size();
}

} // namespace sieve
