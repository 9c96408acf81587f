#include <sieve/matcher.hpp>
#include <sieve/include_resolver.hpp>
#include <sieve/log.hpp>

namespace sieve {

Matcher::Matcher(RuleSet rules, std::shared_ptr<ResultCache> cache)
    : rules_(std::move(rules)), cache_(std::move(cache)) {}

Result<Matcher> Matcher::load(const std::string& file,
                              CacheRegistry* registry,
                              GlobOptions opts) {
    IncludeResolver resolver(opts);
    auto rules = resolver.load_file(file);
    if (rules.is_err()) return std::move(rules).error();

    Matcher matcher(std::move(rules).value());
    if (registry) {
        matcher.cache_ = registry->bind(IncludeResolver::canonical_id(file),
                                        matcher.fingerprint());
    }
    log::debug("loaded %zu predicates from %s", matcher.size(), file.c_str());
    return Result<Matcher>::ok(std::move(matcher));
}

Result<Matcher> Matcher::parse(std::istream& in, const std::string& name,
                               GlobOptions opts) {
    IncludeResolver resolver(opts);
    auto rules = resolver.load_stream(in, name);
    if (rules.is_err()) return std::move(rules).error();
    return Result<Matcher>::ok(Matcher(std::move(rules).value()));
}

bool Matcher::evaluate(const std::string& path) const {
    for (const auto& pred : rules_) {
        if (pred.matches(path)) {
            return pred.selects();
        }
    }
    return false;
}

bool Matcher::match(const std::string& path) const {
    if (rules_.empty()) return false;

    std::string key = normalize_path(path);
    if (!cache_) return evaluate(key);

    if (auto hit = cache_->get(key)) {
        return *hit;
    }

    bool result = evaluate(key);
    log::trace("match %s -> %s", key.c_str(), result ? "ignored" : "kept");
    cache_->set(key, result);
    return result;
}

std::vector<std::string> Matcher::patterns() const {
    std::vector<std::string> out;
    out.reserve(rules_.size());
    for (const auto& pred : rules_) {
        out.push_back(pred.describe());
    }
    return out;
}

} // namespace sieve
