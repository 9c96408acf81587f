#include <sieve/include_resolver.hpp>
#include <sieve/log.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace sieve {

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

IncludeResolver::IncludeResolver(GlobOptions opts)
    : opts_(opts) {}

std::string IncludeResolver::canonical_id(const std::string& file) {
    std::error_code ec;
    auto canon = fs::weakly_canonical(fs::path(file), ec);
    if (ec) {
        return fs::path(file).lexically_normal().generic_string();
    }
    return canon.generic_string();
}

Result<RuleSet> IncludeResolver::load_file(const std::string& file) {
    std::string id = canonical_id(file);
    if (!seen_.insert(id).second) {
        return SieveError(SieveError::Cycle,
            "multiple include of ignore file \"" + file + "\"",
            "a rule file may be reached only once per load");
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        return SieveError(SieveError::IO,
            "cannot open ignore file: " + file);
    }

    log::debug("loading rules from %s", file.c_str());
    return parse(in, file);
}

Result<RuleSet> IncludeResolver::load_stream(std::istream& in, const std::string& name) {
    seen_.insert(canonical_id(name));
    return parse(in, name);
}

Result<RuleSet> IncludeResolver::resolve(const std::string& target,
                                         const std::string& including_file) {
    fs::path base = fs::path(including_file).parent_path();
    fs::path full = fs::path(target).is_absolute() ? fs::path(target) : base / target;
    log::debug("%s includes %s", including_file.c_str(), full.generic_string().c_str());
    return load_file(full.generic_string());
}

Result<RuleSet> IncludeResolver::parse(std::istream& in, const std::string& current_file) {
    PatternCompiler compiler(opts_);
    compiler.set_include_handler([this, &current_file](const std::string& target) {
        depth_++;
        auto rules = resolve(target, current_file);
        depth_--;
        return rules;
    });

    RuleSet rules;
    std::string raw;
    int lineno = 0;
    while (std::getline(in, raw)) {
        lineno++;
        std::string line = trim(raw);
        if (line.empty()) continue;
        if (line.compare(0, 2, "//") == 0) continue;

        auto st = compiler.compile_line(line, rules);
        if (st.is_err()) {
            auto err = std::move(st).error();
            // Keep the location of the innermost failing file.
            if (err.file.empty()) {
                err.file = current_file;
                err.line = lineno;
            }
            return err;
        }
    }

    if (in.bad()) {
        return SieveError(SieveError::IO,
            "error reading ignore file: " + current_file);
    }

    log::debug("%s: %zu predicates (include depth %d)",
               current_file.c_str(), rules.size(), depth_);
    return Result<RuleSet>::ok(std::move(rules));
}

} // namespace sieve
