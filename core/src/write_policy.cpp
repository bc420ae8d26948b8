#include "kyotee/write_policy.h"

#include <algorithm>
#include <filesystem>

namespace kyotee {

namespace fs = std::filesystem;

std::string normalize_prefix(const std::string& prefix) {
    std::string out = prefix;
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

std::optional<std::string> relative_to_root(const std::string& repo_root, const std::string& path) {
    fs::path root = fs::absolute(fs::path(repo_root)).lexically_normal();
    fs::path p = fs::path(normalize_prefix(path));
    if (!p.is_absolute()) p = root / p;
    p = p.lexically_normal();

    fs::path rel = p.lexically_relative(root);
    if (rel.empty()) return std::nullopt;
    std::string s = rel.generic_string();
    if (s == ".." || s.rfind("../", 0) == 0) return std::nullopt;
    return s;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::optional<std::string> check_write_policy(const WritePolicy& pol,
                                              const std::string& repo_root,
                                              const std::vector<std::string>& changed_paths) {
    std::vector<std::string> allowed, forbidden;
    for (const auto& a : pol.allowed_prefixes) allowed.push_back(normalize_prefix(a));
    for (const auto& f : pol.forbidden_prefixes) forbidden.push_back(normalize_prefix(f));

    for (const auto& path : changed_paths) {
        auto rel = relative_to_root(repo_root, path);
        if (!rel) {
            return "path outside repository root: " + path;
        }
        for (const auto& f : forbidden) {
            if (starts_with(*rel, f)) {
                return "write to forbidden path: " + *rel + " (prefix '" + f + "')";
            }
        }
        if (!allowed.empty()) {
            bool ok = std::any_of(allowed.begin(), allowed.end(),
                                  [&](const std::string& a) { return starts_with(*rel, a); });
            if (!ok) return "write outside allowed paths: " + *rel;
        }
    }
    return std::nullopt;
}

} // namespace kyotee
