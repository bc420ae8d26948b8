#pragma once

#include <optional>
#include <string>
#include <vector>

namespace kyotee {

struct WritePolicy {
    bool allow_file_writes{true};
    std::vector<std::string> allowed_prefixes;   // empty = no allow-list
    std::vector<std::string> forbidden_prefixes; // checked first
};

// "src\\a/" -> "src/a/"
std::string normalize_prefix(const std::string& prefix);

// Path relative to repo_root with forward slashes ("src/main.cpp").
// Returns nullopt when the path lies outside repo_root.
std::optional<std::string> relative_to_root(const std::string& repo_root, const std::string& path);

// Check every changed path against the policy. Returns the first violation
// message, or nullopt when all paths are permitted.
std::optional<std::string> check_write_policy(const WritePolicy& pol,
                                              const std::string& repo_root,
                                              const std::vector<std::string>& changed_paths);

} // namespace kyotee
