#pragma once

#include <string>
#include <vector>

namespace kyotee {

// Read-only view of the repository being modified by the worker.
class IWorkspace {
public:
    virtual ~IWorkspace() = default;
    // Absolute paths of files modified, staged, deleted or untracked.
    virtual bool changed_files(std::vector<std::string>* out, std::string* err) = 0;
    // Textual working-tree modification, empty when there is none.
    virtual std::string diff() = 0;
};

// git CLI backed workspace. Never mutates the repository.
// Paths under an excluded directory (e.g. the orchestrator's own run
// directory) are not reported as changes.
class GitWorkspace final : public IWorkspace {
public:
    explicit GitWorkspace(std::string repo_root, std::vector<std::string> excluded_dirs = {});
    bool changed_files(std::vector<std::string>* out, std::string* err) override;
    std::string diff() override;

private:
    bool excluded(const std::string& abs_path) const;

    std::string repo_root_;
    std::vector<std::string> excluded_dirs_; // absolute, normalized, trailing '/'
};

// Paths named by `git status --porcelain=v1 -z` output, relative to the
// top-level directory. Renames and copies yield both the new and the old path.
std::vector<std::string> parse_porcelain_z(const std::string& output);

} // namespace kyotee
