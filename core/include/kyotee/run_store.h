#pragma once

#include <string>

namespace kyotee {

// Owns one run directory. Every artifact is written create-if-absent:
// an existing file is never overwritten.
class RunStore {
public:
    RunStore() = default;

    // Create <runs_base>/<id>. id is pinned_id when non-empty, otherwise a
    // local timestamp YYYYmmdd-HHMMSS; a "-2", "-3", ... suffix is appended
    // while the directory already exists.
    static bool create(const std::string& runs_base, const std::string& pinned_id,
                       RunStore* out, std::string* err);

    const std::string& dir() const { return dir_; }
    const std::string& id() const { return id_; }

    // "<phase>/iter_<n>"
    static std::string iter_rel(const std::string& phase_id, int iteration);

    std::string abs(const std::string& rel) const;

    // Write rel (relative to the run dir), creating parent directories.
    // Fails if the file already exists.
    bool write_new(const std::string& rel, const std::string& content, std::string* err) const;

    // Copy an input file into the run dir under rel.
    bool copy_in(const std::string& src, const std::string& rel, std::string* err) const;

private:
    std::string dir_;
    std::string id_;
};

} // namespace kyotee
