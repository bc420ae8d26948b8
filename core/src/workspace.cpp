#include "kyotee/workspace.h"
#include "kyotee/proc.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace kyotee {

static std::string dir_key(const fs::path& p) {
    std::string s = fs::absolute(p).lexically_normal().string();
    if (s.empty() || s.back() != '/') s.push_back('/');
    return s;
}

GitWorkspace::GitWorkspace(std::string repo_root, std::vector<std::string> excluded_dirs)
    : repo_root_(std::move(repo_root)) {
    for (const auto& d : excluded_dirs) {
        if (!d.empty()) excluded_dirs_.push_back(dir_key(d));
    }
}

static bool git(const std::string& root, const std::vector<std::string>& args, ProcResult* res) {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());
    ProcLimits lim;
    lim.timeout_ms = 60000;
    return proc_run_capture(argv, root, "", lim, res) && !res->timed_out && res->exit_code == 0;
}

static std::string git_failure(const std::string& what, const ProcResult& r) {
    std::string msg = what + " failed (is this a git repo?)";
    if (!r.error.empty()) return msg + ": " + r.error;
    if (r.timed_out) return msg + ": timed out";
    msg += ": exit " + std::to_string(r.exit_code);
    std::string out = r.output;
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
    if (!out.empty()) msg += ": " + out;
    return msg;
}

std::vector<std::string> parse_porcelain_z(const std::string& output) {
    std::vector<std::string> paths;
    size_t pos = 0;
    while (pos < output.size()) {
        size_t end = output.find('\0', pos);
        if (end == std::string::npos) end = output.size();
        std::string rec = output.substr(pos, end - pos);
        pos = end + 1;
        // "XY path"
        if (rec.size() < 4 || rec[2] != ' ') continue;
        const char x = rec[0];
        paths.push_back(rec.substr(3));
        if (x == 'R' || x == 'C') {
            // the source path follows as its own NUL-terminated field
            end = output.find('\0', pos);
            if (end == std::string::npos) end = output.size();
            if (end > pos) paths.push_back(output.substr(pos, end - pos));
            pos = end + 1;
        }
    }
    return paths;
}

bool GitWorkspace::excluded(const std::string& abs_path) const {
    for (const auto& d : excluded_dirs_) {
        if (abs_path.compare(0, d.size(), d) == 0) return true;
    }
    return false;
}

bool GitWorkspace::changed_files(std::vector<std::string>* out, std::string* err) {
    out->clear();

    // porcelain paths are relative to the top level, which may sit above repo_root_
    ProcResult pr;
    if (!git(repo_root_, {"rev-parse", "--show-prefix"}, &pr)) {
        if (err) *err = git_failure("git rev-parse", pr);
        return false;
    }
    std::string prefix = pr.output;
    while (!prefix.empty() && (prefix.back() == '\n' || prefix.back() == '\r' || prefix.back() == '/')) {
        prefix.pop_back();
    }

    // stderr is discarded so warnings cannot corrupt the NUL-separated records
    ProcResult r;
    ProcLimits lim;
    lim.timeout_ms = 60000;
    const bool started = proc_run_shell("git status --porcelain=v1 -z --untracked-files=all 2>/dev/null",
                                        repo_root_, lim, &r);
    if (!started || r.timed_out || r.exit_code != 0) {
        if (err) *err = git_failure("git status", r);
        return false;
    }

    const fs::path root(repo_root_);
    for (const auto& rel : parse_porcelain_z(r.output)) {
        fs::path p(rel);
        if (!prefix.empty()) p = p.lexically_relative(fs::path(prefix));
        const fs::path abs = (root / p).lexically_normal();
        if (excluded(fs::absolute(abs).string())) continue;
        out->push_back(abs.string());
    }
    return true;
}

std::string GitWorkspace::diff() {
    std::string text;
    ProcResult r;
    if (git(repo_root_, {"diff"}, &r)) text = r.output;

    ProcResult staged;
    if (git(repo_root_, {"diff", "--cached"}, &staged) && !staged.output.empty()) {
        if (!text.empty() && text.back() != '\n') text += "\n";
        text += "=== Staged changes ===\n" + staged.output;
    }
    return text;
}

} // namespace kyotee
