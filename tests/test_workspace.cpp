#include "test_common.h"

#include "kyotee/proc.h"
#include "kyotee/workspace.h"
#include "kyotee/write_policy.h"

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace fs = std::filesystem;
using kyotee::GitWorkspace;

static void sh(const fs::path& cwd, const std::string& cmd) {
    kyotee::ProcResult r;
    if (!kyotee::proc_run_shell(cmd, cwd.string(), kyotee::ProcLimits{30000, 0}, &r) || r.exit_code != 0) {
        die("'" + cmd + "' failed (exit " + std::to_string(r.exit_code) + "): " + r.output + r.error);
    }
}

static bool has(const std::vector<std::string>& v, const fs::path& p) {
    return std::find(v.begin(), v.end(), p.lexically_normal().string()) != v.end();
}

static std::string joined(const std::vector<std::string>& v) {
    std::string s;
    for (const auto& x : v) s += x + "\n";
    return s;
}

int main() {
    auto dir = fresh_dir("workspace");
    // keep git from finding a repository above the temp dir or reading user config
    setenv("GIT_CEILING_DIRECTORIES", dir.string().c_str(), 1);
    setenv("GIT_CONFIG_NOSYSTEM", "1", 1);
    setenv("GIT_CONFIG_GLOBAL", "/dev/null", 1);
    setenv("GIT_AUTHOR_NAME", "kyotee", 1);
    setenv("GIT_AUTHOR_EMAIL", "kyotee@example.com", 1);
    setenv("GIT_COMMITTER_NAME", "kyotee", 1);
    setenv("GIT_COMMITTER_EMAIL", "kyotee@example.com", 1);

    const fs::path repo = dir / "repo";
    const std::string umlaut = "secrets/\xc3\xa4.txt";
    const std::string cafe = "notes/caf\xc3\xa9.md";

    write_file(repo / "tracked.txt", "one\n");
    write_file(repo / "staged.txt", "one\n");
    write_file(repo / "old_name.txt", "rename me\n");
    sh(repo, "git init -q . && git add -A && git -c commit.gpgsign=false commit -q -m init");

    GitWorkspace ws(repo.string(), {(repo / "agent" / "runs").string()});

    // clean tree
    {
        std::vector<std::string> files;
        std::string err;
        expect_true(ws.changed_files(&files, &err), "clean tree: " + err);
        expect_true(files.empty(), "clean tree reports nothing: " + joined(files));
        expect_eq_str(ws.diff(), "", "clean tree has no diff");
    }

    write_file(repo / "tracked.txt", "one\ntwo\n");
    write_file(repo / "staged.txt", "one\nstaged\n");
    sh(repo, "git add staged.txt && git mv old_name.txt new_name.txt");
    write_file(repo / "untracked" / "deep" / "u.txt", "new\n");
    write_file(repo / umlaut, "secret\n");
    sh(repo, "git add '" + umlaut + "'");
    write_file(repo / cafe, "untracked, non-ascii\n");
    write_file(repo / "agent" / "runs" / "r1" / "events.jsonl", "{}\n");

    // modified, staged, renamed, untracked and non-ASCII paths all surface
    std::vector<std::string> files;
    {
        std::string err;
        expect_true(ws.changed_files(&files, &err), "changed_files: " + err);
        const std::string all = joined(files);
        expect_true(has(files, repo / "tracked.txt"), "unstaged modification: " + all);
        expect_true(has(files, repo / "staged.txt"), "staged modification: " + all);
        expect_true(has(files, repo / "new_name.txt"), "rename target: " + all);
        expect_true(has(files, repo / "old_name.txt"), "rename source: " + all);
        expect_true(has(files, repo / "untracked" / "deep" / "u.txt"), "untracked file in a new dir: " + all);
        expect_true(has(files, repo / umlaut), "staged non-ASCII path: " + all);
        expect_true(has(files, repo / cafe), "untracked non-ASCII path: " + all);
        expect_true(!contains(all, "agent/runs"), "excluded run dir must not be reported: " + all);
        expect_eq_ll((long long)files.size(), 7, "exact change count");
    }

    // the forbidden-prefix check sees the non-ASCII path unquoted
    {
        kyotee::WritePolicy p;
        p.forbidden_prefixes = {"secrets/"};
        auto v = kyotee::check_write_policy(p, repo.string(), files);
        expect_true(v.has_value(), "write under secrets/ must be a violation");
        expect_true(contains(*v, "secrets/"), "violation names the path: " + *v);

        kyotee::WritePolicy ok;
        ok.forbidden_prefixes = {".git/"};
        expect_true(!kyotee::check_write_policy(ok, repo.string(), files).has_value(), "nothing under .git/");
    }

    // rooted below the top level: paths stay absolute and correct
    {
        GitWorkspace sub((repo / "untracked").string());
        std::vector<std::string> sub_files;
        std::string err;
        expect_true(sub.changed_files(&sub_files, &err), "subdir root: " + err);
        expect_true(has(sub_files, repo / "untracked" / "deep" / "u.txt"), "file under subdir root");
        expect_true(has(sub_files, repo / "tracked.txt"), "file above subdir root");
        expect_true(has(sub_files, repo / "agent" / "runs" / "r1" / "events.jsonl"), "no exclusions configured");
    }

    // diff text carries both the working tree and the index
    {
        const std::string d = ws.diff();
        expect_true(contains(d, "tracked.txt") && contains(d, "+two"), "working-tree diff: " + d);
        expect_true(contains(d, "=== Staged changes ==="), "staged section header");
        const std::string staged = d.substr(d.find("=== Staged changes ==="));
        expect_true(contains(staged, "+staged"), "staged hunk under the header");
        expect_true(contains(staged, "new_name.txt"), "staged rename under the header");
    }

    // a directory that is not a git repository is an error, not an empty change set
    {
        const fs::path plain = dir / "plain";
        write_file(plain / "f.txt", "x\n");
        GitWorkspace none(plain.string());
        std::vector<std::string> none_files{"stale"};
        std::string err;
        expect_true(!none.changed_files(&none_files, &err), "non-git dir must fail");
        expect_true(contains(err, "git"), "error names git: " + err);
        expect_true(none_files.empty(), "output cleared on failure");
    }

    // record parsing, including a rename whose source follows as its own field
    {
        const char raw[] = "M  a.txt\0R  new.txt\0old.txt\0?? dir/u.txt\0";
        const std::string out(raw, sizeof(raw) - 1);
        auto paths = kyotee::parse_porcelain_z(out);
        expect_eq_ll((long long)paths.size(), 4, "record count");
        expect_eq_str(paths[1], "new.txt", "rename target");
        expect_eq_str(paths[2], "old.txt", "rename source");
        expect_eq_str(paths[3], "dir/u.txt", "untracked");
        expect_true(kyotee::parse_porcelain_z("").empty(), "empty output");
    }

    fs::remove_all(dir);
    std::cerr << "test_workspace: ALL PASSED" << std::endl;
    return 0;
}
