#include "test_common.h"

#include "kyotee/write_policy.h"

using kyotee::WritePolicy;
using kyotee::check_write_policy;

int main() {
    const std::string root = "/work/repo";

    // no changes passes trivially, even with a restrictive policy
    {
        WritePolicy p;
        p.allowed_prefixes = {"src/"};
        p.forbidden_prefixes = {""};
        expect_true(!check_write_policy(p, root, {}), "empty change set must pass");
    }

    // empty allow-list means no restriction
    {
        WritePolicy p;
        expect_true(!check_write_policy(p, root, {"/work/repo/anything/at/all.txt"}), "no allow-list");
    }

    // allow-list
    {
        WritePolicy p;
        p.allowed_prefixes = {"src/", "docs/"};
        expect_true(!check_write_policy(p, root, {"/work/repo/src/a.cpp", "/work/repo/docs/x.md"}), "allowed");
        auto v = check_write_policy(p, root, {"/work/repo/src/a.cpp", "/work/repo/README.md"});
        expect_true(v.has_value(), "README outside allow-list must fail");
        expect_true(contains(*v, "README.md"), "violation names the path: " + *v);
    }

    // forbidden wins over allowed
    {
        WritePolicy p;
        p.allowed_prefixes = {"src/"};
        p.forbidden_prefixes = {"src/generated/"};
        auto v = check_write_policy(p, root, {"/work/repo/src/generated/x.h"});
        expect_true(v.has_value(), "forbidden prefix must win");
        expect_true(contains(*v, "forbidden"), "forbidden message: " + *v);
    }

    // backslash prefixes are normalized
    {
        WritePolicy p;
        p.forbidden_prefixes = {".git\\"};
        expect_true(check_write_policy(p, root, {"/work/repo/.git/config"}).has_value(), "normalized prefix");
        expect_eq_str(kyotee::normalize_prefix("a\\b\\"), "a/b/", "normalize_prefix");
    }

    // relative paths and dot segments resolve against the root
    {
        auto r = kyotee::relative_to_root(root, "/work/repo/./src/../src/main.cpp");
        expect_true(r.has_value(), "inside root");
        expect_eq_str(*r, "src/main.cpp", "normalized relative path");
        r = kyotee::relative_to_root(root, "lib/x.cpp");
        expect_eq_str(r.value_or(""), "lib/x.cpp", "relative input");
        expect_true(!kyotee::relative_to_root(root, "/work/other/x.cpp").has_value(), "outside root");

        WritePolicy p;
        auto v = check_write_policy(p, root, {"/etc/passwd"});
        expect_true(v.has_value(), "path outside root is a violation");
    }

    std::cerr << "test_write_policy: ALL PASSED" << std::endl;
    return 0;
}
