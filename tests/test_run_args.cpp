#include "test_common.h"

#include "runner_utils.h"

#include <climits>
#include <vector>

using kyotee::RunArgs;

static bool parse(std::vector<std::string> args, RunArgs* out, std::string* err) {
    args.insert(args.begin(), {"kyotee_cli", "run"});
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    return kyotee::parse_run_args((int)argv.size(), argv.data(), 2, out, err);
}

int main() {
    // flags in both spellings
    {
        RunArgs a;
        std::string err;
        expect_true(parse({"--task", "fix it", "--repo=/tmp/r", "--worker-args", "-p --json", "--timeout=90"}, &a, &err),
                    "parse: " + err);
        expect_eq_str(a.task, "fix it", "task");
        expect_eq_str(a.repo, "/tmp/r", "inline value");
        expect_eq_str(a.worker_args.value_or(""), "-p --json", "worker args");
        expect_eq_ll(a.timeout_s.value_or(0), 90, "timeout");
        expect_eq_str(a.spec, "agent/spec.json", "default spec");
    }

    // the largest timeout still converts to milliseconds without overflow
    {
        RunArgs a;
        std::string err;
        const std::string max_s = std::to_string(kyotee::kMaxTimeoutSeconds);
        expect_true(parse({"--task", "t", "--timeout", max_s}, &a, &err), "max timeout: " + err);
        expect_true((long long)*a.timeout_s * 1000 <= INT_MAX, "max timeout fits in int milliseconds");
    }

    // one past it, and values beyond int, are rejected
    {
        RunArgs a;
        std::string err;
        const std::string over = std::to_string(kyotee::kMaxTimeoutSeconds + 1);
        expect_true(!parse({"--task", "t", "--timeout", over}, &a, &err), "oversized timeout accepted");
        expect_true(contains(err, "at most"), "range message: " + err);
        expect_true(!a.timeout_s.has_value(), "timeout left unset");

        err.clear();
        expect_true(!parse({"--task", "t", "--timeout", "99999999999"}, &a, &err), "int overflow accepted");
        expect_true(contains(err, "--timeout"), "overflow message: " + err);
    }

    // malformed values
    {
        RunArgs a;
        std::string err;
        expect_true(!parse({"--task", "t", "--timeout", "0"}, &a, &err), "zero timeout");
        expect_true(!parse({"--task", "t", "--timeout", "5s"}, &a, &err), "trailing garbage");
        expect_true(!parse({"--task", "t", "--timeout"}, &a, &err), "missing value");
        expect_true(contains(err, "missing value"), "missing value message: " + err);
    }

    // exactly one task source
    {
        RunArgs a;
        std::string err;
        expect_true(!parse({"--repo", "."}, &a, &err), "no task");
        expect_true(contains(err, "exactly one"), "task message: " + err);
        RunArgs b;
        expect_true(!parse({"--task", "t", "--task-file", "f"}, &b, &err), "both task sources");
        RunArgs c;
        expect_true(!parse({"--task", "t", "--bogus"}, &c, &err), "unknown flag");
        expect_true(contains(err, "unknown argument"), "unknown flag message: " + err);
    }

    std::cerr << "test_run_args: ALL PASSED" << std::endl;
    return 0;
}
