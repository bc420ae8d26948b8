#include "test_common.h"

#include "kyotee/proc.h"

#include <chrono>

using kyotee::ProcLimits;
using kyotee::ProcResult;

int main() {
    // stdin reaches the child and stdout+stderr are merged
    {
        ProcResult r;
        bool ok = kyotee::proc_run_capture({"/bin/sh", "-c", "cat; echo err >&2"}, "", "hello\n", ProcLimits{}, &r);
        expect_true(ok, "proc should start: " + r.error);
        expect_eq_ll(r.exit_code, 0, "exit code");
        expect_true(contains(r.output, "hello"), "stdin echoed: " + r.output);
        expect_true(contains(r.output, "err"), "stderr merged: " + r.output);
    }

    // non-zero exit and cwd
    {
        auto dir = fresh_dir("proc");
        ProcResult r;
        expect_true(kyotee::proc_run_shell("pwd; exit 3", dir.string(), ProcLimits{}, &r), "shell start");
        expect_eq_ll(r.exit_code, 3, "exit 3");
        expect_true(contains(r.output, dir.filename().string()), "cwd honored: " + r.output);
    }

    // a child that ignores stdin must not break the caller
    {
        ProcResult r;
        std::string big(1 << 20, 'x');
        expect_true(kyotee::proc_run_capture({"/bin/sh", "-c", "exit 0"}, "", big, ProcLimits{}, &r), "start");
        expect_eq_ll(r.exit_code, 0, "early exit with unread stdin");
    }

    // timeout kills the process group
    {
        ProcLimits lim;
        lim.timeout_ms = 300;
        ProcResult r;
        auto t0 = std::chrono::steady_clock::now();
        expect_true(kyotee::proc_run_shell("sleep 30 & sleep 30", "", lim, &r), "start sleeper");
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        expect_true(r.timed_out, "should time out");
        expect_true(ms < 10000, "timeout should return promptly");
    }

    // output cap
    {
        ProcLimits lim;
        lim.output_max_bytes = 1000;
        ProcResult r;
        expect_true(kyotee::proc_run_shell("head -c 100000 /dev/zero | tr '\\0' a", "", lim, &r), "start");
        expect_true(r.output_truncated, "output should be truncated");
        expect_true(r.output.size() <= 1000, "output capped");
    }

    // missing binary
    {
        ProcResult r;
        bool ok = kyotee::proc_run_capture({"kyotee-no-such-binary"}, "", "", ProcLimits{}, &r);
        expect_true(ok, "fork should still succeed");
        expect_eq_ll(r.exit_code, 127, "exec failure is 127");
    }

    // argv splitting
    {
        auto v = kyotee::split_argv_quoted("-p --model 'big one' \"a \\\"q\\\"\" ''");
        expect_eq_ll((long long)v.size(), 5, "token count");
        expect_eq_str(v[2], "big one", "single quotes");
        expect_eq_str(v[3], "a \"q\"", "double quotes with escapes");
        expect_eq_str(v[4], "", "empty quoted token");
        expect_true(kyotee::split_argv_quoted("'unterminated").empty(), "unterminated quote");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
