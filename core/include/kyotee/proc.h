#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kyotee {

struct ProcLimits {
    int timeout_ms{0};              // 0 = wait forever
    size_t output_max_bytes{0};     // 0 = unlimited
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    int64_t duration_ms{0};
    std::string output; // stdout+stderr merged
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is looked up in PATH) in its own process group,
// feed stdin_data on its stdin (then EOF), and capture stdout+stderr merged.
// On timeout the whole process group is killed and timed_out is set.
// Returns false only if the process could not be started (see res->error).
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      ProcResult* res);

// Run a command line through /bin/sh -c.
bool proc_run_shell(const std::string& command,
                    const std::string& cwd,
                    const ProcLimits& lim,
                    ProcResult* res);

// Split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace kyotee
