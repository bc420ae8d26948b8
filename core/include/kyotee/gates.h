#pragma once

#include "run_store.h"
#include "types.h"

#include <json-c/json.h>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kyotee {

struct GateCheckResult {
    std::string name;
    std::string command;
    int exit_code{0};
    std::string output_ref; // log path relative to the run dir
};

struct GateReport {
    std::vector<GateCheckResult> checks; // in required-check order
    bool all_passed{true};
    std::vector<std::string> failures;   // "<name> failed (exit N)"
};

using GateCommands = std::map<std::string, std::string>;

// Check names become log file names: non-empty, no '/', '\\' or "..".
bool is_valid_check_name(const std::string& name);

// First required check with no (or an empty) command, if any.
std::optional<std::string> find_missing_gate_command(const std::vector<std::string>& required,
                                                     const GateCommands& commands);

// Runs every required check through /bin/sh -c in repo_root, one at a time,
// writing merged output to <logs_rel>/<name>.log in the run store.
// on_result (optional) is called after each check.
// Returns false with *err on ConfigurationError (missing command, checked
// before anything runs), WorkerError (shell could not start) or ArtifactError.
// Failing checks are not errors: they show up in out->failures.
bool run_gates(const std::vector<std::string>& required,
               const GateCommands& commands,
               const std::string& repo_root,
               const RunStore& store,
               const std::string& logs_rel,
               const std::function<void(const GateCheckResult&)>& on_result,
               GateReport* out,
               RunError* err);

// Authoritative verify control object built from a gate report.
// Caller owns the returned object.
json_object* build_verify_control(const GateReport& report, const std::string& narration);

} // namespace kyotee
