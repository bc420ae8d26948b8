#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <optional>

namespace kyotee {

struct RunHeader {
    std::string format_version{"1"};
    std::string run_id;          // run directory basename
    std::string config_name;     // "name" from spec.json
};

// Fatal error taxonomy. Gate failures are not in here: the state machine
// absorbs them into the verify -> implement loop-back.
enum class ErrorKind {
    CONFIGURATION,
    WORKER,
    EXTRACTION,
    SCHEMA_VALIDATION,
    WRITE_POLICY,
    ITERATION_LIMIT,
    WORKSPACE,
    ARTIFACT,
};

const char* error_kind_name(ErrorKind k);

struct RunError {
    ErrorKind kind{ErrorKind::CONFIGURATION};
    std::string phase_id;               // empty when not tied to a phase
    std::string message;
    std::vector<std::string> details;   // e.g. every schema violation

    // "SchemaValidationError [plan]: JSON failed schema validation (2 violations)"
    std::string one_line() const;
};

enum class PhaseStatus {
    PENDING,
    RUNNING,
    PASSED,
    FAILED,
};

const char* phase_status_name(PhaseStatus s);

struct Limits {
    int max_total_iterations{25};
    int max_phase_iterations{6};
};

struct PhaseSpec {
    std::string id;
    std::string schema_path; // as written in the config (relative to config dir)
};

// Mutable state of one orchestration run. Owned by PhaseMachine.
struct RunContext {
    std::string run_dir;
    std::string task;
    int total_iterations{0};
    std::map<std::string, int> phase_iterations;
    std::map<std::string, PhaseStatus> phase_status;

    int iterations_of(const std::string& phase_id) const;
};

} // namespace kyotee
