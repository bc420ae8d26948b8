#include "kyotee/types.h"

namespace kyotee {

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::CONFIGURATION:     return "ConfigurationError";
        case ErrorKind::WORKER:            return "WorkerError";
        case ErrorKind::EXTRACTION:        return "ExtractionError";
        case ErrorKind::SCHEMA_VALIDATION: return "SchemaValidationError";
        case ErrorKind::WRITE_POLICY:      return "WritePolicyViolation";
        case ErrorKind::ITERATION_LIMIT:   return "IterationLimitExceeded";
        case ErrorKind::WORKSPACE:         return "WorkspaceError";
        case ErrorKind::ARTIFACT:          return "ArtifactError";
    }
    return "UnknownError";
}

std::string RunError::one_line() const {
    std::string s = error_kind_name(kind);
    if (!phase_id.empty()) s += " [" + phase_id + "]";
    s += ": " + message;
    return s;
}

const char* phase_status_name(PhaseStatus s) {
    switch (s) {
        case PhaseStatus::PENDING: return "pending";
        case PhaseStatus::RUNNING: return "running";
        case PhaseStatus::PASSED:  return "passed";
        case PhaseStatus::FAILED:  return "failed";
    }
    return "unknown";
}

int RunContext::iterations_of(const std::string& phase_id) const {
    auto it = phase_iterations.find(phase_id);
    return it == phase_iterations.end() ? 0 : it->second;
}

} // namespace kyotee
