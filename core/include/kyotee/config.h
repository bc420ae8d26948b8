#pragma once

#include "gates.h"
#include "schema.h"
#include "types.h"
#include "write_policy.h"

#include <cstddef>
#include <string>
#include <vector>

namespace kyotee {

// Immutable run configuration (agent/spec.json), loaded once per run.
struct RunConfig {
    std::string name;
    std::string path;     // absolute path of the config file
    std::string base_dir; // schema and prompt paths are relative to this

    std::vector<PhaseSpec> phases;
    std::vector<SchemaValidator> schemas; // parallel to phases
    Limits limits;
    WritePolicy policy;
    GateCommands commands;
    std::vector<std::string> required_checks;
    std::string implement_phase{"implement"};
    std::string verify_phase{"verify"};

    // -1 when absent
    int index_of(const std::string& phase_id) const;
    bool has_verify() const { return index_of(verify_phase) >= 0; }
};

// Parse and validate a config document. Collects every issue it can find.
bool parse_run_config(const std::string& text, const std::string& base_dir,
                      RunConfig* out, std::vector<std::string>* issues);

bool load_run_config(const std::string& path, RunConfig* out, std::vector<std::string>* issues);

struct WorkerSettings {
    std::string command{"claude"};
    std::vector<std::string> args{"-p"};
    int timeout_ms{600 * 1000};
    size_t output_max_bytes{8u * 1024 * 1024};
};

// Defaults overridden by KYOTEE_WORKER, KYOTEE_WORKER_ARGS,
// KYOTEE_WORKER_TIMEOUT_MS and KYOTEE_WORKER_OUTPUT_MAX.
WorkerSettings worker_settings_from_env();

int getenv_int(const char* k, int defv);
int64_t getenv_i64(const char* k, int64_t defv);

} // namespace kyotee
