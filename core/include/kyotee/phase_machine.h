#pragma once

#include "config.h"
#include "log.h"
#include "prompt.h"
#include "run_store.h"
#include "types.h"
#include "worker.h"
#include "workspace.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kyotee {

struct RunOutcome {
    bool ok{false};
    std::string run_dir;
    RunError error; // meaningful only when !ok
    int total_iterations{0};
    std::map<std::string, int> phase_iterations;
};

// Called on every phase status change.
using PhaseObserver = std::function<void(const std::string& phase_id, PhaseStatus status, int iteration)>;

// Drives one run through the configured phases:
//   enter -> prompt -> worker -> extract -> validate -> persist -> write policy
//   [-> gates, verify only] -> advance, or loop back to implement.
// Never terminates the process; every fatal condition comes back in RunOutcome.
class PhaseMachine {
public:
    PhaseMachine(const RunConfig& cfg,
                 RunStore store,
                 IWorkspace& workspace,
                 IPromptSource& prompts,
                 const WorkerInvoker& worker,
                 std::string repo_root,
                 std::string task);

    void set_observer(PhaseObserver obs) { observer_ = std::move(obs); }

    RunOutcome run();

    const RunContext& context() const { return ctx_; }

private:
    bool run_phase(size_t idx, size_t* next, RunError* err);
    bool persist(const std::string& rel, const std::string& content, RunError* err);
    bool validate_control(size_t idx, json_object* control, RunError* err);
    void set_status(const std::string& phase_id, PhaseStatus st);
    void log_event(const std::string& name, json_object* payload);
    RunOutcome finish(bool ok, const RunError& err);

    const RunConfig& cfg_;
    RunStore store_;
    IWorkspace& workspace_;
    IPromptSource& prompts_;
    const WorkerInvoker& worker_;
    std::string repo_root_;

    RunContext ctx_;
    PhaseObserver observer_;
    std::unique_ptr<JsonlLogger> log_;
    int step_{0};
    std::vector<std::string> gate_failures_; // fed into the next implement prompt
};

} // namespace kyotee
