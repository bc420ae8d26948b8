#include "kyotee/phase_machine.h"
#include "kyotee/gates.h"
#include "kyotee/hash.h"
#include "kyotee/json_mini.h"
#include "kyotee/schema.h"
#include "kyotee/write_policy.h"

#include <iostream>

namespace kyotee {

static void say(const std::string& msg) {
    std::cout << "[kyotee] " << msg << std::endl;
}

static std::string trim(const std::string& s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static json_object* string_array(const std::vector<std::string>& v) {
    json_object* a = json_object_new_array();
    for (const auto& s : v) json_object_array_add(a, json_mini::new_string(s));
    return a;
}

PhaseMachine::PhaseMachine(const RunConfig& cfg,
                           RunStore store,
                           IWorkspace& workspace,
                           IPromptSource& prompts,
                           const WorkerInvoker& worker,
                           std::string repo_root,
                           std::string task)
    : cfg_(cfg),
      store_(std::move(store)),
      workspace_(workspace),
      prompts_(prompts),
      worker_(worker),
      repo_root_(std::move(repo_root)) {
    ctx_.run_dir = store_.dir();
    ctx_.task = std::move(task);
    for (const auto& p : cfg_.phases) ctx_.phase_status[p.id] = PhaseStatus::PENDING;
}

void PhaseMachine::set_status(const std::string& phase_id, PhaseStatus st) {
    ctx_.phase_status[phase_id] = st;
    if (observer_) observer_(phase_id, st, ctx_.iterations_of(phase_id));
}

void PhaseMachine::log_event(const std::string& name, json_object* payload) {
    if (!log_) {
        if (payload) json_object_put(payload);
        return;
    }
    log_->event(step_++, name, payload);
}

bool PhaseMachine::persist(const std::string& rel, const std::string& content, RunError* err) {
    std::string werr;
    if (store_.write_new(rel, content, &werr)) return true;
    err->kind = ErrorKind::ARTIFACT;
    err->message = werr;
    return false;
}

bool PhaseMachine::validate_control(size_t idx, json_object* control, RunError* err) {
    auto violations = cfg_.schemas[idx].validate(control);
    if (violations.empty()) return true;
    err->kind = ErrorKind::SCHEMA_VALIDATION;
    err->message = "JSON failed schema validation (" + std::to_string(violations.size()) +
                   (violations.size() == 1 ? " violation)" : " violations)");
    for (const auto& v : violations) err->details.push_back(v.to_string());
    return false;
}

RunOutcome PhaseMachine::finish(bool ok, const RunError& err) {
    RunOutcome out;
    out.ok = ok;
    out.run_dir = ctx_.run_dir;
    out.error = err;
    out.total_iterations = ctx_.total_iterations;
    out.phase_iterations = ctx_.phase_iterations;
    return out;
}

RunOutcome PhaseMachine::run() {
    RunHeader hdr;
    hdr.run_id = store_.id();
    hdr.config_name = cfg_.name;
    log_ = std::make_unique<JsonlLogger>(hdr, store_.abs("run_log.jsonl"));

    RunError err;
    if (!log_->ok()) {
        err.kind = ErrorKind::ARTIFACT;
        err.message = "cannot open event log " + log_->path();
        return finish(false, err);
    }

    say("Starting run: " + ctx_.run_dir);

    if (!persist("task.txt", ctx_.task, &err)) return finish(false, err);
    if (!cfg_.path.empty()) {
        std::string cerr_msg;
        if (!store_.copy_in(cfg_.path, "spec.json", &cerr_msg)) {
            err.kind = ErrorKind::ARTIFACT;
            err.message = cerr_msg;
            return finish(false, err);
        }
    }

    {
        json_object* p = json_object_new_object();
        std::vector<std::string> ids;
        for (const auto& ph : cfg_.phases) ids.push_back(ph.id);
        json_object_object_add(p, "phases", string_array(ids));
        json_object_object_add(p, "max_total_iterations", json_object_new_int(cfg_.limits.max_total_iterations));
        json_object_object_add(p, "max_phase_iterations", json_object_new_int(cfg_.limits.max_phase_iterations));
        json_object_object_add(p, "repo_root", json_mini::new_string(repo_root_));
        if (!cfg_.path.empty()) {
            json_object_object_add(p, "config_sha256", json_mini::new_string(hash::sha256_file_hex(cfg_.path)));
        }
        log_event("run_start", p);
    }

    size_t cursor = 0;
    while (cursor < cfg_.phases.size()) {
        size_t next = cursor;
        if (!run_phase(cursor, &next, &err)) {
            if (err.phase_id.empty()) err.phase_id = cfg_.phases[cursor].id;
            if (ctx_.phase_status[err.phase_id] != PhaseStatus::FAILED) set_status(err.phase_id, PhaseStatus::FAILED);

            json_object* p = json_object_new_object();
            json_object_object_add(p, "kind", json_mini::new_string(error_kind_name(err.kind)));
            json_object_object_add(p, "phase", json_mini::new_string(err.phase_id));
            json_object_object_add(p, "message", json_mini::new_string(err.message));
            json_object_object_add(p, "details", string_array(err.details));
            log_event("run_failed", p);
            return finish(false, err);
        }
        cursor = next;
    }

    if (!persist("final.diff", workspace_.diff(), &err)) {
        log_event("run_failed", nullptr);
        return finish(false, err);
    }

    {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "total_iterations", json_object_new_int(ctx_.total_iterations));
        json_object_object_add(p, "final_diff", json_mini::new_string("final.diff"));
        log_event("run_done", p);
    }
    say("DONE. Run artifacts in: " + ctx_.run_dir);
    return finish(true, RunError{});
}

bool PhaseMachine::run_phase(size_t idx, size_t* next, RunError* err) {
    const PhaseSpec& phase = cfg_.phases[idx];
    const std::string& id = phase.id;
    const bool is_verify = (id == cfg_.verify_phase);
    const bool is_implement = (id == cfg_.implement_phase);
    err->phase_id = id;

    // Limits are checked before counting: an aborted attempt is not an entry.
    if (ctx_.total_iterations + 1 > cfg_.limits.max_total_iterations) {
        err->kind = ErrorKind::ITERATION_LIMIT;
        err->message = "Reached max_total_iterations=" + std::to_string(cfg_.limits.max_total_iterations) +
                       ". See " + ctx_.run_dir;
        return false;
    }
    if (ctx_.iterations_of(id) + 1 > cfg_.limits.max_phase_iterations) {
        err->kind = ErrorKind::ITERATION_LIMIT;
        err->message = "Reached max_phase_iterations=" + std::to_string(cfg_.limits.max_phase_iterations) +
                       " for phase '" + id + "'. See " + ctx_.run_dir;
        return false;
    }
    ctx_.total_iterations++;
    const int iter = ++ctx_.phase_iterations[id];

    set_status(id, PhaseStatus::RUNNING);
    say("Phase: " + id + " (iteration " + std::to_string(iter) + ")");
    {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "phase", json_mini::new_string(id));
        json_object_object_add(p, "iteration", json_object_new_int(iter));
        json_object_object_add(p, "total_iterations", json_object_new_int(ctx_.total_iterations));
        log_event("phase_enter", p);
    }

    const std::string iter_rel = RunStore::iter_rel(id, iter);

    // prompt
    PromptRequest req;
    req.phase_id = id;
    req.task = ctx_.task;
    req.diff = workspace_.diff();
    req.schema_text = cfg_.schemas[idx].text();
    if (is_implement) req.previous_failures = gate_failures_;
    std::string prompt, perr;
    if (!prompts_.build(req, &prompt, &perr)) {
        err->kind = ErrorKind::CONFIGURATION;
        err->message = perr;
        return false;
    }

    // worker -> extract
    json_mini::Doc control;
    if (!worker_.invoke(prompt, store_, iter_rel, &control, err)) return false;
    {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "phase", json_mini::new_string(id));
        json_object_object_add(p, "output_ref", json_mini::new_string(iter_rel + "/worker_output.txt"));
        log_event("worker_done", p);
    }

    // validate + persist
    if (!validate_control(idx, control.root, err)) return false;

    const std::string narration = json_mini::get_string(control.root, "narration").value_or("");
    const std::string claim_name = is_verify ? "worker_control.json" : "control.json";
    if (!persist(iter_rel + "/" + claim_name, json_mini::to_pretty(control.root) + "\n", err)) return false;
    if (!trim(narration).empty()) {
        if (!persist(iter_rel + "/narration.md", trim(narration) + "\n", err)) return false;
    }
    {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "phase", json_mini::new_string(id));
        json_object_object_add(p, "control_ref", json_mini::new_string(iter_rel + "/" + claim_name));
        log_event("control_valid", p);
    }

    // write policy
    if (cfg_.policy.allow_file_writes) {
        std::vector<std::string> changed;
        std::string werr;
        if (!workspace_.changed_files(&changed, &werr)) {
            err->kind = ErrorKind::WORKSPACE;
            err->message = werr;
            return false;
        }
        if (auto violation = check_write_policy(cfg_.policy, repo_root_, changed)) {
            err->kind = ErrorKind::WRITE_POLICY;
            err->message = "Write policy violation: " + *violation;
            return false;
        }
        json_object* p = json_object_new_object();
        json_object_object_add(p, "phase", json_mini::new_string(id));
        json_object_object_add(p, "changed_files", json_object_new_int((int)changed.size()));
        log_event("write_policy_ok", p);
    }

    if (is_verify) {
        GateReport report;
        auto on_result = [&](const GateCheckResult& r) {
            if (r.exit_code == 0) say("  Gate PASSED: " + r.name);
            else say("  Gate FAILED: " + r.name + " (exit " + std::to_string(r.exit_code) + ")");
            json_object* p = json_object_new_object();
            json_object_object_add(p, "name", json_mini::new_string(r.name));
            json_object_object_add(p, "exit_code", json_object_new_int(r.exit_code));
            json_object_object_add(p, "output_ref", json_mini::new_string(r.output_ref));
            log_event("gate_result", p);
        };
        if (!run_gates(cfg_.required_checks, cfg_.commands, repo_root_, store_,
                       iter_rel + "/gate_outputs", on_result, &report, err)) {
            return false;
        }

        json_mini::Doc vc(build_verify_control(report, narration));
        if (!validate_control(idx, vc.root, err)) {
            err->message = "authoritative verify control " + err->message;
            return false;
        }
        if (!persist(iter_rel + "/control.json", json_mini::to_pretty(vc.root) + "\n", err)) return false;

        if (!report.all_passed) {
            set_status(id, PhaseStatus::FAILED);
            // another repair cycle would need one more verify entry
            if (iter >= cfg_.limits.max_phase_iterations) {
                err->kind = ErrorKind::ITERATION_LIMIT;
                err->message = "Reached max_phase_iterations=" + std::to_string(cfg_.limits.max_phase_iterations) +
                               " for phase '" + id + "' with gates still failing. See " + ctx_.run_dir;
                err->details = report.failures;
                return false;
            }

            gate_failures_.clear();
            for (const auto& c : report.checks) {
                if (c.exit_code == 0) continue;
                gate_failures_.push_back(c.name + " failed (exit " + std::to_string(c.exit_code) +
                                         "), see " + c.output_ref);
            }

            say("Verification failed, looping back to " + cfg_.implement_phase + " phase");
            json_object* p = json_object_new_object();
            json_object_object_add(p, "from", json_mini::new_string(id));
            json_object_object_add(p, "to", json_mini::new_string(cfg_.implement_phase));
            json_object_object_add(p, "failures", string_array(report.failures));
            log_event("loop_back", p);

            *next = (size_t)cfg_.index_of(cfg_.implement_phase);
            return true;
        }
        gate_failures_.clear();
    }

    set_status(id, PhaseStatus::PASSED);
    {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "phase", json_mini::new_string(id));
        json_object_object_add(p, "iteration", json_object_new_int(iter));
        log_event("phase_passed", p);
    }
    *next = idx + 1;
    return true;
}

} // namespace kyotee
