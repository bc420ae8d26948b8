#include "kyotee/worker.h"
#include "kyotee/json_extract.h"
#include "kyotee/proc.h"

namespace kyotee {

WorkerInvoker::WorkerInvoker(WorkerSettings settings, std::string repo_root)
    : settings_(std::move(settings)), repo_root_(std::move(repo_root)) {}

bool WorkerInvoker::invoke(const std::string& prompt, const RunStore& store, const std::string& iter_rel,
                           json_mini::Doc* control, RunError* err) const {
    std::vector<std::string> argv{settings_.command};
    argv.insert(argv.end(), settings_.args.begin(), settings_.args.end());

    ProcLimits lim;
    lim.timeout_ms = settings_.timeout_ms;
    lim.output_max_bytes = settings_.output_max_bytes;

    ProcResult pr;
    const bool started = proc_run_capture(argv, repo_root_, prompt, lim, &pr);

    const std::string out_rel = iter_rel + "/worker_output.txt";
    const std::string out_path = store.abs(out_rel);
    std::string werr;
    if (!store.write_new(out_rel, pr.output, &werr)) {
        err->kind = ErrorKind::ARTIFACT;
        err->message = werr;
        return false;
    }

    if (!started) {
        err->kind = ErrorKind::WORKER;
        err->message = "Worker could not be started (" + settings_.command + "): " + pr.error;
        return false;
    }
    if (pr.timed_out) {
        err->kind = ErrorKind::WORKER;
        err->message = "Worker timed out after " + std::to_string(settings_.timeout_ms) + " ms. See " + out_path;
        return false;
    }
    if (pr.exit_code != 0) {
        err->kind = ErrorKind::WORKER;
        err->message = "Worker returned non-zero exit code " + std::to_string(pr.exit_code) + ". See " + out_path;
        return false;
    }

    std::string xerr;
    if (!extract_json_object(pr.output, control, &xerr)) {
        err->kind = ErrorKind::EXTRACTION;
        err->message = "Worker output error: " + xerr + ". See " + out_path;
        if (pr.output_truncated) {
            err->details.push_back("worker output was truncated at " +
                                   std::to_string(settings_.output_max_bytes) + " bytes");
        }
        return false;
    }
    return true;
}

} // namespace kyotee
