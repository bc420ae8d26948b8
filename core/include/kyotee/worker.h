#pragma once

#include "config.h"
#include "json_mini.h"
#include "run_store.h"
#include "types.h"

#include <string>

namespace kyotee {

// Runs the worker command with the prompt on stdin and turns its output
// into a control object.
class WorkerInvoker {
public:
    WorkerInvoker(WorkerSettings settings, std::string repo_root);

    // Output is always saved to <iter_rel>/worker_output.txt before the
    // timeout, exit-code and extraction checks. On failure *err carries a
    // WorkerError, ExtractionError or ArtifactError.
    bool invoke(const std::string& prompt, const RunStore& store, const std::string& iter_rel,
                json_mini::Doc* control, RunError* err) const;


private:
    WorkerSettings settings_;
    std::string repo_root_;
};

} // namespace kyotee
