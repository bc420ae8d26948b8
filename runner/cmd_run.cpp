#include "cmd_run.h"
#include "runner_utils.h"

#include "kyotee/config.h"
#include "kyotee/phase_machine.h"
#include "kyotee/proc.h"
#include "kyotee/prompt.h"
#include "kyotee/run_store.h"
#include "kyotee/worker.h"
#include "kyotee/workspace.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>

using namespace kyotee;

static void usage() {
    std::cerr << "usage: kyotee_cli run --task <text> | --task-file <path> [--spec agent/spec.json] [--repo .]\n"
                 "                      [--worker claude] [--worker-args \"-p\"] [--timeout 600]\n";
    std::cerr << "env: KYOTEE_WORKER, KYOTEE_WORKER_ARGS, KYOTEE_WORKER_TIMEOUT_MS, KYOTEE_WORKER_OUTPUT_MAX, KYOTEE_RUN_ID\n";
}

int cmd_run(int argc, char** argv) {
    RunArgs args;
    std::string aerr;
    if (!parse_run_args(argc, argv, 2, &args, &aerr)) {
        std::cerr << "[kyotee] " << aerr << "\n";
        usage();
        return 2;
    }

    std::string task = args.task;
    if (!args.task_file.empty()) {
        try {
            task = slurp(args.task_file);
        } catch (const std::exception& e) {
            std::cerr << "[kyotee] ERROR: " << e.what() << "\n";
            return 2;
        }
    }

    const auto repo_root = resolve_dir(args.repo);
    if (!std::filesystem::is_directory(repo_root)) {
        std::cerr << "[kyotee] ERROR: repository root is not a directory: " << repo_root.string() << "\n";
        return 1;
    }

    RunConfig cfg;
    std::vector<std::string> issues;
    if (!load_run_config(args.spec, &cfg, &issues)) {
        RunError e;
        e.kind = ErrorKind::CONFIGURATION;
        e.message = "invalid configuration " + args.spec;
        e.details = issues;
        print_run_error(e, "");
        return 1;
    }

    WorkerSettings ws = worker_settings_from_env();
    if (args.worker) ws.command = *args.worker;
    if (args.worker_args) ws.args = split_argv_quoted(*args.worker_args);
    if (args.timeout_s) ws.timeout_ms = *args.timeout_s * 1000; // bounded by parse_run_args

    const char* pinned = std::getenv("KYOTEE_RUN_ID");
    RunStore store;
    std::string serr;
    const auto runs_base = std::filesystem::path(cfg.base_dir) / "runs";
    if (!RunStore::create(runs_base.string(), pinned ? pinned : "", &store, &serr)) {
        RunError e;
        e.kind = ErrorKind::ARTIFACT;
        e.message = serr;
        print_run_error(e, "");
        return 1;
    }

    GitWorkspace workspace(repo_root.string(), {runs_base.string()});
    FilePromptAssembler prompts((std::filesystem::path(cfg.base_dir) / "prompts").string(), repo_root.string());
    WorkerInvoker worker(ws, repo_root.string());

    PhaseMachine machine(cfg, store, workspace, prompts, worker, repo_root.string(), task);
    RunOutcome out = machine.run();
    if (!out.ok) {
        print_run_error(out.error, out.run_dir);
        return 1;
    }
    return 0;
}
