#pragma once

// kyotee_cli run --task <text> | --task-file <path> [--spec agent/spec.json] [--repo .]
//                [--worker claude] [--worker-args "-p"] [--timeout 600]
int cmd_run(int argc, char** argv);
