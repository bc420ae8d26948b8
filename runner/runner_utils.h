#pragma once

#include "kyotee/types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kyotee {

// Whole file as a string; throws std::runtime_error when unreadable.
std::string slurp(const std::string& path);

struct RunArgs {
    std::string task;
    std::string task_file;
    std::string spec{"agent/spec.json"};
    std::string repo{"."};
    std::optional<std::string> worker;
    std::optional<std::string> worker_args;
    std::optional<int> timeout_s;
};

// Largest --timeout whose millisecond value still fits in an int.
constexpr int kMaxTimeoutSeconds = 2147483647 / 1000;

// Parses "run" flags starting at argv[first]. Accepts "--flag value" and "--flag=value".
bool parse_run_args(int argc, char** argv, int first, RunArgs* out, std::string* err);

// "[kyotee] ERROR: <kind> [phase]: message" plus one indented line per detail.
void print_run_error(const RunError& e, const std::string& run_dir);

std::filesystem::path resolve_dir(const std::string& p);

} // namespace kyotee
