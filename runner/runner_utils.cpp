#include "runner_utils.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace kyotee {

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

bool parse_run_args(int argc, char** argv, int first, RunArgs* out, std::string* err) {
    for (int i = first; i < argc; i++) {
        std::string a = argv[i];
        std::string val;
        bool has_inline = false;
        if (a.rfind("--", 0) == 0) {
            auto eq = a.find('=');
            if (eq != std::string::npos) {
                val = a.substr(eq + 1);
                a = a.substr(0, eq);
                has_inline = true;
            }
        }
        auto take = [&](std::string* dst) -> bool {
            if (has_inline) { *dst = val; return true; }
            if (i + 1 >= argc) {
                *err = "missing value for " + a;
                return false;
            }
            *dst = argv[++i];
            return true;
        };

        std::string v;
        if (a == "--task") {
            if (!take(&out->task)) return false;
        } else if (a == "--task-file") {
            if (!take(&out->task_file)) return false;
        } else if (a == "--spec") {
            if (!take(&out->spec)) return false;
        } else if (a == "--repo") {
            if (!take(&out->repo)) return false;
        } else if (a == "--worker") {
            if (!take(&v)) return false;
            out->worker = v;
        } else if (a == "--worker-args") {
            if (!take(&v)) return false;
            out->worker_args = v;
        } else if (a == "--timeout") {
            if (!take(&v)) return false;
            try {
                size_t pos = 0;
                int t = std::stoi(v, &pos);
                if (pos != v.size() || t <= 0) throw std::invalid_argument(v);
                if (t > kMaxTimeoutSeconds) {
                    *err = "--timeout must be at most " + std::to_string(kMaxTimeoutSeconds) + " seconds, got " + v;
                    return false;
                }
                out->timeout_s = t;
            } catch (const std::exception&) {
                *err = "--timeout expects a positive number of seconds, got '" + v + "'";
                return false;
            }
        } else {
            *err = "unknown argument: " + a;
            return false;
        }
    }
    if (out->task.empty() == out->task_file.empty()) {
        *err = "exactly one of --task or --task-file is required";
        return false;
    }
    return true;
}

void print_run_error(const RunError& e, const std::string& run_dir) {
    std::cerr << "[kyotee] ERROR: " << e.one_line() << "\n";
    for (const auto& d : e.details) std::cerr << "  - " << d << "\n";
    if (!run_dir.empty()) std::cerr << "[kyotee] run directory: " << run_dir << "\n";
}

std::filesystem::path resolve_dir(const std::string& p) {
    std::error_code ec;
    auto c = std::filesystem::canonical(p, ec);
    if (ec) return std::filesystem::absolute(p).lexically_normal();
    return c;
}

} // namespace kyotee
