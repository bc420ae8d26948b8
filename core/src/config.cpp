#include "kyotee/config.h"
#include "kyotee/json_mini.h"
#include "kyotee/proc.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace kyotee {

namespace fs = std::filesystem;

int RunConfig::index_of(const std::string& phase_id) const {
    for (size_t i = 0; i < phases.size(); i++) {
        if (phases[i].id == phase_id) return (int)i;
    }
    return -1;
}

static void read_limit(json_object* limits, const char* key, int* dst, std::vector<std::string>* issues) {
    json_object* v = json_mini::get(limits, key);
    if (!v) return;
    auto n = json_mini::get_int(limits, key);
    if (!n) {
        issues->push_back(std::string("limits.") + key + " must be an integer");
        return;
    }
    if (*n < 1 || *n > 1000000) {
        issues->push_back(std::string("limits.") + key + " must be between 1 and 1000000 (got " +
                          std::to_string(*n) + ")");
        return;
    }
    *dst = (int)*n;
}

static void read_prefixes(json_object* pol, const char* key, std::vector<std::string>* dst,
                          std::vector<std::string>* issues) {
    if (!json_mini::get(pol, key)) return;
    auto arr = json_mini::get_string_array(pol, key);
    if (!arr) {
        issues->push_back(std::string("policies.") + key + " must be an array of strings");
        return;
    }
    *dst = *arr;
}

bool parse_run_config(const std::string& text, const std::string& base_dir,
                      RunConfig* out, std::vector<std::string>* issues) {
    const size_t issues_before = issues->size();
    std::string perr;
    json_mini::Doc d = json_mini::parse(text, &perr);
    if (!d || !json_mini::is_object(d.root)) {
        issues->push_back(d ? "config root must be a JSON object" : "config is not valid JSON: " + perr);
        return false;
    }
    json_object* root = d.root;
    out->base_dir = base_dir;
    out->name = json_mini::get_string(root, "name").value_or("kyotee");

    // phases
    json_object* phases = json_mini::get(root, "phases");
    if (!json_mini::is_array(phases) || json_object_array_length(phases) == 0) {
        issues->push_back("No phases defined in config.");
    } else {
        std::set<std::string> seen;
        for (size_t i = 0; i < json_object_array_length(phases); i++) {
            json_object* p = json_object_array_get_idx(phases, i);
            const std::string where = "phases[" + std::to_string(i) + "]";
            auto id = json_mini::get_string(p, "id");
            auto schema = json_mini::get_string(p, "required_outputs_schema");
            if (!id || id->empty()) {
                issues->push_back(where + ": missing id");
                continue;
            }
            if (!seen.insert(*id).second) {
                issues->push_back(where + ": duplicate phase id '" + *id + "'");
                continue;
            }
            if (!schema || schema->empty()) {
                issues->push_back(where + " (" + *id + "): missing required_outputs_schema");
                continue;
            }
            SchemaValidator v;
            std::string serr;
            const std::string schema_path = (fs::path(base_dir) / *schema).lexically_normal().string();
            if (!SchemaValidator::load_file(schema_path, &v, &serr)) {
                issues->push_back(where + " (" + *id + "): " + serr);
                continue;
            }
            out->phases.push_back(PhaseSpec{*id, *schema});
            out->schemas.push_back(std::move(v));
        }
    }

    if (json_object* limits = json_mini::get(root, "limits")) {
        read_limit(limits, "max_total_iterations", &out->limits.max_total_iterations, issues);
        read_limit(limits, "max_phase_iterations", &out->limits.max_phase_iterations, issues);
    }

    if (json_object* pol = json_mini::get(root, "policies")) {
        if (json_mini::get(pol, "allow_file_writes")) {
            auto b = json_mini::get_bool(pol, "allow_file_writes");
            if (!b) issues->push_back("policies.allow_file_writes must be a boolean");
            else out->policy.allow_file_writes = *b;
        }
        read_prefixes(pol, "allowed_write_paths", &out->policy.allowed_prefixes, issues);
        read_prefixes(pol, "forbid_write_paths", &out->policy.forbidden_prefixes, issues);
    }

    if (json_object* cmds = json_mini::get(root, "commands")) {
        if (!json_mini::is_object(cmds)) {
            issues->push_back("commands must be an object");
        } else {
            json_object_object_foreach(cmds, k, v) {
                if (!is_valid_check_name(k)) {
                    issues->push_back(std::string("commands: invalid check name '") + k +
                                      "' (must be non-empty without '/', '\\' or '..')");
                    continue;
                }
                if (!v || !json_object_is_type(v, json_type_string)) {
                    issues->push_back(std::string("commands.") + k + " must be a string");
                    continue;
                }
                out->commands[k] = json_object_get_string(v);
            }
        }
    }

    if (json_object* gates = json_mini::get(root, "gates")) {
        if (json_mini::get(gates, "required_checks")) {
            auto req = json_mini::get_string_array(gates, "required_checks");
            if (!req) issues->push_back("gates.required_checks must be an array of strings");
            else {
                for (const auto& name : *req) {
                    if (!is_valid_check_name(name)) {
                        issues->push_back("gates.required_checks: invalid check name '" + name +
                                          "' (must be non-empty without '/', '\\' or '..')");
                    }
                }
                out->required_checks = *req;
            }
        }
    }

    if (json_object* wf = json_mini::get(root, "workflow")) {
        if (auto s = json_mini::get_string(wf, "implement_phase")) out->implement_phase = *s;
        if (auto s = json_mini::get_string(wf, "verify_phase")) out->verify_phase = *s;
    }

    // workflow shape: verify loops back to implement, so implement must come first
    const int vi = out->index_of(out->verify_phase);
    if (vi >= 0) {
        const int ii = out->index_of(out->implement_phase);
        if (ii < 0) {
            issues->push_back("verify phase '" + out->verify_phase + "' requires an implement phase '" +
                              out->implement_phase + "'");
        } else if (ii >= vi) {
            issues->push_back("implement phase '" + out->implement_phase + "' must precede verify phase '" +
                              out->verify_phase + "'");
        }
    }

    return issues->size() == issues_before;
}

bool load_run_config(const std::string& path, RunConfig* out, std::vector<std::string>* issues) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        issues->push_back("Spec not found: " + path);
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    const fs::path abs = fs::absolute(fs::path(path)).lexically_normal();
    out->path = abs.string();
    return parse_run_config(ss.str(), abs.parent_path().string(), out, issues);
}

int getenv_int(const char* k, int defv) {
    if (const char* e = std::getenv(k)) {
        try { return std::stoi(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

int64_t getenv_i64(const char* k, int64_t defv) {
    if (const char* e = std::getenv(k)) {
        try { return std::stoll(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

WorkerSettings worker_settings_from_env() {
    WorkerSettings ws;
    if (const char* w = std::getenv("KYOTEE_WORKER")) {
        if (*w) ws.command = w;
    }
    if (const char* a = std::getenv("KYOTEE_WORKER_ARGS")) {
        ws.args = split_argv_quoted(a);
    }
    const int t = getenv_int("KYOTEE_WORKER_TIMEOUT_MS", ws.timeout_ms);
    if (t > 0) ws.timeout_ms = t;
    const int64_t cap = getenv_i64("KYOTEE_WORKER_OUTPUT_MAX", (int64_t)ws.output_max_bytes);
    if (cap > 0) ws.output_max_bytes = (size_t)cap;
    return ws;
}

} // namespace kyotee
