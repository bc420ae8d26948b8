#include "kyotee/gates.h"
#include "kyotee/json_mini.h"
#include "kyotee/proc.h"

namespace kyotee {

bool is_valid_check_name(const std::string& name) {
    if (name.empty() || name == "." || name.find("..") != std::string::npos) return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

std::optional<std::string> find_missing_gate_command(const std::vector<std::string>& required,
                                                     const GateCommands& commands) {
    for (const auto& name : required) {
        auto it = commands.find(name);
        if (it == commands.end() || it->second.empty()) return name;
    }
    return std::nullopt;
}

bool run_gates(const std::vector<std::string>& required,
               const GateCommands& commands,
               const std::string& repo_root,
               const RunStore& store,
               const std::string& logs_rel,
               const std::function<void(const GateCheckResult&)>& on_result,
               GateReport* out,
               RunError* err) {
    *out = GateReport{};

    if (auto missing = find_missing_gate_command(required, commands)) {
        err->kind = ErrorKind::CONFIGURATION;
        err->message = "Missing command for gate '" + *missing + "' in commands";
        return false;
    }
    for (const auto& name : required) {
        if (!is_valid_check_name(name)) {
            err->kind = ErrorKind::CONFIGURATION;
            err->message = "Invalid gate name '" + name + "'";
            return false;
        }
    }

    for (const auto& name : required) {
        const std::string& cmd = commands.at(name);

        ProcResult pr;
        if (!proc_run_shell(cmd, repo_root, ProcLimits{}, &pr)) {
            err->kind = ErrorKind::WORKER;
            err->message = "gate '" + name + "' could not start: " + pr.error;
            return false;
        }

        GateCheckResult r;
        r.name = name;
        r.command = cmd;
        r.exit_code = pr.exit_code;
        r.output_ref = logs_rel + "/" + name + ".log";

        std::string werr;
        if (!store.write_new(r.output_ref, pr.output, &werr)) {
            err->kind = ErrorKind::ARTIFACT;
            err->message = werr;
            return false;
        }

        if (r.exit_code != 0) {
            out->all_passed = false;
            out->failures.push_back(name + " failed (exit " + std::to_string(r.exit_code) + ")");
        }
        out->checks.push_back(r);
        if (on_result) on_result(r);
    }
    return true;
}

json_object* build_verify_control(const GateReport& report, const std::string& narration) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "phase", json_mini::new_string("verify"));

    json_object* checks = json_object_new_array();
    json_object* evidence = json_object_new_array();
    for (const auto& c : report.checks) {
        json_object* cj = json_object_new_object();
        json_object_object_add(cj, "name", json_mini::new_string(c.name));
        json_object_object_add(cj, "command", json_mini::new_string(c.command));
        json_object_object_add(cj, "exit_code", json_object_new_int(c.exit_code));
        json_object_object_add(cj, "output_ref", json_mini::new_string(c.output_ref));
        json_object_array_add(checks, cj);

        json_object* ej = json_object_new_object();
        json_object_object_add(ej, "kind", json_mini::new_string("command_output"));
        json_object_object_add(ej, "ref", json_mini::new_string(c.output_ref));
        json_object_object_add(ej, "note", json_mini::new_string("Gate output"));
        json_object_array_add(evidence, ej);
    }
    json_object_object_add(o, "checks", checks);
    json_object_object_add(o, "all_passed", json_object_new_boolean(report.all_passed ? 1 : 0));

    json_object* failures = json_object_new_array();
    for (const auto& f : report.failures) json_object_array_add(failures, json_mini::new_string(f));
    json_object_object_add(o, "failures", failures);
    json_object_object_add(o, "evidence", evidence);
    json_object_object_add(o, "narration", json_mini::new_string(narration));
    return o;
}

} // namespace kyotee
