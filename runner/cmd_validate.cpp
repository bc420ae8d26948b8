#include "cmd_validate.h"
#include "runner_utils.h"

#include "kyotee/config.h"
#include "kyotee/json_extract.h"
#include "kyotee/json_mini.h"
#include "kyotee/schema.h"

#include <filesystem>
#include <iostream>

using namespace kyotee;

int cmd_validate(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: kyotee_cli validate <spec.json>\n";
        return 2;
    }
    RunConfig cfg;
    std::vector<std::string> issues;
    const bool ok = load_run_config(argv[2], &cfg, &issues);

    // prompts are only read at run time; report missing ones now
    const auto prompts_dir = std::filesystem::path(cfg.base_dir) / "prompts";
    if (!cfg.base_dir.empty()) {
        if (!std::filesystem::exists(prompts_dir / "system.md")) {
            issues.push_back("prompt not found: " + (prompts_dir / "system.md").string());
        }
        for (const auto& p : cfg.phases) {
            auto f = prompts_dir / ("phase_" + p.id + ".md");
            if (!std::filesystem::exists(f)) issues.push_back("prompt not found: " + f.string());
        }
    }
    if (cfg.has_verify()) {
        if (auto missing = find_missing_gate_command(cfg.required_checks, cfg.commands)) {
            issues.push_back("Missing command for gate '" + *missing + "' in commands");
        }
    }

    if (ok && issues.empty()) {
        std::cout << "SPEC: OK (" << cfg.phases.size() << " phases, "
                  << cfg.required_checks.size() << " required checks)\n";
        return 0;
    }
    for (const auto& i : issues) std::cout << "SPEC issue: " << i << "\n";
    return 1;
}

int cmd_check(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: kyotee_cli check <schema.json> <doc>\n";
        return 2;
    }
    SchemaValidator v;
    std::string err;
    if (!SchemaValidator::load_file(argv[2], &v, &err)) {
        std::cerr << "[kyotee] ERROR: " << err << "\n";
        return 1;
    }

    std::string text;
    try {
        text = slurp(argv[3]);
    } catch (const std::exception& e) {
        std::cerr << "[kyotee] ERROR: " << e.what() << "\n";
        return 1;
    }

    // Accept plain JSON documents as well as raw worker output.
    json_mini::Doc doc = json_mini::parse(text);
    if (!doc && !extract_json_object(text, &doc, &err)) {
        std::cerr << "[kyotee] ERROR: " << err << "\n";
        return 1;
    }

    auto violations = v.validate(doc.root);
    if (violations.empty()) {
        std::cout << "CHECK: OK\n";
        return 0;
    }
    std::cout << "JSON failed schema validation:\n";
    for (const auto& x : violations) std::cout << " - " << x.to_string() << "\n";
    return 1;
}
