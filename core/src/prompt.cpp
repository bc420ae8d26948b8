#include "kyotee/prompt.h"

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

namespace kyotee {

namespace fs = std::filesystem;

static const char* kInstruction =
    "INSTRUCTIONS:\nReturn ONLY a valid JSON object matching the schema above. "
    "No markdown, no explanation, just the JSON.";

static std::optional<std::string> read_text(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return std::nullopt;
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static bool blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

FilePromptAssembler::FilePromptAssembler(std::string prompts_dir, std::string repo_root)
    : prompts_dir_(std::move(prompts_dir)), repo_root_(std::move(repo_root)) {}

bool FilePromptAssembler::build(const PromptRequest& req, std::string* out, std::string* err) {
    const fs::path sys_path = fs::path(prompts_dir_) / "system.md";
    const fs::path phase_path = fs::path(prompts_dir_) / ("phase_" + req.phase_id + ".md");

    auto sys = read_text(sys_path);
    if (!sys) {
        if (err) *err = "prompt not found: " + sys_path.string();
        return false;
    }
    auto phase = read_text(phase_path);
    if (!phase) {
        if (err) *err = "prompt not found: " + phase_path.string();
        return false;
    }

    std::vector<std::string> sections;
    if (auto agents = read_text(fs::path(repo_root_) / "AGENTS.md"); agents && !blank(*agents)) {
        sections.push_back("PROJECT_INSTRUCTIONS (AGENTS.md):\n" + *agents);
    }
    sections.push_back(*sys);
    sections.push_back(*phase);
    sections.push_back("TASK:\n" + req.task);
    if (!req.previous_failures.empty()) {
        std::string s = "PREVIOUS_GATE_FAILURES:";
        for (const auto& f : req.previous_failures) s += "\n- " + f;
        sections.push_back(s);
    }
    sections.push_back("CURRENT_GIT_DIFF:\n" + (blank(req.diff) ? std::string("<none>") : req.diff));
    sections.push_back("REQUIRED JSON SCHEMA:\n" + (req.schema_text.empty() ? std::string("{}") : req.schema_text));
    sections.push_back(kInstruction);

    std::string prompt;
    for (size_t i = 0; i < sections.size(); i++) {
        if (i) prompt += "\n\n";
        prompt += sections[i];
    }
    *out = std::move(prompt);
    return true;
}

} // namespace kyotee
