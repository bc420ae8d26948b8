#pragma once

#include <string>
#include <vector>

namespace kyotee {

struct PromptRequest {
    std::string phase_id;
    std::string task;
    std::string diff;        // current working-tree diff, may be empty
    std::string schema_text; // phase schema, verbatim
    // Set on implement re-entry after a failed verify:
    // "test failed (exit 1), see verify/iter_1/gate_outputs/test.log"
    std::vector<std::string> previous_failures;
};

class IPromptSource {
public:
    virtual ~IPromptSource() = default;
    virtual bool build(const PromptRequest& req, std::string* out, std::string* err) = 0;
};

// Reads prompts/system.md and prompts/phase_<id>.md from prompts_dir and an
// optional AGENTS.md from repo_root.
class FilePromptAssembler final : public IPromptSource {
public:
    FilePromptAssembler(std::string prompts_dir, std::string repo_root);
    bool build(const PromptRequest& req, std::string* out, std::string* err) override;

private:
    std::string prompts_dir_;
    std::string repo_root_;
};

} // namespace kyotee
