#pragma once
#include "types.h"

#include <json-c/json.h>

#include <fstream>
#include <string>

namespace kyotee {

// Append-only JSONL event log with a SHA-256 hash chain over canonical
// (sorted-key) records: chain_hash = SHA256(chain_prev || record).
class JsonlLogger {
public:
    JsonlLogger(const RunHeader& hdr, const std::string& path);

    // Takes ownership of payload (may be nullptr).
    void event(int step, const std::string& name, json_object* payload);

    bool ok() const { return static_cast<bool>(out_); }
    const std::string& path() const { return path_; }
    const std::string& last_hash() const { return chain_prev_; }

private:
    RunHeader hdr_;
    std::string path_;
    std::ofstream out_;
    std::string chain_prev_;
};

// Deterministic JSON text: object keys sorted, no insignificant whitespace.
std::string canonical_json(json_object* obj);

// Recompute the chain of a log file. Returns the number of verified lines,
// or -1 (with *err) at the first broken link.
long verify_jsonl_chain(const std::string& path, std::string* err);

} // namespace kyotee
