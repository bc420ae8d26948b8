#include "kyotee/log.h"
#include "kyotee/hash.h"
#include "kyotee/json_mini.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace kyotee {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Sorted-key serialization (RFC 8785 JCS subset) so that the hash chain is
// independent of json-c's insertion order.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << "\"" << json_mini::json_escape(keys[i]) << "\":";
            canonical_serialize(json_mini::get(obj, keys[i].c_str()), out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    case json_type_string:
        out << "\"" << json_mini::json_escape(std::string(json_object_get_string(obj),
                                                            json_object_get_string_len(obj))) << "\"";
        break;
    default:
        // numbers, booleans, null
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonical_json(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

JsonlLogger::JsonlLogger(const RunHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path), out_(path, std::ios::out | std::ios::app), chain_prev_(std::string(64, '0')) {}

void JsonlLogger::event(int step, const std::string& name, json_object* payload) {
    json_mini::Doc payload_guard(payload);
    if (!out_) return;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_mini::new_string(name));
    json_object_object_add(rec, "payload", payload ? json_object_get(payload) : json_object_new_object());
    json_object_object_add(rec, "run_id", json_mini::new_string(hdr_.run_id));
    json_object_object_add(rec, "config_name", json_mini::new_string(hdr_.config_name));
    json_object_object_add(rec, "format_version", json_mini::new_string(hdr_.format_version));
    json_object_object_add(rec, "step", json_object_new_int(step));
    json_object_object_add(rec, "ts", json_mini::new_string(iso_now()));
    json_mini::Doc rec_guard(rec);

    const std::string record = canonical_json(rec);
    const std::string chain_hash = hash::sha256_hex(chain_prev_ + record);

    json_object_object_add(rec, "chain_prev", json_mini::new_string(chain_prev_));
    json_object_object_add(rec, "chain_hash", json_mini::new_string(chain_hash));

    out_ << canonical_json(rec) << "\n";
    out_.flush();
    chain_prev_ = chain_hash;
}

long verify_jsonl_chain(const std::string& path, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return -1;
    }
    std::string prev(64, '0');
    std::string line;
    long n = 0;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        std::string perr;
        json_mini::Doc d = json_mini::parse(line, &perr);
        if (!d || !json_mini::is_object(d.root)) {
            if (err) *err = "line " + std::to_string(n + 1) + ": not a JSON object: " + perr;
            return -1;
        }
        auto got_prev = json_mini::get_string(d.root, "chain_prev");
        auto got_hash = json_mini::get_string(d.root, "chain_hash");
        if (!got_prev || !got_hash) {
            if (err) *err = "line " + std::to_string(n + 1) + ": missing chain fields";
            return -1;
        }
        if (*got_prev != prev) {
            if (err) *err = "line " + std::to_string(n + 1) + ": chain_prev does not match previous hash";
            return -1;
        }
        json_object_object_del(d.root, "chain_prev");
        json_object_object_del(d.root, "chain_hash");
        const std::string expect = hash::sha256_hex(prev + canonical_json(d.root));
        if (expect != *got_hash) {
            if (err) *err = "line " + std::to_string(n + 1) + ": chain_hash mismatch";
            return -1;
        }
        prev = expect;
        n++;
    }
    return n;
}

} // namespace kyotee
