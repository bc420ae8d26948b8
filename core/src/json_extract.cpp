#include "kyotee/json_extract.h"

#include <cctype>

namespace kyotee {

static std::string trim_ws(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

size_t find_balanced_object_end(const std::string& text, size_t start) {
    if (start >= text.size() || text[start] != '{') return std::string::npos;
    int depth = 0;
    bool in_str = false;
    bool esc = false;
    for (size_t i = start; i < text.size(); i++) {
        char c = text[i];
        if (in_str) {
            if (esc) esc = false;
            else if (c == '\\') esc = true;
            else if (c == '"') in_str = false;
            continue;
        }
        if (c == '"') { in_str = true; continue; }
        if (c == '{') depth++;
        else if (c == '}') {
            depth--;
            if (depth == 0) return i + 1;
        }
    }
    return std::string::npos;
}

static bool parse_object(const std::string& candidate, json_mini::Doc* out, std::string* last_err) {
    std::string perr;
    json_mini::Doc d = json_mini::parse(candidate, &perr);
    if (!d) {
        *last_err = perr;
        return false;
    }
    if (!json_mini::is_object(d.root)) {
        *last_err = "JSON value is not an object";
        return false;
    }
    *out = std::move(d);
    return true;
}

// Body of a fence, minus an optional "json" language tag.
static std::string fence_body(const std::string& raw) {
    size_t i = 0;
    if (raw.compare(0, 4, "json") == 0 || raw.compare(0, 4, "JSON") == 0) {
        i = 4;
    }
    return trim_ws(raw.substr(i));
}

bool extract_json_object(const std::string& text, json_mini::Doc* out, std::string* err) {
    std::string last_err;
    const std::string fence = "```";

    // Tier 1: fenced blocks
    size_t pos = 0;
    while (true) {
        size_t open = text.find(fence, pos);
        if (open == std::string::npos) break;
        size_t body_start = open + fence.size();
        size_t close = text.find(fence, body_start);
        if (close == std::string::npos) break;

        std::string body = fence_body(text.substr(body_start, close - body_start));
        if (!body.empty() && body.front() == '{' &&
            find_balanced_object_end(body, 0) == body.size()) {
            if (parse_object(body, out, &last_err)) return true;
        }
        pos = close + fence.size();
    }

    // Tier 2: raw balanced regions
    bool saw_candidate = false;
    for (size_t i = text.find('{'); i != std::string::npos; i = text.find('{', i + 1)) {
        size_t end = find_balanced_object_end(text, i);
        if (end == std::string::npos) continue;
        saw_candidate = true;
        if (parse_object(text.substr(i, end - i), out, &last_err)) return true;
    }

    if (err) {
        if (saw_candidate && !last_err.empty()) *err = "JSON parse error: " + last_err;
        else *err = "no JSON object found in output";
    }
    return false;
}

} // namespace kyotee
