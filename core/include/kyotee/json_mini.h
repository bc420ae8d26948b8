#pragma once

// json_mini.h
//
// Thin helpers over json-c: an owning Doc handle plus typed field access.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace kyotee::json_mini {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: the whole input must be one JSON value (trailing whitespace ok).
// On failure returns an empty Doc and, if err is given, the tokener message.
inline Doc parse(const std::string& json, std::string* err = nullptr) {
    json_tokener* tok = json_tokener_new();
    if (!tok) {
        if (err) *err = "json_tokener_new failed";
        return Doc{};
    }
    json_tokener_set_flags(tok, JSON_TOKENER_STRICT);
    const int len = static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success || !obj) {
        if (obj) json_object_put(obj);
        if (err) {
            *err = (jerr == json_tokener_continue) ? "unexpected end of input"
                                                   : json_tokener_error_desc(jerr);
        }
        return Doc{};
    }
    for (size_t i = consumed; i < json.size(); i++) {
        char c = json[i];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            json_object_put(obj);
            if (err) *err = "trailing characters after JSON value";
            return Doc{};
        }
    }
    return Doc{obj};
}

inline bool is_object(json_object* o) { return o && json_object_is_type(o, json_type_object); }
inline bool is_array(json_object* o) { return o && json_object_is_type(o, json_type_array); }

inline json_object* get(json_object* o, const char* key) {
    if (!is_object(o)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return nullptr;
    return v;
}

inline std::optional<std::string> get_string(json_object* o, const char* key) {
    json_object* v = get(o, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), json_object_get_string_len(v));
}

inline std::optional<int64_t> get_int(json_object* o, const char* key) {
    json_object* v = get(o, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<bool> get_bool(json_object* o, const char* key) {
    json_object* v = get(o, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

// Returns nullopt when the key is missing or not an array of strings.
inline std::optional<std::vector<std::string>> get_string_array(json_object* o, const char* key) {
    json_object* arr = get(o, key);
    if (!is_array(arr)) return std::nullopt;
    std::vector<std::string> out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (!el || !json_object_is_type(el, json_type_string)) return std::nullopt;
        out.emplace_back(json_object_get_string(el));
    }
    return out;
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
}

inline std::string to_plain(json_object* o) {
    const char* s = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    return s ? s : "null";
}

inline std::string to_pretty(json_object* o) {
    const char* s = json_object_to_json_string_ext(
        o, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED | JSON_C_TO_STRING_NOSLASHESCAPE);
    return s ? s : "null";
}

// Escape a string for embedding inside a JSON string literal (no surrounding quotes).
inline std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '"':  oss << "\\\""; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    oss << buf;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

} // namespace kyotee::json_mini
