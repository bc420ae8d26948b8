#include "kyotee/schema.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>

namespace kyotee {

static constexpr int kMaxDepth = 64;

std::string SchemaViolation::path_string() const {
    if (path.empty()) return "<root>";
    std::string s;
    for (size_t i = 0; i < path.size(); i++) {
        if (i) s += ".";
        s += path[i];
    }
    return s;
}

std::string SchemaViolation::to_string() const {
    return path_string() + ": " + message;
}

static bool is_index(const std::string& s) {
    if (s.empty() || s.size() > 18) return false;
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// Array indices compare numerically so "items.2" sorts before "items.10".
static bool path_less(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; i++) {
        if (a[i] == b[i]) continue;
        if (is_index(a[i]) && is_index(b[i])) return std::stoll(a[i]) < std::stoll(b[i]);
        return a[i] < b[i];
    }
    return a.size() < b.size();
}

static bool is_number(json_object* v) {
    return v && (json_object_is_type(v, json_type_int) || json_object_is_type(v, json_type_double));
}

static bool is_integral(json_object* v) {
    if (!v) return false;
    if (json_object_is_type(v, json_type_int)) return true;
    if (json_object_is_type(v, json_type_double)) {
        double d = json_object_get_double(v);
        return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
}

static const char* type_name(json_object* v) {
    if (!v) return "null";
    switch (json_object_get_type(v)) {
        case json_type_null:    return "null";
        case json_type_boolean: return "boolean";
        case json_type_double:  return "number";
        case json_type_int:     return "integer";
        case json_type_object:  return "object";
        case json_type_array:   return "array";
        case json_type_string:  return "string";
    }
    return "unknown";
}

static bool matches_type(json_object* v, const std::string& t) {
    if (t == "null") return v == nullptr || json_object_is_type(v, json_type_null);
    if (!v) return false;
    if (t == "boolean") return json_object_is_type(v, json_type_boolean);
    if (t == "object") return json_object_is_type(v, json_type_object);
    if (t == "array") return json_object_is_type(v, json_type_array);
    if (t == "string") return json_object_is_type(v, json_type_string);
    if (t == "number") return is_number(v);
    if (t == "integer") return is_integral(v);
    return false;
}

static std::string str_of(json_object* v) {
    return std::string(json_object_get_string(v), json_object_get_string_len(v));
}

static size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

static std::string short_repr(json_object* v) {
    std::string s = json_mini::to_plain(v);
    if (s.size() > 60) s = s.substr(0, 57) + "...";
    return s;
}

static std::string num_repr(double d) {
    std::ostringstream oss;
    oss << d;
    return oss.str();
}

bool json_deep_equal(json_object* a, json_object* b) {
    const bool a_null = !a || json_object_is_type(a, json_type_null);
    const bool b_null = !b || json_object_is_type(b, json_type_null);
    if (a_null || b_null) return a_null && b_null;
    if (is_number(a) && is_number(b)) {
        if (json_object_is_type(a, json_type_int) && json_object_is_type(b, json_type_int)) {
            return json_object_get_int64(a) == json_object_get_int64(b);
        }
        return json_object_get_double(a) == json_object_get_double(b);
    }
    if (json_object_get_type(a) != json_object_get_type(b)) return false;
    switch (json_object_get_type(a)) {
        case json_type_boolean:
            return json_object_get_boolean(a) == json_object_get_boolean(b);
        case json_type_string:
            return str_of(a) == str_of(b);
        case json_type_array: {
            const size_t n = json_object_array_length(a);
            if (n != json_object_array_length(b)) return false;
            for (size_t i = 0; i < n; i++) {
                if (!json_deep_equal(json_object_array_get_idx(a, i), json_object_array_get_idx(b, i))) return false;
            }
            return true;
        }
        case json_type_object: {
            if (json_object_object_length(a) != json_object_object_length(b)) return false;
            json_object_object_foreach(a, k, va) {
                json_object* vb = nullptr;
                if (!json_object_object_get_ex(b, k, &vb)) return false;
                if (!json_deep_equal(va, vb)) return false;
            }
            return true;
        }
        default:
            return false;
    }
}

bool SchemaValidator::from_text(const std::string& text, SchemaValidator* out, std::string* err) {
    std::string perr;
    json_mini::Doc d = json_mini::parse(text, &perr);
    if (!d) {
        if (err) *err = "schema is not valid JSON: " + perr;
        return false;
    }
    if (!json_object_is_type(d.root, json_type_object) && !json_object_is_type(d.root, json_type_boolean)) {
        if (err) *err = "schema root must be an object or a boolean";
        return false;
    }
    out->schema_ = std::move(d);
    out->text_ = text;
    return true;
}

bool SchemaValidator::load_file(const std::string& path, SchemaValidator* out, std::string* err) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "schema not found: " + path;
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    std::string ferr;
    if (!from_text(ss.str(), out, &ferr)) {
        if (err) *err = path + ": " + ferr;
        return false;
    }
    return true;
}

json_object* SchemaValidator::resolve_ref(const std::string& ref) const {
    if (ref == "#") return schema_.root;
    if (ref.rfind("#/", 0) != 0) return nullptr;

    json_object* cur = schema_.root;
    size_t pos = 2;
    while (cur) {
        size_t slash = ref.find('/', pos);
        std::string tok = ref.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
        // JSON pointer unescape
        std::string unesc;
        for (size_t i = 0; i < tok.size(); i++) {
            if (tok[i] == '~' && i + 1 < tok.size()) {
                if (tok[i + 1] == '0') { unesc.push_back('~'); i++; continue; }
                if (tok[i + 1] == '1') { unesc.push_back('/'); i++; continue; }
            }
            unesc.push_back(tok[i]);
        }
        if (json_object_is_type(cur, json_type_object)) {
            cur = json_mini::get(cur, unesc.c_str());
        } else if (json_object_is_type(cur, json_type_array) && is_index(unesc)) {
            size_t idx = (size_t)std::stoull(unesc);
            cur = idx < json_object_array_length(cur) ? json_object_array_get_idx(cur, idx) : nullptr;
        } else {
            return nullptr;
        }
        if (slash == std::string::npos) break;
        pos = slash + 1;
    }
    return cur;
}

bool SchemaValidator::is_valid(json_object* schema, json_object* inst,
                               std::vector<std::string>& path, int depth) const {
    std::vector<SchemaViolation> tmp;
    check(schema, inst, path, &tmp, depth);
    return tmp.empty();
}

void SchemaValidator::check(json_object* schema, json_object* inst, std::vector<std::string>& path,
                            std::vector<SchemaViolation>* out, int depth) const {
    auto fail = [&](const char* keyword, const std::string& msg) {
        out->push_back(SchemaViolation{path, keyword, msg});
    };

    if (depth > kMaxDepth) {
        fail("$ref", "schema nesting too deep (recursive $ref?)");
        return;
    }
    if (!schema) return;
    if (json_object_is_type(schema, json_type_boolean)) {
        if (!json_object_get_boolean(schema)) fail("false", "no value is allowed here");
        return;
    }
    if (!json_object_is_type(schema, json_type_object)) return;

    if (auto ref = json_mini::get_string(schema, "$ref")) {
        json_object* target = resolve_ref(*ref);
        if (!target) fail("$ref", "unresolvable $ref '" + *ref + "'");
        else check(target, inst, path, out, depth + 1);
    }

    // type
    if (json_object* t = json_mini::get(schema, "type")) {
        std::vector<std::string> types;
        if (json_object_is_type(t, json_type_string)) {
            types.push_back(str_of(t));
        } else if (json_mini::is_array(t)) {
            for (size_t i = 0; i < json_object_array_length(t); i++) {
                json_object* e = json_object_array_get_idx(t, i);
                if (e && json_object_is_type(e, json_type_string)) types.push_back(str_of(e));
            }
        }
        bool ok = types.empty();
        for (const auto& ty : types) {
            if (matches_type(inst, ty)) { ok = true; break; }
        }
        if (!ok) {
            std::string want;
            for (size_t i = 0; i < types.size(); i++) {
                if (i) want += " or ";
                want += types[i];
            }
            fail("type", "expected type " + want + ", got " + type_name(inst));
        }
    }

    if (json_object* e = json_mini::get(schema, "enum")) {
        if (json_mini::is_array(e)) {
            bool found = false;
            for (size_t i = 0; i < json_object_array_length(e) && !found; i++) {
                found = json_deep_equal(json_object_array_get_idx(e, i), inst);
            }
            if (!found) fail("enum", short_repr(inst) + " is not one of " + short_repr(e));
        }
    }

    {
        json_object* c = nullptr;
        if (json_object_object_get_ex(schema, "const", &c) && !json_deep_equal(c, inst)) {
            fail("const", short_repr(inst) + " was expected to be " + short_repr(c));
        }
    }

    // object keywords
    if (json_mini::is_object(inst)) {
        json_object* props = json_mini::get(schema, "properties");
        json_object* pattern_props = json_mini::get(schema, "patternProperties");

        if (auto req = json_mini::get(schema, "required"); json_mini::is_array(req)) {
            for (size_t i = 0; i < json_object_array_length(req); i++) {
                json_object* k = json_object_array_get_idx(req, i);
                if (!k || !json_object_is_type(k, json_type_string)) continue;
                if (!json_mini::get(inst, json_object_get_string(k))) {
                    json_object* found = nullptr;
                    // present-but-null still counts as present
                    if (!json_object_object_get_ex(inst, json_object_get_string(k), &found)) {
                        fail("required", "'" + str_of(k) + "' is a required property");
                    }
                }
            }
        }

        std::vector<std::string> keys;
        json_object_object_foreach(inst, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        json_object* additional = nullptr;
        const bool has_additional = json_object_object_get_ex(schema, "additionalProperties", &additional);

        for (const auto& key : keys) {
            json_object* v = nullptr;
            json_object_object_get_ex(inst, key.c_str(), &v);
            bool covered = false;

            json_object* ps = json_mini::is_object(props) ? json_mini::get(props, key.c_str()) : nullptr;
            if (ps) {
                covered = true;
                path.push_back(key);
                check(ps, v, path, out, depth + 1);
                path.pop_back();
            }

            if (json_mini::is_object(pattern_props)) {
                json_object_object_foreach(pattern_props, pat, psch) {
                    bool hit = false;
                    try {
                        hit = std::regex_search(key, std::regex(pat, std::regex::ECMAScript));
                    } catch (const std::regex_error&) {
                        fail("patternProperties", std::string("invalid pattern '") + pat + "' in schema");
                        continue;
                    }
                    if (hit) {
                        covered = true;
                        path.push_back(key);
                        check(psch, v, path, out, depth + 1);
                        path.pop_back();
                    }
                }
            }

            if (!covered && has_additional) {
                if (json_object_is_type(additional, json_type_boolean)) {
                    if (!json_object_get_boolean(additional)) {
                        fail("additionalProperties",
                             "additional properties are not allowed ('" + key + "' was unexpected)");
                    }
                } else {
                    path.push_back(key);
                    check(additional, v, path, out, depth + 1);
                    path.pop_back();
                }
            }
        }

        const int64_t nprops = (int64_t)json_object_object_length(inst);
        if (auto mn = json_mini::get(schema, "minProperties"); is_number(mn) &&
            nprops < (int64_t)json_object_get_int64(mn)) {
            fail("minProperties", "has fewer than " + std::to_string(json_object_get_int64(mn)) + " properties");
        }
        if (auto mx = json_mini::get(schema, "maxProperties"); is_number(mx) &&
            nprops > (int64_t)json_object_get_int64(mx)) {
            fail("maxProperties", "has more than " + std::to_string(json_object_get_int64(mx)) + " properties");
        }
    }

    // array keywords
    if (json_mini::is_array(inst)) {
        const size_t n = json_object_array_length(inst);
        size_t prefix_len = 0;

        json_object* prefix = json_mini::get(schema, "prefixItems");
        json_object* items = json_mini::get(schema, "items");
        json_object* rest = items;
        if (!prefix && json_mini::is_array(items)) {
            // draft-07 tuple form
            prefix = items;
            rest = json_mini::get(schema, "additionalItems");
        }
        if (json_mini::is_array(prefix)) {
            prefix_len = json_object_array_length(prefix);
            for (size_t i = 0; i < n && i < prefix_len; i++) {
                path.push_back(std::to_string(i));
                check(json_object_array_get_idx(prefix, i), json_object_array_get_idx(inst, i), path, out, depth + 1);
                path.pop_back();
            }
        }
        if (rest && !json_mini::is_array(rest)) {
            for (size_t i = prefix_len; i < n; i++) {
                path.push_back(std::to_string(i));
                check(rest, json_object_array_get_idx(inst, i), path, out, depth + 1);
                path.pop_back();
            }
        }

        if (auto mn = json_mini::get(schema, "minItems"); is_number(mn) && (int64_t)n < json_object_get_int64(mn)) {
            fail("minItems", short_repr(inst) + " should have at least " +
                 std::to_string(json_object_get_int64(mn)) + " items");
        }
        if (auto mx = json_mini::get(schema, "maxItems"); is_number(mx) && (int64_t)n > json_object_get_int64(mx)) {
            fail("maxItems", "array has more than " + std::to_string(json_object_get_int64(mx)) + " items");
        }
        if (auto uq = json_mini::get_bool(schema, "uniqueItems"); uq && *uq) {
            bool dup = false;
            for (size_t i = 0; i < n && !dup; i++) {
                for (size_t j = i + 1; j < n && !dup; j++) {
                    dup = json_deep_equal(json_object_array_get_idx(inst, i), json_object_array_get_idx(inst, j));
                }
            }
            if (dup) fail("uniqueItems", "array has non-unique elements");
        }
        if (json_object* contains = json_mini::get(schema, "contains")) {
            bool any = false;
            for (size_t i = 0; i < n && !any; i++) {
                path.push_back(std::to_string(i));
                any = is_valid(contains, json_object_array_get_idx(inst, i), path, depth + 1);
                path.pop_back();
            }
            if (!any) fail("contains", "array does not contain a matching item");
        }
    }

    // string keywords
    if (inst && json_object_is_type(inst, json_type_string)) {
        const std::string s = str_of(inst);
        const size_t len = utf8_length(s);
        if (auto mn = json_mini::get(schema, "minLength"); is_number(mn) && (int64_t)len < json_object_get_int64(mn)) {
            fail("minLength", short_repr(inst) + " is too short (minimum " +
                 std::to_string(json_object_get_int64(mn)) + ")");
        }
        if (auto mx = json_mini::get(schema, "maxLength"); is_number(mx) && (int64_t)len > json_object_get_int64(mx)) {
            fail("maxLength", short_repr(inst) + " is too long (maximum " +
                 std::to_string(json_object_get_int64(mx)) + ")");
        }
        if (auto pat = json_mini::get_string(schema, "pattern")) {
            try {
                if (!std::regex_search(s, std::regex(*pat, std::regex::ECMAScript))) {
                    fail("pattern", short_repr(inst) + " does not match '" + *pat + "'");
                }
            } catch (const std::regex_error&) {
                fail("pattern", "invalid pattern '" + *pat + "' in schema");
            }
        }
    }

    // numeric keywords
    if (is_number(inst)) {
        const double d = json_object_get_double(inst);
        if (auto m = json_mini::get(schema, "minimum"); is_number(m) && d < json_object_get_double(m)) {
            fail("minimum", short_repr(inst) + " is less than the minimum of " + num_repr(json_object_get_double(m)));
        }
        if (auto m = json_mini::get(schema, "maximum"); is_number(m) && d > json_object_get_double(m)) {
            fail("maximum", short_repr(inst) + " is greater than the maximum of " + num_repr(json_object_get_double(m)));
        }
        if (auto m = json_mini::get(schema, "exclusiveMinimum"); is_number(m) && d <= json_object_get_double(m)) {
            fail("exclusiveMinimum", short_repr(inst) + " is less than or equal to " + num_repr(json_object_get_double(m)));
        }
        if (auto m = json_mini::get(schema, "exclusiveMaximum"); is_number(m) && d >= json_object_get_double(m)) {
            fail("exclusiveMaximum", short_repr(inst) + " is greater than or equal to " + num_repr(json_object_get_double(m)));
        }
        if (auto m = json_mini::get(schema, "multipleOf"); is_number(m) && json_object_get_double(m) > 0) {
            const double q = d / json_object_get_double(m);
            if (!std::isfinite(q) || std::fabs(q - std::round(q)) > 1e-9) {
                fail("multipleOf", short_repr(inst) + " is not a multiple of " + num_repr(json_object_get_double(m)));
            }
        }
    }

    // combinators
    if (auto all = json_mini::get(schema, "allOf"); json_mini::is_array(all)) {
        for (size_t i = 0; i < json_object_array_length(all); i++) {
            check(json_object_array_get_idx(all, i), inst, path, out, depth + 1);
        }
    }
    if (auto any = json_mini::get(schema, "anyOf"); json_mini::is_array(any)) {
        bool ok = false;
        for (size_t i = 0; i < json_object_array_length(any) && !ok; i++) {
            ok = is_valid(json_object_array_get_idx(any, i), inst, path, depth + 1);
        }
        if (!ok) fail("anyOf", short_repr(inst) + " is not valid under any of the given schemas");
    }
    if (auto one = json_mini::get(schema, "oneOf"); json_mini::is_array(one)) {
        size_t hits = 0;
        for (size_t i = 0; i < json_object_array_length(one); i++) {
            if (is_valid(json_object_array_get_idx(one, i), inst, path, depth + 1)) hits++;
        }
        if (hits == 0) fail("oneOf", short_repr(inst) + " is not valid under any of the given schemas");
        else if (hits > 1) fail("oneOf", short_repr(inst) + " is valid under more than one of the given schemas");
    }
    if (json_object* nots = json_mini::get(schema, "not")) {
        if (is_valid(nots, inst, path, depth + 1)) {
            fail("not", short_repr(inst) + " should not be valid under " + short_repr(nots));
        }
    }
    if (json_object* cond = json_mini::get(schema, "if")) {
        if (is_valid(cond, inst, path, depth + 1)) {
            if (json_object* then_s = json_mini::get(schema, "then")) check(then_s, inst, path, out, depth + 1);
        } else {
            if (json_object* else_s = json_mini::get(schema, "else")) check(else_s, inst, path, out, depth + 1);
        }
    }
}

std::vector<SchemaViolation> SchemaValidator::validate(json_object* instance) const {
    std::vector<SchemaViolation> out;
    if (!schema_) {
        out.push_back(SchemaViolation{{}, "$schema", "no schema loaded"});
        return out;
    }
    std::vector<std::string> path;
    check(schema_.root, instance, path, &out, 0);
    std::stable_sort(out.begin(), out.end(), [](const SchemaViolation& a, const SchemaViolation& b) {
        return path_less(a.path, b.path);
    });
    return out;
}

} // namespace kyotee
