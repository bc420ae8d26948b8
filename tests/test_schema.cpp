#include "test_common.h"

#include "kyotee/json_mini.h"
#include "kyotee/schema.h"

using kyotee::SchemaValidator;
using kyotee::SchemaViolation;
namespace jm = kyotee::json_mini;

static SchemaValidator schema(const std::string& text) {
    SchemaValidator v;
    std::string err;
    if (!SchemaValidator::from_text(text, &v, &err)) die("schema load failed: " + err);
    return v;
}

static std::vector<SchemaViolation> check(const SchemaValidator& v, const std::string& doc) {
    jm::Doc d = jm::parse(doc);
    if (!d) die("bad test document: " + doc);
    return v.validate(d.root);
}

static std::string joined(const std::vector<SchemaViolation>& vs) {
    std::string s;
    for (const auto& v : vs) s += v.to_string() + "\n";
    return s;
}

int main() {
    const std::string verify_schema = R"({
      "type": "object",
      "required": ["phase", "checks", "all_passed"],
      "properties": {
        "phase": {"const": "verify"},
        "checks": {
          "type": "array",
          "items": {
            "type": "object",
            "required": ["name", "exit_code"],
            "properties": {"name": {"type": "string"}, "exit_code": {"type": "integer"}}
          }
        },
        "all_passed": {"type": "boolean"},
        "narration": {"type": "string"}
      },
      "additionalProperties": false
    })";
    auto v = schema(verify_schema);

    // accepted
    {
        auto r = check(v, R"({"phase":"verify","checks":[{"name":"t","exit_code":0}],"all_passed":true})");
        expect_true(r.empty(), "valid document rejected:\n" + joined(r));
        // integral double is an integer
        r = check(v, R"({"phase":"verify","checks":[{"name":"t","exit_code":1.0}],"all_passed":false})");
        expect_true(r.empty(), "1.0 should count as integer:\n" + joined(r));
    }

    // every violation is reported, sorted by path
    {
        const std::string doc =
            R"({"phase":"plan","checks":[{"name":"a","exit_code":0},{"name":1,"exit_code":"x"}],"extra":1})";
        auto r = check(v, doc);
        expect_eq_ll((long long)r.size(), 5, "violation count:\n" + joined(r));
        expect_eq_str(r[0].path_string(), "<root>", "root violations first");
        bool saw_required = false, saw_additional = false;
        for (const auto& x : r) {
            if (x.keyword == "required" && contains(x.message, "all_passed")) saw_required = true;
            if (x.keyword == "additionalProperties" && contains(x.message, "extra")) saw_additional = true;
        }
        expect_true(saw_required, "missing all_passed must be reported");
        expect_true(saw_additional, "extra property must be reported");
        expect_eq_str(r[2].path_string(), "checks.1.exit_code", "sorted path 2");
        expect_eq_str(r[3].path_string(), "checks.1.name", "sorted path 3");
        expect_eq_str(r[4].path_string(), "phase", "sorted path 4");

        // deterministic across calls
        auto r2 = check(v, doc);
        expect_eq_str(joined(r2), joined(r), "repeated validation must be identical");
    }

    // numeric-aware ordering of array indices
    {
        auto s = schema(R"({"type":"array","items":{"type":"string"}})");
        std::string doc = "[";
        for (int i = 0; i < 12; i++) doc += (i ? "," : "") + std::string("0");
        doc += "]";
        auto r = check(s, doc);
        expect_eq_ll((long long)r.size(), 12, "one violation per item");
        expect_eq_str(r[2].path_string(), "2", "index 2 before index 10");
        expect_eq_str(r[11].path_string(), "11", "last index");
    }

    // $ref into $defs, enum, pattern, length
    {
        auto s = schema(R"({
          "type": "object",
          "properties": {"step": {"$ref": "#/$defs/step"}},
          "$defs": {
            "step": {
              "type": "object",
              "required": ["id"],
              "properties": {
                "id": {"type": "string", "pattern": "^[a-z]+$", "maxLength": 3},
                "kind": {"enum": ["edit", "test"]}
              }
            }
          }
        })");
        expect_true(check(s, R"({"step":{"id":"abc","kind":"edit"}})").empty(), "ref valid");
        auto r = check(s, R"({"step":{"id":"ABCD","kind":"deploy"}})");
        expect_eq_ll((long long)r.size(), 3, "pattern + maxLength + enum:\n" + joined(r));
        r = check(s, R"({"step":{}})");
        expect_eq_ll((long long)r.size(), 1, "required through ref");
        expect_eq_str(r[0].path_string(), "step", "required reported at object path");
    }

    // minLength counts code points
    {
        auto s = schema(R"({"type":"string","minLength":3})");
        expect_true(!check(s, "\"éé\"").empty(), "two code points are too short");
        expect_true(check(s, "\"ééé\"").empty(), "three code points are enough");
    }

    // combinators and numbers
    {
        auto s = schema(R"({"oneOf":[{"type":"integer","minimum":0},{"type":"string"}]})");
        expect_true(check(s, "5").empty(), "oneOf int");
        expect_true(check(s, "\"x\"").empty(), "oneOf string");
        expect_true(!check(s, "-1").empty(), "oneOf none");

        auto n = schema(R"({"type":"number","exclusiveMaximum":10,"multipleOf":0.5})");
        expect_true(check(n, "9.5").empty(), "9.5 ok");
        expect_true(!check(n, "10").empty(), "10 excluded");
        expect_true(!check(n, "9.3").empty(), "9.3 not a multiple");

        auto a = schema(R"({"type":"array","minItems":1,"uniqueItems":true,"contains":{"const":1}})");
        expect_true(check(a, "[1,2]").empty(), "array ok");
        expect_true(!check(a, "[]").empty(), "minItems");
        expect_true(!check(a, "[1,1.0]").empty(), "1 and 1.0 are duplicates");
        expect_true(!check(a, "[2,3]").empty(), "contains");

        auto c = schema(R"({"if":{"properties":{"all_passed":{"const":false}}},"then":{"required":["failures"]}})");
        expect_true(check(c, R"({"all_passed":true})").empty(), "if false branch");
        expect_true(!check(c, R"({"all_passed":false})").empty(), "then branch applies");

        auto nots = schema(R"({"not":{"type":"string"}})");
        expect_true(!check(nots, "\"x\"").empty(), "not string");
        expect_true(check(nots, "[]").empty(), "array is not a string");
    }

    // boolean schemas
    {
        auto t = schema("true");
        auto f = schema("false");
        expect_true(check(t, "{}").empty(), "true accepts");
        expect_true(!check(f, "{}").empty(), "false rejects");
    }

    // load errors
    {
        SchemaValidator bad;
        std::string err;
        expect_true(!SchemaValidator::from_text("{not json", &bad, &err), "invalid schema text");
        expect_true(!SchemaValidator::load_file("/nonexistent/kyotee.schema.json", &bad, &err), "missing file");
        expect_true(contains(err, "schema not found"), "missing file message: " + err);
    }

    std::cerr << "test_schema: ALL PASSED" << std::endl;
    return 0;
}
