#include "test_common.h"

#include "kyotee/json_extract.h"
#include "kyotee/json_mini.h"

using kyotee::extract_json_object;
using kyotee::find_balanced_object_end;
namespace jm = kyotee::json_mini;

static jm::Doc must_extract(const std::string& text, const std::string& what) {
    jm::Doc d;
    std::string err;
    if (!extract_json_object(text, &d, &err)) die(what + ": extraction failed: " + err);
    return d;
}

int main() {
    // bare object
    {
        auto d = must_extract("{\"phase\":\"plan\",\"n\":1}", "bare");
        expect_eq_str(jm::get_string(d.root, "phase").value_or(""), "plan", "bare phase");
        expect_eq_ll(jm::get_int(d.root, "n").value_or(-1), 1, "bare n");
    }

    // fenced with json tag, surrounded by prose
    {
        std::string text = "Here is my answer:\n```json\n{\"phase\": \"implement\", \"changes\": []}\n```\nThanks.";
        auto d = must_extract(text, "fenced");
        expect_eq_str(jm::get_string(d.root, "phase").value_or(""), "implement", "fenced phase");
    }

    // untagged fence
    {
        auto d = must_extract("```\n{\"a\": true}\n```", "untagged fence");
        expect_true(jm::get_bool(d.root, "a").value_or(false), "untagged fence a");
    }

    // fenced object wins over an earlier raw object
    {
        std::string text = "draft {\"v\": 1}\n```json\n{\"v\": 2}\n```";
        auto d = must_extract(text, "fence priority");
        expect_eq_ll(jm::get_int(d.root, "v").value_or(-1), 2, "fenced candidate should win");
    }

    // invalid fence falls through to the raw scan
    {
        std::string text = "```json\n{not json}\n```\nfinal: {\"ok\": 1}";
        auto d = must_extract(text, "bad fence");
        expect_eq_ll(jm::get_int(d.root, "ok").value_or(-1), 1, "raw fallback after bad fence");
    }

    // braces inside strings do not confuse the scanner
    {
        std::string text = "noise {\"msg\": \"a } and { and \\\" quote\", \"x\": {\"y\": 3}} trailing";
        auto d = must_extract(text, "braces in strings");
        expect_eq_str(jm::get_string(d.root, "msg").value_or(""), "a } and { and \" quote", "msg");
        expect_eq_ll(jm::get_int(jm::get(d.root, "x"), "y").value_or(-1), 3, "nested y");
    }

    // first syntactically valid candidate wins
    {
        std::string text = "{bad} then {\"first\": 1} then {\"second\": 2}";
        auto d = must_extract(text, "first valid");
        expect_true(jm::get(d.root, "first") != nullptr, "first valid object should win");
    }

    // failures
    {
        jm::Doc d;
        std::string err;
        expect_true(!extract_json_object("I could not do it.", &d, &err), "prose only should fail");
        expect_true(contains(err, "no JSON object found"), "prose error message: " + err);

        err.clear();
        expect_true(!extract_json_object("{\"a\": }", &d, &err), "broken object should fail");
        expect_true(contains(err, "JSON parse error"), "parse error message: " + err);

        err.clear();
        expect_true(!extract_json_object("{\"open\": 1", &d, &err), "unbalanced should fail");
        expect_true(!extract_json_object("", &d, &err), "empty should fail");
    }

    // balanced scan
    {
        const std::string s = "x{\"a\":{\"b\":\"}\"}}y";
        expect_eq_ll((long long)find_balanced_object_end(s, 1), (long long)s.size() - 1, "balanced end");
        expect_true(find_balanced_object_end(s, 0) == std::string::npos, "start must be a brace");
        expect_true(find_balanced_object_end("{\"a\":1", 0) == std::string::npos, "unbalanced is npos");
    }

    std::cerr << "test_json_extract: ALL PASSED" << std::endl;
    return 0;
}
