#include "test_common.h"

#include "kyotee/hash.h"
#include "kyotee/json_mini.h"
#include "kyotee/log.h"

namespace jm = kyotee::json_mini;

int main() {
    // sha256 known answers
    expect_eq_str(kyotee::hash::sha256_hex(""),
                  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256 empty");
    expect_eq_str(kyotee::hash::sha256_hex("abc"),
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256 abc");

    // canonical form sorts keys at every level
    {
        jm::Doc d = jm::parse(R"({"b":1,"a":{"d":[true,null],"c":"x"}})");
        expect_eq_str(kyotee::canonical_json(d.root), R"({"a":{"c":"x","d":[true,null]},"b":1})", "canonical");
    }

    auto dir = fresh_dir("log");
    auto path = (dir / "run_log.jsonl").string();
    {
        kyotee::RunHeader hdr;
        hdr.run_id = "20260101-000000";
        hdr.config_name = "kyotee";
        kyotee::JsonlLogger log(hdr, path);
        expect_true(log.ok(), "logger open");
        for (int i = 0; i < 3; i++) {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "i", json_object_new_int(i));
            log.event(i, "phase_enter", p);
        }
        log.event(3, "run_done", nullptr);
    }

    std::string err;
    expect_eq_ll(kyotee::verify_jsonl_chain(path, &err), 4, "chain verifies: " + err);

    // tamper with one payload
    std::string text = read_file(path);
    auto pos = text.find("\"i\":1");
    expect_true(pos != std::string::npos, "payload present");
    text.replace(pos, 5, "\"i\":7");
    write_file(path, text);
    err.clear();
    expect_eq_ll(kyotee::verify_jsonl_chain(path, &err), -1, "tampered chain must fail");
    expect_true(contains(err, "line 2"), "names the broken line: " + err);

    std::filesystem::remove_all(dir);
    std::cerr << "test_log: ALL PASSED" << std::endl;
    return 0;
}
