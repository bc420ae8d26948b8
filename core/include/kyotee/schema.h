#pragma once

#include "json_mini.h"

#include <string>
#include <vector>

namespace kyotee {

struct SchemaViolation {
    std::vector<std::string> path; // instance location, segments
    std::string keyword;           // schema keyword that failed
    std::string message;

    // "checks.0.exit_code" or "<root>"
    std::string path_string() const;
    // "checks.0.exit_code: expected type integer, got string"
    std::string to_string() const;
};

// JSON Schema validator (draft 2020-12 subset, local $ref only).
// Reports every violation, sorted by instance path then discovery order.
class SchemaValidator {
public:
    SchemaValidator() = default;
    SchemaValidator(SchemaValidator&&) = default;
    SchemaValidator& operator=(SchemaValidator&&) = default;

    static bool load_file(const std::string& path, SchemaValidator* out, std::string* err);
    static bool from_text(const std::string& text, SchemaValidator* out, std::string* err);

    std::vector<SchemaViolation> validate(json_object* instance) const;

    bool loaded() const { return static_cast<bool>(schema_); }
    const std::string& text() const { return text_; }

private:
    void check(json_object* schema, json_object* inst, std::vector<std::string>& path,
               std::vector<SchemaViolation>* out, int depth) const;
    bool is_valid(json_object* schema, json_object* inst, std::vector<std::string>& path, int depth) const;
    json_object* resolve_ref(const std::string& ref) const;

    json_mini::Doc schema_;
    std::string text_;
};

// Deep equality with numeric comparison (1 == 1.0).
bool json_deep_equal(json_object* a, json_object* b);

} // namespace kyotee
