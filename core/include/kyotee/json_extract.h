#pragma once

#include "json_mini.h"

#include <string>

namespace kyotee {

// Recover one JSON object from free-form worker output.
//
// Tier 1: fenced code blocks (``` or ```json). The first fence whose body is a
//         single balanced {...} object that parses wins.
// Tier 2: brace-balanced regions of the raw text, left to right; the first
//         one that parses as a JSON object wins.
//
// Returns false with *err set when no candidate parses as a JSON object.
bool extract_json_object(const std::string& text, json_mini::Doc* out, std::string* err);

// End offset (one past the closing brace) of the balanced object starting at
// text[start] == '{', honoring string literals and escapes. npos if unbalanced.
size_t find_balanced_object_end(const std::string& text, size_t start);

} // namespace kyotee
