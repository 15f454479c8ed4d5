#pragma once

#include <pmat/result.hpp>
#include <json/json.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pmat::json {

Result<Json::Value> parse(const std::string& text);

// Single line, no trailing newline. Object keys are emitted in sorted
// order, which makes the output deterministic.
std::string compact(const Json::Value& v);
std::string pretty(const Json::Value& v);

// Typed parameter access. Missing keys yield the fallback; present keys of
// the wrong type yield ValidationFailed naming the field.
Result<std::string> get_string(const Json::Value& obj, const char* key,
                               const std::string& fallback = "");
Result<int64_t> get_int(const Json::Value& obj, const char* key, int64_t fallback);
Result<bool> get_bool(const Json::Value& obj, const char* key, bool fallback);
Result<std::vector<std::string>> get_string_list(const Json::Value& obj, const char* key);

// Required string field
Result<std::string> require_string(const Json::Value& obj, const char* key);

// Flatten scalar members of an object to strings (for template parameters)
Result<std::vector<std::pair<std::string, std::string>>> string_pairs(const Json::Value& obj);

Json::Value string_array(const std::vector<std::string>& items);

} // namespace pmat::json
