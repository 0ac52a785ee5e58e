#pragma once

#include <json/json.h>
#include <string>
#include <cstdint>

namespace voxbridge {

// Serialize to a single line (no embedded newlines)
std::string to_json_line(const Json::Value& value);

// Parse text into out. Never throws.
bool parse_json(const std::string& text, Json::Value& out, std::string* error = nullptr);

// Typed lookups that tolerate missing or mistyped members
std::string json_string(const Json::Value& obj, const char* key, const std::string& fallback = "");
int64_t json_int(const Json::Value& obj, const char* key, int64_t fallback = 0);
double json_double(const Json::Value& obj, const char* key, double fallback = 0.0);
bool json_bool(const Json::Value& obj, const char* key, bool fallback = false);

} // namespace voxbridge
