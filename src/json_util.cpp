#include "json_util.hpp"
#include <memory>
#include <limits>
#include <cmath>

namespace voxbridge {

std::string to_json_line(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["commentStyle"] = "None";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

bool parse_json(const std::string& text, Json::Value& out, std::string* error) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    std::string errs;
    Json::Value parsed;
    if (!reader->parse(text.data(), text.data() + text.size(), &parsed, &errs)) {
        if (error) *error = errs;
        return false;
    }
    out = std::move(parsed);
    return true;
}

std::string json_string(const Json::Value& obj, const char* key, const std::string& fallback) {
    if (!obj.isObject()) return fallback;
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : fallback;
}

int64_t json_int(const Json::Value& obj, const char* key, int64_t fallback) {
    if (!obj.isObject()) return fallback;
    const Json::Value& v = obj[key];
    if (v.isInt64()) return v.asInt64();
    if (v.isUInt64()) {
        // Above INT64_MAX
        return std::numeric_limits<int64_t>::max();
    }
    if (v.isDouble()) {
        double d = v.asDouble();
        if (std::isnan(d)) return fallback;
        // 2^63 is exactly representable; anything at or past it saturates
        if (d >= 9223372036854775808.0) return std::numeric_limits<int64_t>::max();
        if (d <= -9223372036854775808.0) return std::numeric_limits<int64_t>::min();
        return static_cast<int64_t>(d);
    }
    return fallback;
}

double json_double(const Json::Value& obj, const char* key, double fallback) {
    if (!obj.isObject()) return fallback;
    const Json::Value& v = obj[key];
    return v.isNumeric() ? v.asDouble() : fallback;
}

bool json_bool(const Json::Value& obj, const char* key, bool fallback) {
    if (!obj.isObject()) return fallback;
    const Json::Value& v = obj[key];
    return v.isBool() ? v.asBool() : fallback;
}

} // namespace voxbridge
