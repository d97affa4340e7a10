/**
 * @file dashboard_api.cpp
 * @brief ApiRequest helpers.
 * @author Dimitris Kafetzis
 */

#include "api/dashboard_api.hpp"

namespace fleet_mirror {

// ── Payload field access ─────────────────────

std::string string_field(const Json::Value& object, const char* key, std::string fallback) {
    if (!object.isObject()) return fallback;
    const Json::Value& value = object[key];
    return value.isString() ? value.asString() : fallback;
}

std::optional<int64_t> integer_field(const Json::Value& object, const char* key) {
    if (!object.isObject()) return std::nullopt;
    const Json::Value& value = object[key];
    if (!value.isNumeric() || !value.isConvertibleTo(Json::intValue)) return std::nullopt;
    return value.asInt64();
}

std::optional<double> number_field(const Json::Value& object, const char* key) {
    if (!object.isObject()) return std::nullopt;
    const Json::Value& value = object[key];
    if (!value.isNumeric()) return std::nullopt;
    return value.asDouble();
}

// ── ApiRequest ───────────────────────────────

std::string ApiRequest::describe() const {
    std::string out = endpoint + "(";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += ", ";
        out += args[i];
    }
    out += ")";
    return out;
}

const std::string& ApiRequest::primary_arg() const noexcept {
    static const std::string empty;
    return args.empty() ? empty : args.front();
}

}  // namespace fleet_mirror
