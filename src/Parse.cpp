/**
 * @file Parse.cpp
 * @brief Implementation of literal parsing
 */

#include "pathpatch/Parse.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <regex>

namespace pathpatch {

namespace {
    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    const std::regex& integer_pattern() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^-?[0-9]+(\\.[0-9]+)?([eE][+-]?[0-9]+)?$");
        return re;
    }

    /**
     * @brief JSON-parse str without throwing
     * @return The parsed value, or a discarded value on syntax error
     */
    Value try_parse_json(const std::string& str) {
        return Value::parse(str, nullptr, /*allow_exceptions=*/false);
    }
}

Value parse_value(const std::string& str) {
    // T7: empty string stays as string
    if (str.empty()) {
        return "";
    }

    // T1: Boolean
    const std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }

    // T2: Null
    if (lower == "null") {
        return nullptr;
    }

    // T3: Integer
    if (std::regex_match(str, integer_pattern())) {
        std::int64_t val = 0;
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
        if (ec == std::errc() && ptr == str.data() + str.size()) {
            return val;
        }
        // Out of int64 range: the JSON parse below keeps values up to
        // UINT64_MAX as unsigned integers and turns larger ones into floats
    }

    // T4: Float
    if (std::regex_match(str, float_pattern())) {
        Value parsed = try_parse_json(str);
        if (parsed.is_number()) {
            return parsed;
        }
    }

    // T5: JSON Compound (objects and arrays)
    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        Value parsed = try_parse_json(str);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    // T6: Quoted String
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = try_parse_json(str);
        if (parsed.is_string()) {
            return parsed;
        }
    }

    // T7: Raw String (fallback)
    return str;
}

} // namespace pathpatch
