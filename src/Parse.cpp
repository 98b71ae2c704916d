/**
 * @file Parse.cpp
 * @brief Implementation of command-line value parsing
 */

#include "jptr/Parse.hpp"
#include <algorithm>
#include <cctype>

namespace jptr {

namespace {
    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return result;
    }
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    // allow_exceptions=false yields a discarded value instead of throwing
    Value parsed = Value::parse(str, nullptr, false);
    if (!parsed.is_discarded()) {
        return parsed;
    }

    return str;
}

} // namespace jptr
