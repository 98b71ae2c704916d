/**
 * @file Value.hpp
 * @brief Value type addressed by JSON pointers
 *
 * Uses nlohmann::json as the underlying value model:
 * - Null (also stands for "absent" roots passed to set())
 * - Bool, Integer, Float, String
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef JPTR_VALUE_HPP
#define JPTR_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace jptr {

/**
 * @brief JSON-like value type traversed by pointer operations
 *
 * Alias for nlohmann::json. Pointer operations only rely on the container
 * API: is_object(), is_array(), find(), operator[], erase(), push_back().
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value can hold children (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace jptr

#endif // JPTR_VALUE_HPP
