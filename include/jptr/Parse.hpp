/**
 * @file Parse.hpp
 * @brief Command-line string to Value conversion
 *
 * Used by `jptr set` to type the VALUE argument. Rules, first match wins:
 * - "true"/"false"/"null" in any letter case → boolean / null
 * - Any other valid JSON text (numbers, strings in double quotes,
 *   objects, arrays) → the parsed JSON value
 * - Everything else → the raw string
 */

#ifndef JPTR_PARSE_HPP
#define JPTR_PARSE_HPP

#include "jptr/Value.hpp"
#include <string>

namespace jptr {

/**
 * @brief Parse string value to appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("TRUE")       // → true
 * parse_value("42")         // → 42
 * parse_value("-2.5e10")    // → -2.5e10
 * parse_value("[1,2]")      // → [1, 2]
 * parse_value("\"7\"")      // → "7" (string)
 * parse_value("hello")      // → "hello"
 * parse_value("")           // → ""
 * ```
 */
Value parse_value(const std::string& str);

} // namespace jptr

#endif // JPTR_PARSE_HPP
