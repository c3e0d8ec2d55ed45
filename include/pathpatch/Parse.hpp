/**
 * @file Parse.hpp
 * @brief String-to-Value parsing for command-line patch literals
 *
 * Converts the VALUE half of a "PATH=VALUE" edit into a typed Value.
 *
 * Parsing order (first match wins):
 * - T1: Boolean ("true", "false" - case insensitive)
 * - T2: Null ("null" - case insensitive)
 * - T3: Integer (matches ^-?[0-9]+$ and fits int64)
 * - T4: Float (matches ^-?[0-9]+(\.[0-9]+)?([eE][+-]?[0-9]+)?$)
 * - T5: JSON Compound ({...} or [...])
 * - T6: Quoted String ("..." with JSON escapes)
 * - T7: Raw String (fallback)
 */

#ifndef PATHPATCH_PARSE_HPP
#define PATHPATCH_PARSE_HPP

#include "pathpatch/Value.hpp"
#include <string>

namespace pathpatch {

/**
 * @brief Parse string value to appropriate type
 *
 * @param str Input string to parse
 * @return Parsed Value with appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("true")       // → true (boolean)
 * parse_value("NULL")       // → null
 * parse_value("42")         // → 42 (integer)
 * parse_value("-2.5e10")    // → -2.5e10 (float)
 * parse_value("[1,2,3]")    // → [1, 2, 3] (array)
 * parse_value("\"42\"")     // → "42" (string, unquoted)
 * parse_value("server")     // → "server" (string)
 * parse_value("")           // → "" (empty string)
 * ```
 */
Value parse_value(const std::string& str);

} // namespace pathpatch

#endif // PATHPATCH_PARSE_HPP
