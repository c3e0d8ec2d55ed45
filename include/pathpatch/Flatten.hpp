/**
 * @file Flatten.hpp
 * @brief Flatten a document into key-path edits
 */

#ifndef PATHPATCH_FLATTEN_HPP
#define PATHPATCH_FLATTEN_HPP

#include "pathpatch/Value.hpp"

namespace pathpatch {

/**
 * @brief List every leaf of a document as a key path edit
 *
 * Leaves are scalars, null, and empty objects/arrays. Edits come out in
 * document order (object keys sorted, array elements ascending), so
 * applying them in sequence to an empty object rebuilds the document.
 *
 * Keys containing '.', '[' or ']', and empty keys, cannot be expressed in
 * the key-path grammar; their paths will not parse.
 *
 * @param document Document to flatten; a non-object yields no edits
 * @return Ordered (key path, value) pairs
 *
 * Example:
 * ```cpp
 * Value doc = {{"a", {{"b", 1}}}, {"tags", {"x", "y"}}};
 * flatten_to_key_paths(doc);
 * // → [("a.b", 1), ("tags[0]", "x"), ("tags[1]", "y")]
 * ```
 */
EditList flatten_to_key_paths(const Value& document);

} // namespace pathpatch

#endif // PATHPATCH_FLATTEN_HPP
