/**
 * @file Reconcile.hpp
 * @brief Structural patch reconciliation on document trees
 *
 * Reconciliation rules:
 * - Absent and null nodes act as empty containers of whatever kind the
 *   next component needs (missing intermediates are created)
 * - A key component on a non-object, or an index component on a
 *   non-array, is invalid_key_path
 * - An index may replace an element or append exactly one element;
 *   anything further is index_out_of_bounds
 * - Replacing an existing string with a non-string, non-null value stores
 *   the value's text (see sanitize_value)
 * - Null is stored verbatim and means "clear this field"
 */

#ifndef PATHPATCH_RECONCILE_HPP
#define PATHPATCH_RECONCILE_HPP

#include "pathpatch/Value.hpp"
#include "pathpatch/KeyPath.hpp"
#include "pathpatch/Result.hpp"
#include <string>

namespace pathpatch {

/**
 * @brief Apply the string-coercion rule to a replacement value
 *
 * @param incoming Replacement value
 * @param existing Value currently stored at the slot (null if absent)
 * @return incoming, or its text when existing is a string and incoming
 *         is neither a string nor null
 *
 * Examples:
 * - sanitize_value(35, "Taylor")      → "35"
 * - sanitize_value(true, "x")         → "true"
 * - sanitize_value(nullptr, "x")      → null
 * - sanitize_value("35", 12)          → "35"
 * - sanitize_value(35, 12)            → 35
 */
Value sanitize_value(Value incoming, const Value& existing);

/**
 * @brief Apply one edit to a document
 *
 * @param current Document to edit; consumed, pass a copy to keep the original
 * @param components Parsed key path
 * @param value Replacement value for the addressed slot
 * @param key_path Original path string, used in error values
 * @return The edited document, or invalid_key_path / index_out_of_bounds
 *
 * Example:
 * ```cpp
 * Value doc = {{"tags", {"swift", "ios"}}};
 * auto path = parse_key_path("tags[2]");
 * auto result = apply_edit(doc, *path, "server", "tags[2]");
 * // *result == {"tags": ["swift", "ios", "server"]}, doc unchanged
 * ```
 */
Result<Value> apply_edit(Value current, const KeyPath& components, Value value,
                         const std::string& key_path);

/**
 * @brief Check that a value can be written as standard JSON
 *
 * Rejects non-finite numbers, binary values and discarded values anywhere
 * inside value.
 *
 * @param value Value to check
 * @param key_path Path the value is destined for, used in the error cause;
 *                 empty for a whole document
 * @return Success, or serialization_failed
 */
Result<void> ensure_json_compatible(const Value& value, const std::string& key_path);

/**
 * @brief Fold a patch set over a document
 *
 * Entries are applied in key order, each against the result of the
 * previous one. The first failure aborts the fold.
 *
 * @param root Document to patch; must be an object
 * @param patch_set Path -> value mapping
 * @return Patched document, or the first error encountered
 *         (invalid_root_object if root is not an object)
 */
Result<Value> apply_patch_set(Value root, const PatchSet& patch_set);

/**
 * @brief Fold an ordered edit list over a document
 *
 * Same as apply_patch_set but applies edits in list order, so an edit may
 * depend on an earlier one ("tags[2]" then "tags[3]").
 */
Result<Value> apply_edit_list(Value root, const EditList& edits);

} // namespace pathpatch

#endif // PATHPATCH_RECONCILE_HPP
