/**
 * @file Value.hpp
 * @brief Document value model for key-path patching
 *
 * Uses nlohmann::json as the underlying document tree:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef PATHPATCH_VALUE_HPP
#define PATHPATCH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pathpatch {

/**
 * @brief Generic JSON-shaped document value
 *
 * An alias for nlohmann::json. Typed records are encoded into this tree,
 * patched structurally and decoded back.
 */
using Value = nlohmann::json;

/**
 * @brief Mapping of key path to replacement value for one patch call
 *
 * Entries are applied in key order. Two entries may share ancestry
 * ("a.b" and "a.c"); each is applied to the result of the previous one.
 */
using PatchSet = std::map<std::string, Value>;

/**
 * @brief Ordered sequence of key path edits
 *
 * Applied strictly in sequence. Unlike PatchSet, the same path may appear
 * more than once; the later edit wins.
 */
using EditList = std::vector<std::pair<std::string, Value>>;

/// Raw byte buffer holding encoded JSON text.
using Bytes = std::vector<std::uint8_t>;

} // namespace pathpatch

#endif // PATHPATCH_VALUE_HPP
