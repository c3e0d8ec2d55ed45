/**
 * @file KeyPath.hpp
 * @brief Key-path grammar: "profile.address.city", "tags[2]", "m[0][1].x"
 *
 * Grammar rules:
 * - A path is a non-empty sequence of '.'-separated key segments
 * - Each segment may be followed by zero or more "[<digits>]" suffixes
 * - Inside brackets only decimal digits are accepted
 * - Empty segments ("a..b", ".a", "a.") are rejected
 * - Unterminated or empty brackets ("a[1", "a[]") are rejected
 * - The first component must be a key ("[0].a" is rejected)
 *
 * Every violation yields ErrorKind::invalid_key_path carrying the
 * original path string.
 */

#ifndef PATHPATCH_KEYPATH_HPP
#define PATHPATCH_KEYPATH_HPP

#include "pathpatch/Value.hpp"
#include "pathpatch/Result.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace pathpatch {

/**
 * @brief One parsed unit of a key path: an object key or an array index
 */
class PathComponent {
public:
    enum class Kind { key, index };

    static PathComponent make_key(std::string name) {
        return PathComponent(Kind::key, std::move(name), 0);
    }

    static PathComponent make_index(std::size_t position) {
        return PathComponent(Kind::index, std::string(), position);
    }

    Kind kind() const noexcept { return kind_; }
    bool is_key() const noexcept { return kind_ == Kind::key; }
    bool is_index() const noexcept { return kind_ == Kind::index; }

    /// Key name. Empty for index components.
    const std::string& key() const noexcept { return key_; }

    /// Array position. Zero for key components.
    std::size_t index() const noexcept { return index_; }

    friend bool operator==(const PathComponent& a, const PathComponent& b) {
        return a.kind_ == b.kind_ && a.key_ == b.key_ && a.index_ == b.index_;
    }

    friend bool operator!=(const PathComponent& a, const PathComponent& b) {
        return !(a == b);
    }

private:
    PathComponent(Kind kind, std::string key, std::size_t index)
        : kind_(kind), key_(std::move(key)), index_(index) {}

    Kind kind_;
    std::string key_;
    std::size_t index_;
};

/// Ordered component sequence of one path; the first is always a key.
using KeyPath = std::vector<PathComponent>;

/**
 * @brief Parse a key path string into components
 *
 * @param path Path like "profile.address.city" or "tags[2]"
 * @return Components in left-to-right order, or invalid_key_path(path)
 *
 * Examples:
 * - "name"          → [Key(name)]
 * - "a.b[0][2].c"   → [Key(a), Key(b), Index(0), Index(2), Key(c)]
 * - "tags[x]"       → invalid_key_path("tags[x]")
 * - ""              → invalid_key_path("")
 */
Result<KeyPath> parse_key_path(const std::string& path);

/**
 * @brief Render components back to canonical path text
 *
 * Keys are joined with '.', indices appended as "[n]".
 *
 * Examples:
 * - [Key(a), Index(0), Key(b)] → "a[0].b"
 * - [] → ""
 */
std::string format_key_path(const KeyPath& components);

/**
 * @brief Look up the node addressed by a key path
 *
 * @param root Document to read
 * @param path Key path string
 * @return Pointer into root, nullptr if a key or index along the path is
 *         absent, or invalid_key_path(path) if the path is malformed or a
 *         component meets a value of the wrong container type
 *
 * Examples:
 * ```cpp
 * Value doc = {{"tags", {"swift", "ios"}}, {"id", 42}};
 * *find_by_key_path(doc, "tags[1]");   // → pointer to "ios"
 * *find_by_key_path(doc, "tags[7]");   // → nullptr
 * find_by_key_path(doc, "id.value");   // → invalid_key_path("id.value")
 * ```
 */
Result<const Value*> find_by_key_path(const Value& root, const std::string& path);

} // namespace pathpatch

#endif // PATHPATCH_KEYPATH_HPP
