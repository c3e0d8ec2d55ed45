/**
 * @file KeyPath.cpp
 * @brief Implementation of the key-path grammar
 */

#include "pathpatch/KeyPath.hpp"
#include <charconv>
#include <sstream>

namespace pathpatch {

namespace {
    bool is_ascii_digit(char c) {
        return c >= '0' && c <= '9';
    }

    /**
     * @brief Convert accumulated bracket digits to an index
     * @return false if digits is empty or overflows std::size_t
     */
    bool parse_index(const std::string& digits, std::size_t& out) {
        if (digits.empty()) return false;
        const char* first = digits.data();
        const char* last = first + digits.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc() && ptr == last;
    }
}

Result<KeyPath> parse_key_path(const std::string& path) {
    if (path.empty()) {
        return PatchError::invalid_key_path(path);
    }

    KeyPath components;
    std::string current_key;
    std::string current_index;
    bool parsing_index = false;

    for (char c : path) {
        switch (c) {
            case '.':
                if (parsing_index || current_key.empty()) {
                    return PatchError::invalid_key_path(path);
                }
                components.push_back(PathComponent::make_key(current_key));
                current_key.clear();
                break;

            case '[':
                if (parsing_index) {
                    return PatchError::invalid_key_path(path);
                }
                if (!current_key.empty()) {
                    components.push_back(PathComponent::make_key(current_key));
                    current_key.clear();
                }
                parsing_index = true;
                break;

            case ']': {
                std::size_t index = 0;
                if (!parsing_index || !parse_index(current_index, index)) {
                    return PatchError::invalid_key_path(path);
                }
                components.push_back(PathComponent::make_index(index));
                current_index.clear();
                parsing_index = false;
                break;
            }

            default:
                if (parsing_index) {
                    if (!is_ascii_digit(c)) {
                        return PatchError::invalid_key_path(path);
                    }
                    current_index += c;
                } else {
                    current_key += c;
                }
                break;
        }
    }

    // Unterminated bracket
    if (parsing_index) {
        return PatchError::invalid_key_path(path);
    }

    if (!current_key.empty()) {
        components.push_back(PathComponent::make_key(current_key));
    } else if (path.back() == '.') {
        // Trailing empty segment ("a.", "a[0].")
        return PatchError::invalid_key_path(path);
    }

    if (components.empty() || !components.front().is_key()) {
        return PatchError::invalid_key_path(path);
    }

    return components;
}

std::string format_key_path(const KeyPath& components) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& component : components) {
        if (component.is_key()) {
            if (!first) oss << '.';
            oss << component.key();
        } else {
            oss << '[' << component.index() << ']';
        }
        first = false;
    }
    return oss.str();
}

Result<const Value*> find_by_key_path(const Value& root, const std::string& path) {
    auto parsed = parse_key_path(path);
    if (!parsed) {
        return parsed.error();
    }

    const Value* current = &root;

    for (const auto& component : *parsed) {
        if (current->is_null()) {
            return static_cast<const Value*>(nullptr);
        }

        if (component.is_key()) {
            if (!current->is_object()) {
                return PatchError::invalid_key_path(path);
            }
            auto it = current->find(component.key());
            if (it == current->end()) {
                return static_cast<const Value*>(nullptr);
            }
            current = &(*it);
        } else {
            if (!current->is_array()) {
                return PatchError::invalid_key_path(path);
            }
            if (component.index() >= current->size()) {
                return static_cast<const Value*>(nullptr);
            }
            current = &(*current)[component.index()];
        }
    }

    return current;
}

} // namespace pathpatch
