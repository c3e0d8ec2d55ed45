/**
 * @file Reconcile.cpp
 * @brief Implementation of structural patch reconciliation
 */

#include "pathpatch/Reconcile.hpp"
#include <cmath>
#include <utility>

namespace pathpatch {

namespace {

    /**
     * @brief Recursive helper for apply_edit
     *
     * current is owned by this frame; the child being edited is moved out
     * of it, rebuilt one level down and moved back in.
     */
    Result<Value> apply_at(Value current, const KeyPath& components, std::size_t position,
                           Value value, const std::string& key_path) {
        if (position == components.size()) {
            return sanitize_value(std::move(value), current);
        }

        const auto& component = components[position];

        if (component.is_key()) {
            if (current.is_null()) {
                current = Value::object();
            } else if (!current.is_object()) {
                return PatchError::invalid_key_path(key_path);
            }

            Value existing;
            auto it = current.find(component.key());
            if (it != current.end()) {
                existing = std::move(*it);
            }

            auto updated = apply_at(std::move(existing), components, position + 1,
                                    std::move(value), key_path);
            if (!updated) {
                return updated.error();
            }
            current[component.key()] = std::move(*updated);
            return current;
        }

        if (current.is_null()) {
            current = Value::array();
        } else if (!current.is_array()) {
            return PatchError::invalid_key_path(key_path);
        }

        const std::size_t index = component.index();
        const std::size_t count = current.size();

        // Arrays grow by at most one slot per edit
        if (index > count) {
            return PatchError::index_out_of_bounds(key_path, index);
        }

        Value existing;
        if (index < count) {
            existing = std::move(current[index]);
        }

        auto updated = apply_at(std::move(existing), components, position + 1,
                                std::move(value), key_path);
        if (!updated) {
            return updated.error();
        }

        if (index == count) {
            current.push_back(std::move(*updated));
        } else {
            current[index] = std::move(*updated);
        }
        return current;
    }

    /**
     * @brief Find the first value inside v that has no JSON text form
     * @return Description of the offending value, empty if none
     */
    std::string find_incompatible(const Value& v) {
        switch (v.type()) {
            case Value::value_t::number_float:
                if (!std::isfinite(v.get<double>())) {
                    return "non-finite number";
                }
                return "";

            case Value::value_t::binary:
                return "binary value";

            case Value::value_t::discarded:
                return "discarded value";

            case Value::value_t::array:
            case Value::value_t::object:
                for (const auto& child : v) {
                    std::string found = find_incompatible(child);
                    if (!found.empty()) return found;
                }
                return "";

            default:
                return "";
        }
    }

    template <typename Edits>
    Result<Value> fold_edits(Value root, const Edits& edits) {
        if (!root.is_object()) {
            return PatchError::invalid_root_object();
        }

        for (const auto& [key_path, value] : edits) {
            auto compatible = ensure_json_compatible(value, key_path);
            if (!compatible) {
                return compatible.error();
            }

            auto components = parse_key_path(key_path);
            if (!components) {
                return components.error();
            }

            auto updated = apply_edit(std::move(root), *components, value, key_path);
            if (!updated) {
                return updated.error();
            }
            root = std::move(*updated);
        }

        return root;
    }

} // anonymous namespace

Value sanitize_value(Value incoming, const Value& existing) {
    if (existing.is_string() && !incoming.is_string() && !incoming.is_null()) {
        return incoming.dump();
    }
    return incoming;
}

Result<Value> apply_edit(Value current, const KeyPath& components, Value value,
                         const std::string& key_path) {
    return apply_at(std::move(current), components, 0, std::move(value), key_path);
}

Result<void> ensure_json_compatible(const Value& value, const std::string& key_path) {
    std::string found = find_incompatible(value);
    if (!found.empty()) {
        const std::string subject =
            key_path.empty() ? "Value" : "Value for key path '" + key_path + "'";
        return PatchError::serialization_failed(subject + " is not JSON-compatible: " + found);
    }
    return {};
}

Result<Value> apply_patch_set(Value root, const PatchSet& patch_set) {
    return fold_edits(std::move(root), patch_set);
}

Result<Value> apply_edit_list(Value root, const EditList& edits) {
    return fold_edits(std::move(root), edits);
}

} // namespace pathpatch
