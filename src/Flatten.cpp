/**
 * @file Flatten.cpp
 * @brief Implementation of document flattening
 */

#include "pathpatch/Flatten.hpp"

namespace pathpatch {

namespace {
    void flatten_into(const Value& node, const std::string& prefix, EditList& out) {
        if (node.is_object() && !node.empty()) {
            for (auto it = node.begin(); it != node.end(); ++it) {
                flatten_into(it.value(), prefix + "." + it.key(), out);
            }
        } else if (node.is_array() && !node.empty()) {
            for (std::size_t i = 0; i < node.size(); ++i) {
                flatten_into(node[i], prefix + "[" + std::to_string(i) + "]", out);
            }
        } else {
            out.emplace_back(prefix, node);
        }
    }
}

EditList flatten_to_key_paths(const Value& document) {
    EditList out;
    if (!document.is_object()) {
        return out;
    }

    for (auto it = document.begin(); it != document.end(); ++it) {
        flatten_into(it.value(), it.key(), out);
    }
    return out;
}

} // namespace pathpatch
