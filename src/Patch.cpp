/**
 * @file Patch.cpp
 * @brief Non-template parts of the patch functions
 */

#include "pathpatch/Patch.hpp"

namespace pathpatch {

Result<PatchSet> parse_patch_set(const Bytes& bytes) {
    auto parsed = parse_json_bytes(bytes);
    if (!parsed) {
        return parsed.error();
    }

    if (!parsed->is_object()) {
        return PatchError::invalid_root_object();
    }

    PatchSet patch_set;
    for (auto it = parsed->begin(); it != parsed->end(); ++it) {
        patch_set.emplace(it.key(), std::move(it.value()));
    }
    return patch_set;
}

} // namespace pathpatch
