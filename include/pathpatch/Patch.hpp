/**
 * @file Patch.hpp
 * @brief Apply key-path patches to typed records
 *
 * Every call runs the same sequence:
 * 1. Encode the record to a document (must be an object)
 * 2. Apply each path/value edit to the accumulated document
 * 3. Decode the final document back into the record type
 *
 * A call is all-or-nothing: the first failure is returned and no partially
 * patched record is ever produced or assigned.
 *
 * Example:
 * ```cpp
 * auto patched = patch(user, {{"name", "Jamie"}, {"tags[2]", "server"}});
 * if (!patched) {
 *     std::cerr << patched.error().message() << "\n";
 * }
 * ```
 */

#ifndef PATHPATCH_PATCH_HPP
#define PATHPATCH_PATCH_HPP

#include "pathpatch/Value.hpp"
#include "pathpatch/Result.hpp"
#include "pathpatch/Configuration.hpp"
#include "pathpatch/Reconcile.hpp"
#include "pathpatch/TextEncoding.hpp"
#include <exception>
#include <string>
#include <utility>

namespace pathpatch {

/**
 * @brief Parse a JSON payload into a patch set
 *
 * @param bytes JSON text in any supported encoding
 * @return Patch set, serialization_failed for malformed JSON, or
 *         invalid_root_object if the payload is not a JSON object
 */
Result<PatchSet> parse_patch_set(const Bytes& bytes);

namespace detail {

template <typename Record>
Result<Value> encode_record(const Record& record, const Configuration<Record>& config) {
    Value document;
    try {
        document = config.encoder(record);
    } catch (...) {
        return PatchError::encoding_failed(std::current_exception());
    }
    if (!document.is_object()) {
        return PatchError::invalid_root_object();
    }
    // NaN and infinities have no JSON text form
    auto compatible = ensure_json_compatible(document, "");
    if (!compatible) {
        return PatchError::encoding_failed(compatible.error().cause());
    }
    return document;
}

template <typename Record>
Result<Record> decode_record(const Value& document, const Configuration<Record>& config) {
    try {
        return config.decoder(document);
    } catch (...) {
        return PatchError::decoding_failed(std::current_exception());
    }
}

} // namespace detail

/**
 * @brief Return a copy of record with the patch applied
 *
 * @param record Record to patch; never modified
 * @param patch_set Key path -> replacement value
 * @param config Encoder/decoder for Record
 * @return Patched record, or the first error encountered
 */
template <typename Record>
Result<Record> patch(const Record& record, const PatchSet& patch_set,
                     const Configuration<Record>& config = Configuration<Record>::defaults()) {
    auto document = detail::encode_record(record, config);
    if (!document) {
        return document.error();
    }

    auto patched = apply_patch_set(std::move(*document), patch_set);
    if (!patched) {
        return patched.error();
    }

    return detail::decode_record(*patched, config);
}

/**
 * @brief Apply the patch to record in place
 *
 * record is assigned only if the whole patch succeeds; on failure it is
 * left untouched.
 */
template <typename Record>
Result<void> apply_patch(Record& record, const PatchSet& patch_set,
                         const Configuration<Record>& config = Configuration<Record>::defaults()) {
    auto patched = patch(record, patch_set, config);
    if (!patched) {
        return patched.error();
    }
    record = std::move(*patched);
    return {};
}

/**
 * @brief Return a copy of record with a JSON-encoded patch applied
 *
 * @param record Record to patch; never modified
 * @param json_bytes JSON object mapping key paths to values, in UTF-8,
 *                   UTF-16 or UTF-32 (detected)
 * @param config Encoder/decoder for Record
 */
template <typename Record>
Result<Record> patch_json(const Record& record, const Bytes& json_bytes,
                          const Configuration<Record>& config = Configuration<Record>::defaults()) {
    auto patch_set = parse_patch_set(json_bytes);
    if (!patch_set) {
        return patch_set.error();
    }
    return patch(record, *patch_set, config);
}

/**
 * @brief Return a copy of record with a JSON text patch applied
 *
 * The text is first converted to bytes using encoding; a character the
 * encoding cannot represent is serialization_failed.
 *
 * Example:
 * ```cpp
 * auto patched = patch_json(user, R"({"name": "Jordan", "profile.address.city": "San Francisco"})");
 * ```
 */
template <typename Record>
Result<Record> patch_json(const Record& record, const std::string& json_text,
                          TextEncoding encoding = TextEncoding::utf8,
                          const Configuration<Record>& config = Configuration<Record>::defaults()) {
    auto bytes = encode_text(json_text, encoding);
    if (!bytes) {
        return bytes.error();
    }
    return patch_json(record, *bytes, config);
}

} // namespace pathpatch

#endif // PATHPATCH_PATCH_HPP
