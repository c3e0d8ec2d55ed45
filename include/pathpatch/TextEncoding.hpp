/**
 * @file TextEncoding.hpp
 * @brief Text encodings for JSON patch payloads
 *
 * A JSON patch can arrive as text (converted to bytes in a caller-chosen
 * encoding) or as raw bytes. Byte buffers are decoded by detecting their
 * encoding:
 * - Byte order mark (UTF-8, UTF-16LE/BE, UTF-32LE/BE)
 * - Otherwise the null-byte pattern of the first four bytes (RFC 4627 §3)
 * - Otherwise UTF-8
 */

#ifndef PATHPATCH_TEXT_ENCODING_HPP
#define PATHPATCH_TEXT_ENCODING_HPP

#include "pathpatch/Value.hpp"
#include "pathpatch/Result.hpp"
#include <optional>
#include <string>

namespace pathpatch {

/**
 * @brief Supported text encodings
 */
enum class TextEncoding {
    utf8,
    ascii,
    utf16le,
    utf16be,
    utf32le,
    utf32be
};

/**
 * @brief Look up an encoding by name (case-insensitive)
 *
 * Accepted names: "utf-8", "utf8", "ascii", "us-ascii", "utf-16le",
 * "utf16le", "utf-16be", "utf16be", "utf-32le", "utf32le", "utf-32be",
 * "utf32be".
 *
 * @return The encoding, or std::nullopt for an unknown name
 */
std::optional<TextEncoding> text_encoding_from_name(const std::string& name);

/**
 * @brief Canonical name of an encoding (e.g. "utf-16le")
 */
const char* to_string(TextEncoding encoding) noexcept;

/**
 * @brief Convert UTF-8 text to bytes in the given encoding
 *
 * No byte order mark is written.
 *
 * @param text UTF-8 text
 * @param encoding Target encoding
 * @return Encoded bytes, or serialization_failed if text is not valid
 *         UTF-8 or holds a character the encoding cannot represent
 */
Result<Bytes> encode_text(const std::string& text, TextEncoding encoding);

/**
 * @brief Parse a JSON document from bytes of any supported encoding
 *
 * @param bytes Encoded JSON text
 * @return Parsed value, or serialization_failed for malformed input
 */
Result<Value> parse_json_bytes(const Bytes& bytes);

} // namespace pathpatch

#endif // PATHPATCH_TEXT_ENCODING_HPP
