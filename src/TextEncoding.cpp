/**
 * @file TextEncoding.cpp
 * @brief Implementation of payload text encodings
 */

#include "pathpatch/TextEncoding.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace pathpatch {

namespace {

    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    /**
     * @brief Decode one UTF-8 sequence starting at text[pos]
     *
     * Rejects truncated sequences, overlong forms, surrogates and code
     * points above U+10FFFF.
     *
     * @return false on malformed input; otherwise pos is advanced
     */
    bool next_code_point(const std::string& text, std::size_t& pos, char32_t& out) {
        const auto lead = static_cast<unsigned char>(text[pos]);
        std::size_t length = 0;
        char32_t cp = 0;
        char32_t min = 0;

        if (lead < 0x80) {
            out = lead;
            ++pos;
            return true;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2; cp = lead & 0x1F; min = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3; cp = lead & 0x0F; min = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4; cp = lead & 0x07; min = 0x10000;
        } else {
            return false;
        }

        if (pos + length > text.size()) return false;

        for (std::size_t i = 1; i < length; ++i) {
            const auto cont = static_cast<unsigned char>(text[pos + i]);
            if ((cont & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }

        out = cp;
        pos += length;
        return true;
    }

    void put_u16(Bytes& out, std::uint16_t unit, bool little_endian) {
        const auto lo = static_cast<std::uint8_t>(unit & 0xFF);
        const auto hi = static_cast<std::uint8_t>(unit >> 8);
        if (little_endian) {
            out.push_back(lo);
            out.push_back(hi);
        } else {
            out.push_back(hi);
            out.push_back(lo);
        }
    }

    void put_u32(Bytes& out, char32_t cp, bool little_endian) {
        const std::uint8_t b[4] = {
            static_cast<std::uint8_t>((cp >> 24) & 0xFF),
            static_cast<std::uint8_t>((cp >> 16) & 0xFF),
            static_cast<std::uint8_t>((cp >> 8) & 0xFF),
            static_cast<std::uint8_t>(cp & 0xFF)
        };
        if (little_endian) {
            out.insert(out.end(), {b[3], b[2], b[1], b[0]});
        } else {
            out.insert(out.end(), {b[0], b[1], b[2], b[3]});
        }
    }

    /**
     * @brief Detect the encoding of a JSON byte buffer
     * @param bom_length Set to the length of a leading byte order mark
     */
    TextEncoding detect_encoding(const Bytes& bytes, std::size_t& bom_length) {
        const std::size_t n = bytes.size();
        auto at = [&](std::size_t i) -> int { return i < n ? bytes[i] : -1; };

        bom_length = 0;
        if (at(0) == 0xEF && at(1) == 0xBB && at(2) == 0xBF) {
            bom_length = 3;
            return TextEncoding::utf8;
        }
        if (at(0) == 0x00 && at(1) == 0x00 && at(2) == 0xFE && at(3) == 0xFF) {
            bom_length = 4;
            return TextEncoding::utf32be;
        }
        if (at(0) == 0xFF && at(1) == 0xFE && at(2) == 0x00 && at(3) == 0x00) {
            bom_length = 4;
            return TextEncoding::utf32le;
        }
        if (at(0) == 0xFE && at(1) == 0xFF) {
            bom_length = 2;
            return TextEncoding::utf16be;
        }
        if (at(0) == 0xFF && at(1) == 0xFE) {
            bom_length = 2;
            return TextEncoding::utf16le;
        }

        // RFC 4627: the first two characters of JSON text are ASCII
        if (n >= 4) {
            if (at(0) == 0 && at(1) == 0 && at(2) == 0) return TextEncoding::utf32be;
            if (at(1) == 0 && at(2) == 0 && at(3) == 0) return TextEncoding::utf32le;
            if (at(0) == 0 && at(2) == 0) return TextEncoding::utf16be;
            if (at(1) == 0 && at(3) == 0) return TextEncoding::utf16le;
        } else if (n >= 2) {
            if (at(0) == 0) return TextEncoding::utf16be;
            if (at(1) == 0) return TextEncoding::utf16le;
        }
        return TextEncoding::utf8;
    }

    template <typename Input>
    Result<Value> parse_json_input(const Input& input) {
        try {
            return Value::parse(input);
        } catch (const Value::parse_error&) {
            return PatchError::serialization_failed(std::current_exception());
        }
    }

} // anonymous namespace

std::optional<TextEncoding> text_encoding_from_name(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "utf-8" || lower == "utf8") return TextEncoding::utf8;
    if (lower == "ascii" || lower == "us-ascii") return TextEncoding::ascii;
    if (lower == "utf-16le" || lower == "utf16le") return TextEncoding::utf16le;
    if (lower == "utf-16be" || lower == "utf16be") return TextEncoding::utf16be;
    if (lower == "utf-32le" || lower == "utf32le") return TextEncoding::utf32le;
    if (lower == "utf-32be" || lower == "utf32be") return TextEncoding::utf32be;
    return std::nullopt;
}

const char* to_string(TextEncoding encoding) noexcept {
    switch (encoding) {
        case TextEncoding::utf8: return "utf-8";
        case TextEncoding::ascii: return "ascii";
        case TextEncoding::utf16le: return "utf-16le";
        case TextEncoding::utf16be: return "utf-16be";
        case TextEncoding::utf32le: return "utf-32le";
        case TextEncoding::utf32be: return "utf-32be";
    }
    return "unknown";
}

Result<Bytes> encode_text(const std::string& text, TextEncoding encoding) {
    Bytes out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        if (!next_code_point(text, pos, cp)) {
            return PatchError::serialization_failed(
                "Unable to convert patch string to data: invalid UTF-8 at byte " +
                std::to_string(pos));
        }

        switch (encoding) {
            case TextEncoding::utf8:
                break;

            case TextEncoding::ascii:
                if (cp > 0x7F) {
                    return PatchError::serialization_failed(
                        "Unable to convert patch string to data using encoding ascii");
                }
                out.push_back(static_cast<std::uint8_t>(cp));
                break;

            case TextEncoding::utf16le:
            case TextEncoding::utf16be: {
                const bool le = encoding == TextEncoding::utf16le;
                if (cp >= 0x10000) {
                    const char32_t v = cp - 0x10000;
                    put_u16(out, static_cast<std::uint16_t>(0xD800 + (v >> 10)), le);
                    put_u16(out, static_cast<std::uint16_t>(0xDC00 + (v & 0x3FF)), le);
                } else {
                    put_u16(out, static_cast<std::uint16_t>(cp), le);
                }
                break;
            }

            case TextEncoding::utf32le:
            case TextEncoding::utf32be:
                put_u32(out, cp, encoding == TextEncoding::utf32le);
                break;
        }
    }

    // Validated above; UTF-8 output is the input itself
    if (encoding == TextEncoding::utf8) {
        out.assign(text.begin(), text.end());
    }
    return out;
}

Result<Value> parse_json_bytes(const Bytes& bytes) {
    std::size_t bom_length = 0;
    const TextEncoding encoding = detect_encoding(bytes, bom_length);
    const std::size_t body = bytes.size() - bom_length;

    switch (encoding) {
        case TextEncoding::utf16le:
        case TextEncoding::utf16be: {
            if (body % 2 != 0) {
                return PatchError::serialization_failed(
                    "Truncated UTF-16 input: odd number of bytes");
            }
            const bool le = encoding == TextEncoding::utf16le;
            std::u16string text;
            text.reserve(body / 2);
            for (std::size_t i = bom_length; i < bytes.size(); i += 2) {
                const std::uint16_t a = bytes[i];
                const std::uint16_t b = bytes[i + 1];
                text.push_back(static_cast<char16_t>(le ? (b << 8) | a : (a << 8) | b));
            }
            return parse_json_input(text);
        }

        case TextEncoding::utf32le:
        case TextEncoding::utf32be: {
            if (body % 4 != 0) {
                return PatchError::serialization_failed(
                    "Truncated UTF-32 input: byte count not a multiple of four");
            }
            const bool le = encoding == TextEncoding::utf32le;
            std::u32string text;
            text.reserve(body / 4);
            for (std::size_t i = bom_length; i < bytes.size(); i += 4) {
                const char32_t b0 = bytes[i];
                const char32_t b1 = bytes[i + 1];
                const char32_t b2 = bytes[i + 2];
                const char32_t b3 = bytes[i + 3];
                text.push_back(le ? (b3 << 24) | (b2 << 16) | (b1 << 8) | b0
                                  : (b0 << 24) | (b1 << 16) | (b2 << 8) | b3);
            }
            return parse_json_input(text);
        }

        default:
            // nlohmann::json skips a UTF-8 byte order mark itself
            return parse_json_input(bytes);
    }
}

} // namespace pathpatch
