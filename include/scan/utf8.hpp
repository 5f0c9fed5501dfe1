#pragma once

// UTF-8 code point decoding and the Unicode White_Space property.

#include <cstddef>
#include <string_view>

namespace scan {

// ============================================================================
// code_point - one decoded scalar value and its encoded length in bytes
// ============================================================================

struct code_point {
    char32_t value = 0;
    std::size_t length = 0; // 0 when the bytes at the offset are not valid UTF-8
};

/**
 * Decode the code point starting at `text[offset]`.
 *
 * Rejects stray continuation bytes, truncated sequences, overlong forms,
 * surrogates and values above U+10FFFF by returning length 0.
 */
inline auto decode_utf8(std::string_view text, std::size_t offset) -> code_point {
    if (offset >= text.size()) return {};

    auto lead = static_cast<unsigned char>(text[offset]);
    auto length = std::size_t{0};
    auto value = char32_t{0};
    auto min_value = char32_t{0};

    if (lead < 0x80) {
        return {lead, 1};
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2; value = lead & 0x1F; min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; value = lead & 0x0F; min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; value = lead & 0x07; min_value = 0x10000;
    } else {
        return {};
    }

    if (offset + length > text.size()) return {};

    for (std::size_t k = 1; k < length; ++k) {
        auto byte = static_cast<unsigned char>(text[offset + k]);
        if ((byte & 0xC0) != 0x80) return {};
        value = (value << 6) | (byte & 0x3F);
    }

    if (value < min_value) return {};
    if (value >= 0xD800 && value <= 0xDFFF) return {};
    if (value > 0x10FFFF) return {};

    return {value, length};
}

// Unicode White_Space property
inline auto is_unicode_space(char32_t c) -> bool {
    switch (c) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x0020: case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

} // namespace scan
