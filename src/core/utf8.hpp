/**
 * utf8.hpp - Character-level helpers for UTF-8 word lists
 *
 * Word lengths, adaptive truncation and case transforms work on characters
 * (code points), not bytes. Malformed input is never rejected: a stray
 * continuation byte or a truncated sequence counts as one character.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace xkpass {

/**
 * Byte length of the character starting at `pos`, clamped to the input.
 */
inline size_t utf8_char_size(std::string_view text, size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t size = 1;
    if (lead >= 0xF0 && lead <= 0xF7) size = 4;
    else if (lead >= 0xE0) size = (lead <= 0xEF) ? 3 : 1;
    else if (lead >= 0xC0) size = 2;

    // Stop early at a byte that does not continue the sequence
    size_t i = 1;
    while (i < size && pos + i < text.size() &&
           (static_cast<unsigned char>(text[pos + i]) & 0xC0) == 0x80) {
        ++i;
    }
    return i;
}

/**
 * Number of characters in `text`.
 */
inline size_t utf8_length(std::string_view text) {
    size_t count = 0;
    for (size_t pos = 0; pos < text.size(); pos += utf8_char_size(text, pos)) {
        ++count;
    }
    return count;
}

/**
 * Byte offset where the character at index `chars` starts, or text.size()
 * if the text is shorter.
 */
inline size_t utf8_offset(std::string_view text, size_t chars) {
    size_t pos = 0;
    for (size_t n = 0; n < chars && pos < text.size(); ++n) {
        pos += utf8_char_size(text, pos);
    }
    return pos;
}

// -----------------------------------------------------------------------------
// Casing (ASCII and the Latin-1 Supplement letters)
// -----------------------------------------------------------------------------

/**
 * Uppercase the character at [pos, pos + size) in place. Only mappings that
 * keep the byte length are applied.
 */
inline void utf8_upper_at(std::string& text, size_t pos, size_t size) {
    auto& c = text[pos];
    if (size == 1) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
        return;
    }
    if (size == 2 && static_cast<unsigned char>(c) == 0xC3) {
        // U+00E0..U+00FE -> U+00C0..U+00DE, except the division sign
        auto& tail = text[pos + 1];
        const auto b = static_cast<unsigned char>(tail);
        if (b >= 0xA0 && b <= 0xBE && b != 0xB7) tail = static_cast<char>(b - 0x20);
    }
}

inline void utf8_lower_at(std::string& text, size_t pos, size_t size) {
    auto& c = text[pos];
    if (size == 1) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        return;
    }
    if (size == 2 && static_cast<unsigned char>(c) == 0xC3) {
        // U+00C0..U+00DE -> U+00E0..U+00FE, except the multiplication sign
        auto& tail = text[pos + 1];
        const auto b = static_cast<unsigned char>(tail);
        if (b >= 0x80 && b <= 0x9E && b != 0x97) tail = static_cast<char>(b + 0x20);
    }
}

}  // namespace xkpass
