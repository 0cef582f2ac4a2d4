#include "text/utf8.hpp"

namespace sublocator {
namespace utf8 {

namespace {

DecodedRune invalid_rune() {
    return DecodedRune{kReplacementChar, 1, false};
}

bool is_continuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

} // namespace

DecodedRune decode_rune(std::string_view text, size_t offset) {
    if (offset >= text.size()) {
        return invalid_rune();
    }
    size_t len = text.size();
    auto byte_at = [&](size_t i) { return static_cast<unsigned char>(text[i]); };

    unsigned char b0 = byte_at(offset);
    if (b0 < 0x80) {
        return DecodedRune{static_cast<char32_t>(b0), 1, true};
    }
    if ((b0 & 0xE0) == 0xC0 && offset + 1 < len) {
        unsigned char b1 = byte_at(offset + 1);
        if (is_continuation(b1)) {
            char32_t r = ((b0 & 0x1F) << 6) | (b1 & 0x3F);
            if (r >= 0x80) {
                return DecodedRune{r, 2, true};
            }
        }
    } else if ((b0 & 0xF0) == 0xE0 && offset + 2 < len) {
        unsigned char b1 = byte_at(offset + 1), b2 = byte_at(offset + 2);
        if (is_continuation(b1) && is_continuation(b2)) {
            char32_t r = ((b0 & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F);
            // Reject overlong forms and UTF-16 surrogates
            if (r >= 0x800 && (r < 0xD800 || r > 0xDFFF)) {
                return DecodedRune{r, 3, true};
            }
        }
    } else if ((b0 & 0xF8) == 0xF0 && offset + 3 < len) {
        unsigned char b1 = byte_at(offset + 1), b2 = byte_at(offset + 2), b3 = byte_at(offset + 3);
        if (is_continuation(b1) && is_continuation(b2) && is_continuation(b3)) {
            char32_t r = ((b0 & 0x07) << 18) | ((b1 & 0x3F) << 12)
                       | ((b2 & 0x3F) << 6)  | (b3 & 0x3F);
            if (r >= 0x10000 && r <= 0x10FFFF) {
                return DecodedRune{r, 4, true};
            }
        }
    }
    return invalid_rune();
}

int64_t codepoint_length(std::string_view text) {
    int64_t count = 0;
    size_t offset = 0;
    while (offset < text.size()) {
        unsigned char b = static_cast<unsigned char>(text[offset]);
        // ASCII fast path
        if (b < 0x80) {
            ++offset;
        } else {
            offset += decode_rune(text, offset).width;
        }
        ++count;
    }
    return count;
}

size_t rune_width_at(std::string_view text, size_t offset) {
    if (offset >= text.size()) {
        return 0;
    }
    return decode_rune(text, offset).width;
}

bool is_valid(std::string_view text) {
    size_t offset = 0;
    while (offset < text.size()) {
        auto decoded = decode_rune(text, offset);
        if (!decoded.valid) {
            return false;
        }
        offset += decoded.width;
    }
    return true;
}

} // namespace utf8
} // namespace sublocator
