#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sublocator {
namespace utf8 {

inline constexpr char32_t kReplacementChar = 0xFFFD;

/// Result of decoding one UTF-8 sequence.
struct DecodedRune {
    char32_t rune;
    uint32_t width; // bytes consumed, 1-4
    bool valid;
};

/// Decode one UTF-8 code point starting at text[offset].
/// Invalid or truncated sequences decode as U+FFFD with width 1.
[[nodiscard]] DecodedRune decode_rune(std::string_view text, size_t offset);

/// Number of codepoints in text. Each invalid byte counts as one codepoint.
[[nodiscard]] int64_t codepoint_length(std::string_view text);

/// Byte width of the codepoint starting at text[offset] (0 at end of text).
[[nodiscard]] size_t rune_width_at(std::string_view text, size_t offset);

/// True if text is well-formed UTF-8: no stray continuation bytes, no
/// overlong encodings, no surrogates, nothing above U+10FFFF.
[[nodiscard]] bool is_valid(std::string_view text);

} // namespace utf8
} // namespace sublocator
