#pragma once

#include "common/location.hpp"

#include <cstddef>
#include <string_view>

namespace sublocator {
namespace text {

/// Where the cursor stands after consuming `slice` from `cursor`.
///
/// With k line terminators in the slice and `tail` codepoints after the last
/// one (or in the whole slice when k == 0):
///   k == 0: {line, col + tail}
///   k >  0: {line + k, tail + kColumnOffset}
[[nodiscard]] Location advance(Location cursor, std::string_view slice);

/// Result of positioning one match.
struct SlicePosition {
    Location begin; // reported location of the match
    Location next;  // cursor carried into the following span
};

/// Advance through `preceding` to find where the match begins, then through
/// `matched` to find where the following span starts.
[[nodiscard]] SlicePosition locate_slice(Location cursor, std::string_view preceding,
                                         std::string_view matched);

/// Running (line, col) accumulator threaded left to right across a text.
/// Never rewinds.
///
/// The cursor is handed consecutive slices of `text`, starting at its first
/// byte. Knowing the whole text lets it see a "\r\n" pair that is split
/// between two slices: the '\r' then counts as an ordinary codepoint and the
/// '\n' that opens the next slice ends the line, so the pair is one
/// terminator and the two halves keep distinct locations.
class LineCursor {
public:
    explicit LineCursor(std::string_view text) : text_(text) {}

    /// Consume the next slice and return the new cursor position.
    Location advance(std::string_view slice);

    /// Consume the text preceding a match and the match itself. Returns the
    /// location at which the match begins.
    Location locate_slice(std::string_view preceding, std::string_view matched);

    [[nodiscard]] Location position() const { return cursor_; }

private:
    std::string_view text_;
    size_t offset_   = 0;
    Location cursor_ = Location::first();
};

} // namespace text
} // namespace sublocator
