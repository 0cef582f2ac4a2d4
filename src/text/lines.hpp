#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace sublocator {
namespace text {

/// A line terminator found in a text: its byte offset and width.
/// width is 0 when no terminator was found.
struct Terminator {
    size_t offset = 0;
    size_t width  = 0;

    [[nodiscard]] bool found() const { return width != 0; }
};

/// Find the first line terminator at or after `from`. Terminators are "\r\n",
/// "\n" and "\r", with "\r\n" always taken as a single terminator.
[[nodiscard]] Terminator find_terminator(std::string_view text, size_t from);

/// One logical line of a text, without its terminator.
struct Line {
    std::string_view text;
    int64_t number; // 1-based
};

/// Split a text into its logical lines. A text with no terminator is one
/// line; a trailing terminator yields a final empty line.
[[nodiscard]] std::vector<Line> split_lines(std::string_view text);

} // namespace text
} // namespace sublocator
