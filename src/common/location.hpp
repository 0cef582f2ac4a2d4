#pragma once

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace sublocator {

/// Columns are reported 1-based; a cursor at the first codepoint of a line
/// sits at column kColumnOffset.
inline constexpr int64_t kColumnOffset = 1;

/// A position in a text: 1-based line and 1-based column, the column counted
/// in Unicode codepoints from the start of its line.
struct Location {
    int64_t line = 0;
    int64_t col  = 0;

    /// Build a location from a line and a column.
    [[nodiscard]] static constexpr Location make(int64_t line, int64_t col) {
        return Location{line, col};
    }

    /// The "beginning of document" sentinel {0, 0}. Compares less than every
    /// real location.
    [[nodiscard]] static constexpr Location beginning() { return Location{0, 0}; }

    /// The position of the first codepoint of a document.
    [[nodiscard]] static constexpr Location first() { return Location{1, kColumnOffset}; }

    /// True if both fields are non-negative. The sentinel is well-formed.
    [[nodiscard]] constexpr bool is_well_formed() const { return line >= 0 && col >= 0; }

    [[nodiscard]] std::string to_string() const {
        return std::to_string(line) + ":" + std::to_string(col);
    }

    [[nodiscard]] bool operator==(const Location&) const = default;
    [[nodiscard]] auto operator<=>(const Location&) const = default;
};

/// A matched occurrence: where it begins, where the cursor stands after it
/// (exclusive end), and the matched text itself.
struct LocatedMatch {
    Location begin;
    Location end;
    std::string_view text;
};

} // namespace sublocator

template <>
struct fmt::formatter<sublocator::Location> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const sublocator::Location& loc, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}:{}", loc.line, loc.col);
    }
};
