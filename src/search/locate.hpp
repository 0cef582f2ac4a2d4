#pragma once

#include "common/error.hpp"
#include "common/location.hpp"
#include "search/filter.hpp"
#include "pattern/pattern.hpp"

#include <string_view>
#include <vector>

namespace sublocator {

using search::AtMost;
using search::SearchOptions;
using pattern::Literal;
using pattern::LiteralSet;
using pattern::Pattern;
using pattern::Regex;
using pattern::RegexOptions;

/// Find the line and column of every occurrence of `pattern` in `text`.
///
/// Locations are 1-based, columns counted in codepoints, and listed from top
/// to bottom, left to right. `options.at_most` caps how many are returned and
/// `options.start` drops those before a given location.
///
/// Arguments are checked before any scanning, in this order:
///   text is not valid UTF-8       -> NotAString
///   at_most is a count below 1    -> InvalidAtMost
///   pattern cannot be normalized  -> PatternError
[[nodiscard]] LocateResult<std::vector<Location>> locate(std::string_view text,
                                                         const Pattern& pattern,
                                                         const SearchOptions& options = {});

/// Like locate(), but each result also carries the end location and the
/// matched text.
[[nodiscard]] LocateResult<std::vector<LocatedMatch>> locate_matches(
    std::string_view text, const Pattern& pattern, const SearchOptions& options = {});

/// Parse an at_most value: "all" or a positive decimal integer.
[[nodiscard]] LocateResult<AtMost> parse_at_most(std::string_view value);

/// Parse a start location written as "line:col" with non-negative fields.
/// Anything else is InvalidStart.
[[nodiscard]] LocateResult<Location> parse_location(std::string_view value);

} // namespace sublocator
