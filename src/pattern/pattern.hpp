#pragma once

#include "common/error.hpp"
#include "pattern/regex.hpp"

#include <string>
#include <variant>
#include <vector>

namespace sublocator {
namespace pattern {

/// A single literal string, matched by exact substring search.
struct Literal {
    std::string text;
};

/// An ordered set of literal strings. Where two items could match at the same
/// offset, the one listed first wins.
struct LiteralSet {
    std::vector<std::string> items;
};

/// What the caller searches for.
using Pattern = std::variant<Literal, LiteralSet, Regex>;

/// What the match stream actually runs: a literal or a compiled regex.
using Matcher = std::variant<Literal, Regex>;

/// Build the alternation source for a literal set: every item escaped, joined
/// with '|' in the given order and wrapped in a non-capturing group.
[[nodiscard]] std::string alternation_source(const std::vector<std::string>& items);

/// Turn a pattern into a matcher.
///   Literal    -> passed through (must be non-empty UTF-8)
///   LiteralSet -> one compiled alternation (items must be non-empty UTF-8)
///   Regex      -> passed through (must have compiled)
/// Fails with PatternError otherwise.
[[nodiscard]] LocateResult<Matcher> normalize(const Pattern& pattern);

} // namespace pattern
} // namespace sublocator
