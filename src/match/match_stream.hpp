#pragma once

#include "pattern/pattern.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace sublocator {
namespace match {

/// One occurrence: the text since the end of the previous occurrence, and the
/// matched text itself. Consecutive spans cover the input without gaps.
struct MatchSpan {
    std::string_view preceding;
    std::string_view matched;
    size_t offset; // byte offset of `matched` in the input
};

/// Produces the occurrences of a matcher in a text, in document order, one at
/// a time. The whole text is scanned in a single forward pass, so regular
/// expressions may match across line terminators.
///
/// A zero-width match is reported like any other; the next search then
/// resumes one codepoint further so the stream always makes progress. An
/// empty match never lands between the two bytes of a CRLF pair: it is moved
/// onto the '\r', or dropped when the '\r' was part of the previous match.
///
/// The stream borrows both the text and the matcher.
class MatchStream {
public:
    MatchStream(std::string_view text, const pattern::Matcher& matcher);
    MatchStream(std::string_view text, pattern::Matcher&& matcher) = delete;

    /// Get the next span, or nullopt once the text is exhausted.
    [[nodiscard]] std::optional<MatchSpan> next();

    /// Drain the stream and return every remaining span.
    [[nodiscard]] std::vector<MatchSpan> collect_all();

    /// True once next() has returned nullopt.
    [[nodiscard]] bool at_end() const { return done_; }

private:
    std::string_view text_;
    const pattern::Matcher& matcher_;
    size_t last_end_ = 0; // end of the previous match
    size_t search_   = 0; // where the next search starts
    bool done_       = false;

    // Locate the next occurrence at or after search_ as [begin, end).
    [[nodiscard]] bool find_next(size_t& begin, size_t& end);
    [[nodiscard]] bool splits_crlf(size_t pos) const;
    [[nodiscard]] bool find_literal(const pattern::Literal& literal, size_t& begin, size_t& end) const;
    [[nodiscard]] bool find_regex(const pattern::Regex& regex, size_t& begin, size_t& end) const;
};

} // namespace match
} // namespace sublocator
