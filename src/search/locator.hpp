#pragma once

#include "common/location.hpp"
#include "match/match_stream.hpp"
#include "pattern/pattern.hpp"
#include "text/line_cursor.hpp"

#include <optional>
#include <string_view>

namespace sublocator {
namespace search {

/// Folds the match stream through a line cursor, yielding the location of
/// every occurrence in document order. Work is done one occurrence per call
/// to next(); nothing is matched ahead of the caller.
class Locator {
public:
    Locator(std::string_view text, const pattern::Matcher& matcher);
    Locator(std::string_view text, pattern::Matcher&& matcher) = delete;

    /// Get the next located occurrence, or nullopt when there are no more.
    [[nodiscard]] std::optional<LocatedMatch> next();

    /// Number of occurrences produced so far.
    [[nodiscard]] size_t produced() const { return produced_; }

private:
    match::MatchStream stream_;
    text::LineCursor cursor_;
    size_t produced_ = 0;
};

} // namespace search
} // namespace sublocator
