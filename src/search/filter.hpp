#pragma once

#include "common/location.hpp"
#include "search/locator.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace sublocator {
namespace search {

/// Cap on the number of locations returned: either all of them or a count.
class AtMost {
public:
    /// No cap.
    [[nodiscard]] static constexpr AtMost all() { return AtMost(std::nullopt); }

    /// At most `n` locations. Only positive counts pass validation.
    [[nodiscard]] static constexpr AtMost count(int64_t n) { return AtMost(n); }

    [[nodiscard]] constexpr bool is_all() const { return !limit_.has_value(); }
    [[nodiscard]] constexpr int64_t limit() const { return limit_.value_or(0); }
    [[nodiscard]] constexpr bool is_valid() const { return is_all() || *limit_ > 0; }

    [[nodiscard]] bool operator==(const AtMost&) const = default;

private:
    constexpr explicit AtMost(std::optional<int64_t> limit) : limit_(limit) {}

    std::optional<int64_t> limit_;
};

/// Per-call search settings.
struct SearchOptions {
    AtMost at_most = AtMost::all();
    Location start = Location::beginning(); // inclusive
};

/// True if `loc` is at or after `start` in document order.
[[nodiscard]] constexpr bool is_at_or_after(const Location& loc, const Location& start) {
    return loc.line > start.line || (loc.line == start.line && loc.col >= start.col);
}

/// Pull occurrences from the locator, drop those before options.start and
/// stop as soon as options.at_most have been kept.
[[nodiscard]] std::vector<LocatedMatch> filter_matches(Locator& locator,
                                                       const SearchOptions& options);

/// Same as filter_matches, keeping only the begin locations.
[[nodiscard]] std::vector<Location> filter_and_limit(Locator& locator,
                                                     const SearchOptions& options);

} // namespace search
} // namespace sublocator
