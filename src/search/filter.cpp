#include "search/filter.hpp"

namespace sublocator {
namespace search {

std::vector<LocatedMatch> filter_matches(Locator& locator, const SearchOptions& options) {
    std::vector<LocatedMatch> kept;
    auto full = [&] {
        return !options.at_most.is_all() &&
               static_cast<int64_t>(kept.size()) >= options.at_most.limit();
    };

    while (!full()) {
        auto match = locator.next();
        if (!match) {
            break;
        }
        if (is_at_or_after(match->begin, options.start)) {
            kept.push_back(*match);
        }
    }
    return kept;
}

std::vector<Location> filter_and_limit(Locator& locator, const SearchOptions& options) {
    std::vector<Location> locations;
    for (const auto& match : filter_matches(locator, options)) {
        locations.push_back(match.begin);
    }
    return locations;
}

} // namespace search
} // namespace sublocator
