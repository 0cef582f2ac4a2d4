#include "search/locator.hpp"

namespace sublocator {
namespace search {

Locator::Locator(std::string_view text, const pattern::Matcher& matcher)
    : stream_(text, matcher), cursor_(text) {}

std::optional<LocatedMatch> Locator::next() {
    auto span = stream_.next();
    if (!span) {
        return std::nullopt;
    }
    Location begin = cursor_.locate_slice(span->preceding, span->matched);
    ++produced_;
    return LocatedMatch{begin, cursor_.position(), span->matched};
}

} // namespace search
} // namespace sublocator
