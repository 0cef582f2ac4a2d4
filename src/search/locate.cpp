#include "search/locate.hpp"

#include "search/locator.hpp"
#include "text/utf8.hpp"

#include <charconv>
#include <optional>

namespace sublocator {

namespace {

// Argument checks, in the order they are reported. Any start location is
// acceptable: one before line 1 keeps every occurrence.
std::optional<LocateError> validate(std::string_view text, const SearchOptions& options) {
    if (!utf8::is_valid(text)) {
        return LocateError::make(ErrorKind::NotAString, "intended only for a UTF-8 string");
    }
    if (!options.at_most.is_valid()) {
        return LocateError::make(ErrorKind::InvalidAtMost,
                                 "at_most value must be greater than 0 or all, got {}",
                                 options.at_most.limit());
    }
    return std::nullopt;
}

bool parse_int(std::string_view digits, int64_t& out) {
    if (digits.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out);
    return ec == std::errc() && ptr == digits.data() + digits.size();
}

// Validate, normalize, then drain the locator through `collect`.
template <typename T, typename Collect>
LocateResult<T> run(std::string_view text, const Pattern& pattern, const SearchOptions& options,
                    Collect collect) {
    if (auto error = validate(text, options)) {
        return LocateResult<T>::err(std::move(*error));
    }

    auto matcher = pattern::normalize(pattern);
    if (!matcher) {
        return std::move(matcher).forward_error<T>();
    }

    search::Locator locator(text, matcher.value());
    return LocateResult<T>::ok(collect(locator, options));
}

} // namespace

LocateResult<std::vector<LocatedMatch>> locate_matches(std::string_view text,
                                                       const Pattern& pattern,
                                                       const SearchOptions& options) {
    return run<std::vector<LocatedMatch>>(text, pattern, options, search::filter_matches);
}

LocateResult<std::vector<Location>> locate(std::string_view text, const Pattern& pattern,
                                           const SearchOptions& options) {
    return run<std::vector<Location>>(text, pattern, options, search::filter_and_limit);
}

LocateResult<AtMost> parse_at_most(std::string_view value) {
    if (value == "all") {
        return LocateResult<AtMost>::ok(AtMost::all());
    }
    int64_t n = 0;
    if (!parse_int(value, n) || n <= 0) {
        return LocateResult<AtMost>::err(LocateError::make(
            ErrorKind::InvalidAtMost, "at_most value must be a positive integer or all, got '{}'",
            value));
    }
    return LocateResult<AtMost>::ok(AtMost::count(n));
}

LocateResult<Location> parse_location(std::string_view value) {
    auto fail = [&] {
        return LocateResult<Location>::err(LocateError::make(
            ErrorKind::InvalidStart, "start value must be written as line:col, got '{}'", value));
    };

    size_t colon = value.find(':');
    if (colon == std::string_view::npos) {
        return fail();
    }
    Location loc;
    if (!parse_int(value.substr(0, colon), loc.line) ||
        !parse_int(value.substr(colon + 1), loc.col) || !loc.is_well_formed()) {
        return fail();
    }
    return LocateResult<Location>::ok(loc);
}

} // namespace sublocator
