#include "pattern/pattern.hpp"

#include "text/utf8.hpp"

#include <re2/re2.h>

#include <optional>

namespace sublocator {
namespace pattern {

namespace {

// Empty literals would match between every pair of codepoints.
std::optional<LocateError> check_literal(std::string_view text, std::string_view what) {
    if (text.empty()) {
        return LocateError::make(ErrorKind::PatternError, "{} must not be empty", what);
    }
    if (!utf8::is_valid(text)) {
        return LocateError::make(ErrorKind::PatternError, "{} must be a UTF-8 string", what);
    }
    return std::nullopt;
}

LocateResult<Matcher> normalize_literal(const Literal& literal) {
    if (auto error = check_literal(literal.text, "literal pattern")) {
        return LocateResult<Matcher>::err(std::move(*error));
    }
    return LocateResult<Matcher>::ok(literal);
}

LocateResult<Matcher> normalize_set(const LiteralSet& set) {
    if (set.items.empty()) {
        return LocateResult<Matcher>::err(
            LocateError::make(ErrorKind::PatternError, "literal set must not be empty"));
    }
    for (size_t i = 0; i < set.items.size(); ++i) {
        if (auto error = check_literal(set.items[i], fmt::format("literal set item {}", i))) {
            return LocateResult<Matcher>::err(std::move(*error));
        }
    }

    auto compiled = Regex::compile(alternation_source(set.items));
    if (!compiled) {
        return std::move(compiled).forward_error<Matcher>();
    }
    return LocateResult<Matcher>::ok(std::move(compiled).value());
}

LocateResult<Matcher> normalize_regex(const Regex& regex) {
    if (!regex.ok()) {
        return LocateResult<Matcher>::err(LocateError::make(
            ErrorKind::PatternError, "regular expression did not compile: {}", regex.error()));
    }
    return LocateResult<Matcher>::ok(regex);
}

} // namespace

std::string alternation_source(const std::vector<std::string>& items) {
    std::string source = "(?:";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            source += '|';
        }
        source += RE2::QuoteMeta(re2::StringPiece(items[i].data(), items[i].size()));
    }
    source += ')';
    return source;
}

LocateResult<Matcher> normalize(const Pattern& pattern) {
    if (const auto* literal = std::get_if<Literal>(&pattern)) {
        return normalize_literal(*literal);
    }
    if (const auto* set = std::get_if<LiteralSet>(&pattern)) {
        return normalize_set(*set);
    }
    return normalize_regex(std::get<Regex>(pattern));
}

} // namespace pattern
} // namespace sublocator
