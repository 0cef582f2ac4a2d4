#include "pattern/regex.hpp"

#include <re2/re2.h>

namespace sublocator {
namespace pattern {

LocateResult<Regex> Regex::compile(std::string_view source, const RegexOptions& options) {
    RE2::Options re2_options;
    re2_options.set_encoding(RE2::Options::EncodingUTF8);
    re2_options.set_case_sensitive(options.case_sensitive);
    re2_options.set_dot_nl(options.dot_matches_newline);
    // Failures are reported through the result, not RE2's logger
    re2_options.set_log_errors(false);

    auto program = std::make_shared<const RE2>(re2::StringPiece(source.data(), source.size()),
                                               re2_options);
    if (!program->ok()) {
        return LocateResult<Regex>::err(LocateError::make(
            ErrorKind::PatternError, "invalid regular expression '{}': {}", source,
            program->error()));
    }
    return LocateResult<Regex>::ok(Regex(std::move(program)));
}

bool Regex::ok() const {
    return program_ != nullptr && program_->ok();
}

std::string Regex::error() const {
    if (program_ == nullptr) {
        return "no compiled program";
    }
    return program_->ok() ? std::string() : program_->error();
}

std::string_view Regex::source() const {
    if (program_ == nullptr) {
        return {};
    }
    return program_->pattern();
}

} // namespace pattern
} // namespace sublocator
