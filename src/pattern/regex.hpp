#pragma once

#include "common/error.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace re2 {
class RE2;
} // namespace re2

namespace sublocator {
namespace pattern {

/// Options applied when compiling a regular expression.
struct RegexOptions {
    bool case_sensitive      = true;
    bool dot_matches_newline = false;
};

/// A compiled regular expression. The RE2 program is immutable and shared,
/// so copies are cheap and a Regex may be matched from several threads.
class Regex {
public:
    /// Wrap an already-built RE2 program. Its validity is checked when the
    /// pattern is normalized, not here.
    explicit Regex(std::shared_ptr<const re2::RE2> program) : program_(std::move(program)) {}

    /// Compile `source`. Fails with PatternError if RE2 rejects it.
    [[nodiscard]] static LocateResult<Regex> compile(std::string_view source,
                                                     const RegexOptions& options = {});

    /// True if the program compiled successfully.
    [[nodiscard]] bool ok() const;

    /// RE2's error message, empty when ok().
    [[nodiscard]] std::string error() const;

    /// The source text of the expression.
    [[nodiscard]] std::string_view source() const;

    [[nodiscard]] const re2::RE2& program() const { return *program_; }

private:
    std::shared_ptr<const re2::RE2> program_;
};

} // namespace pattern
} // namespace sublocator
