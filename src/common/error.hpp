#pragma once

#include "common/result.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace sublocator {

/// Kinds of failure reported by locate(). All of them are detected before
/// any scanning begins.
enum class ErrorKind : uint8_t {
    NotAString,
    InvalidAtMost,
    InvalidStart,
    PatternError,
};

/// A typed failure with a human-readable message.
struct LocateError {
    ErrorKind kind;
    std::string message;

    /// Build an error with a formatted message.
    template <typename... Args>
    [[nodiscard]] static LocateError make(ErrorKind kind, fmt::format_string<Args...> fmt_str,
                                          Args&&... args) {
        return LocateError{kind, fmt::format(fmt_str, std::forward<Args>(args)...)};
    }
};

template <typename T>
using LocateResult = Result<T, LocateError>;

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind);

/// Format an error for display, e.g. "InvalidAtMost: :at_most value must be ...".
[[nodiscard]] std::string format_error(const LocateError& error);

} // namespace sublocator
