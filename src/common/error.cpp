#include "common/error.hpp"

#include <fmt/format.h>

namespace sublocator {

std::string_view error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotAString:    return "NotAString";
    case ErrorKind::InvalidAtMost: return "InvalidAtMost";
    case ErrorKind::InvalidStart:  return "InvalidStart";
    case ErrorKind::PatternError:  return "PatternError";
    }
    return "Unknown";
}

[[nodiscard]] std::string format_error(const LocateError& error) {
    return fmt::format("{}: {}", error_kind_to_string(error.kind), error.message);
}

} // namespace sublocator
