#pragma once

#include <string>
#include <utility>
#include <variant>

namespace sublocator {

/// Outcome of a locate call or one of its stages: the produced value, or the
/// LocateError that stopped it. Nothing partial travels with an error.
template <typename T, typename E = std::string>
class Result {
public:
    [[nodiscard]] static Result ok(T value) { return Result(std::move(value)); }
    [[nodiscard]] static Result err(E error) { return Result(Failure{std::move(error)}); }

    [[nodiscard]] bool is_ok() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool is_err() const { return std::holds_alternative<Failure>(data_); }

    /// The produced value. Callers check is_ok() first.
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// The error that stopped the call. Callers check is_err() first.
    [[nodiscard]] E& error() & { return std::get<Failure>(data_).error; }
    [[nodiscard]] const E& error() const& { return std::get<Failure>(data_).error; }
    [[nodiscard]] E&& error() && { return std::move(std::get<Failure>(data_).error); }

    /// Re-wrap a failed stage's error as the result of the next stage, e.g. a
    /// failed normalize() as the failure of locate().
    template <typename U>
    [[nodiscard]] Result<U, E> forward_error() && {
        return Result<U, E>::err(std::move(*this).error());
    }

    /// True when a value was produced.
    [[nodiscard]] explicit operator bool() const { return is_ok(); }

private:
    // Keeps the error alternative distinct even when T and E coincide
    struct Failure {
        E error;
    };

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Failure failure) : data_(std::move(failure)) {}

    std::variant<T, Failure> data_;
};

} // namespace sublocator
