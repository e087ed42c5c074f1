#pragma once

/// @file result.hpp
/// @brief Value-or-error return type used across cbreak.

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cbreak {

/// Plain code and message pair for callers that need no richer error type.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Holds either a T or an E.
///
/// Every function in the library that can fail returns Result<T, E>
/// instead of throwing. Guarded operations handed to a circuit breaker
/// report their outcome the same way, which is what lets the breaker
/// classify failures without catching anything.
///
/// Example:
/// @code
///   auto profile = fetchProfile(userId);
///   if (!profile) {
///       return profile.error();
///   }
///   render(profile.value());
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }

    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return hasValue(); }

    /// Precondition: hasValue(). std::get throws otherwise.
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Precondition: hasError().
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(data_)); }

    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    // Index-based construction keeps Result<E, E> unambiguous.
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v) : data_(tag, std::forward<U>(v)) {}

    std::variant<T, E> data_;
};

/// Success carries no value; only the error is stored.
template <typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }
    [[nodiscard]] E& error() & { return error_; }
    [[nodiscard]] E&& error() && { return std::move(error_); }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

/// Detects Result<T, E> instantiations.
template <typename R>
struct IsResult : std::false_type {};

template <typename T, typename E>
struct IsResult<Result<T, E>> : std::true_type {};

template <typename R>
inline constexpr bool kIsResult = IsResult<std::remove_cvref_t<R>>::value;

}  // namespace cbreak
