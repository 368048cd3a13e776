#pragma once

/// @file result.hpp
/// @brief Result<T,E>: a rules call either yields a value or rejects its input.

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace tcc {

/// Value-or-error return type.
///
/// Only malformed input (bad dice notation, unparseable armor formulas,
/// corrupt persisted state) travels through the error channel. Routine
/// game outcomes such as a missed attack or a blocked path are ordinary
/// success values with a flag set. The error type is always spelled out;
/// the core uses foundation::GameResult<T>.
///
/// Example:
/// @code
///   auto damage = Dice::parseDiceNotation("2d6+3")
///                     .andThen([&](auto terms) { return roll(terms); });
///   if (!damage) {
///       report(damage.error().message());
///   }
/// @endcode
template <typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Throws std::bad_variant_access unless hasValue().
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Throws std::bad_variant_access unless hasError().
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

    /// Transforms the value, passing an error through untouched.
    template <typename F>
    [[nodiscard]] auto map(F&& fn) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using Out = Result<std::invoke_result_t<F, const T&>, E>;
        if (hasError()) {
            return Out::err(error());
        }
        return Out::ok(std::forward<F>(fn)(value()));
    }

    /// Chains a step that can itself fail; @p fn must return Result<U, E>.
    template <typename F>
    [[nodiscard]] auto andThen(F&& fn) const& -> std::invoke_result_t<F, const T&> {
        using Out = std::invoke_result_t<F, const T&>;
        if (hasError()) {
            return Out::err(error());
        }
        return std::forward<F>(fn)(value());
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/// Result with no success payload, for mutations such as SessionStore::destroy.
template <typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    static Result ok() { return Result(); }
    static Result err(E error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    [[nodiscard]] bool hasValue() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool hasError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Undefined unless hasError().
    [[nodiscard]] const E& error() const& { return *error_; }

private:
    Result() = default;

    std::optional<E> error_;
};

}  // namespace tcc
