#pragma once

#include <type_traits>
#include <utility>
#include <variant>

template <class T>
struct Ok {
    T val;

    constexpr explicit Ok(T val) noexcept : val{std::move(val)} {}

    Ok(const Ok&) = default;
    Ok(Ok&&) noexcept = default;
    Ok& operator=(const Ok&) = default;
    Ok& operator=(Ok&&) noexcept = default;
    ~Ok() = default;

    template <class U, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Ok(Ok<U>&& other) noexcept : val{std::move(other.val)} {}
};

template <>
struct Ok<void> {
    constexpr Ok() noexcept = default;
};

Ok() -> Ok<void>;

template <class T>
struct Err {
    T err;

    constexpr explicit Err(T err) noexcept : err{std::move(err)} {}

    Err(const Err&) = default;
    Err(Err&&) noexcept = default;
    Err& operator=(const Err&) = default;
    Err& operator=(Err&&) noexcept = default;
    ~Err() = default;

    template <class U, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Err(Err<U>&& other) noexcept : err{std::move(other.err)} {}
};

template <>
struct Err<void> {
    constexpr Err() noexcept = default;
};

Err() -> Err<void>;

template <class T, class E>
struct Result : std::variant<Ok<T>, Err<E>> {
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Ok<T> ok) : std::variant<Ok<T>, Err<E>>{std::move(ok)} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Err<E> err) : std::variant<Ok<T>, Err<E>>{std::move(err)} {}

    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<Ok<T>>(*this);
    }

    [[nodiscard]] constexpr bool is_err() const noexcept {
        return std::holds_alternative<Err<E>>(*this);
    }

    constexpr T unwrap() && noexcept {
        if constexpr (std::is_same_v<T, void>) {
            return;
        } else {
            return std::get<Ok<T>>(std::move(*this)).val;
        }
    }

    constexpr E unwrap_err() && noexcept {
        if constexpr (std::is_same_v<E, void>) {
            return;
        } else {
            return std::get<Err<E>>(std::move(*this)).err;
        }
    }
};
