#pragma once

#include <type_traits>

// Standard functions reimplemented to be constexpr and locale independent
template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr bool is_digit(T c) noexcept {
    return ('0' <= c and c <= '9');
}

template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr bool is_alpha(T c) noexcept {
    return ('A' <= c and c <= 'Z') or ('a' <= c and c <= 'z');
}

template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr bool is_alnum(T c) noexcept {
    return is_alpha(c) or is_digit(c);
}

template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr bool is_xdigit(T c) noexcept {
    return is_digit(c) or ('A' <= c and c <= 'F') or ('a' <= c and c <= 'f');
}

template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr bool is_lower(T c) noexcept {
    return ('a' <= c and c <= 'z');
}

template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr bool is_upper(T c) noexcept {
    return ('A' <= c and c <= 'Z');
}

template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr bool is_space(T c) noexcept {
    return (c == '\t') or ('\x0a' <= c and c <= '\x0d') or (c == ' ');
}

template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr bool is_print(T c) noexcept {
    return ('\x20' <= c and c <= '\x7e');
}

template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr T to_lower(T c) noexcept {
    return (is_upper(c) ? static_cast<T>('a' + (c - 'A')) : c);
}

template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr T to_upper(T c) noexcept {
    return (is_lower(c) ? static_cast<T>('A' + (c - 'a')) : c);
}

// Converts a hexadecimal digit to its value, @p c has to satisfy is_xdigit()
template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr int hex2dec(T c) noexcept {
    if (is_digit(c)) {
        return c - '0';
    }
    return 10 + to_lower(c) - 'a';
}
