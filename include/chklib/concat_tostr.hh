#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// Converts an argument of concat_tostr() to something std::string_view can be
// constructed from. Integers are converted to their decimal representation.
template <class T>
decltype(auto) stringify(T&& x) {
    using DT = std::remove_cv_t<std::remove_reference_t<T>>;
    if constexpr (std::is_same_v<DT, char>) {
        return std::string_view{&x, 1};
    } else if constexpr (std::is_same_v<DT, bool>) {
        return std::string_view{x ? "true" : "false"};
    } else if constexpr (std::is_integral_v<DT>) {
        return std::to_string(x);
    } else {
        return std::forward<T>(x);
    }
}

template <class... Args>
std::string concat_tostr(Args&&... args) {
    return [](auto&&... str) {
        size_t total_length = (0 + ... + std::string_view{str}.size());
        std::string res;
        res.reserve(total_length);
        (res.append(std::string_view{str}), ...);
        return res;
    }(stringify(std::forward<Args>(args))...);
}

template <class... Args>
std::string& back_insert(std::string& str, Args&&... args) {
    return [&str](auto&&... xx) -> std::string& {
        str.reserve(str.size() + (0 + ... + std::string_view{xx}.size()));
        (str.append(std::string_view{xx}), ...);
        return str;
    }(stringify(std::forward<Args>(args))...);
}
