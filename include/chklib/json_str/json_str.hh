#pragma once

#include <chklib/concat_tostr.hh>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace json_str {

// Appends @p str as a quoted and escaped JSON string
void append_stringified_json(std::string& res, std::string_view str);

// Values are bools or anything convertible to std::string_view
template <class T>
void append_value(std::string& res, T&& val) {
    if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        res += val ? "true" : "false";
    } else {
        append_stringified_json(res, std::string_view{val});
    }
}

class Array {
    friend class Object;

    std::string& str_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool empty_ = true;

    explicit Array(std::string& str) : str_{str} { str_ += '['; }

public:
    template <class T>
    void val(T&& val) {
        if (not empty_) {
            str_ += ',';
        }
        empty_ = false;
        append_value(str_, std::forward<T>(val));
    }
};

// Builds a JSON object, properties appear in order of addition
class Object {
    std::string str_ = "{";

    void append_prop_name(std::string_view name) {
        if (str_.size() > 1) {
            str_ += ',';
        }
        back_insert(str_, '"', name, "\":");
    }

public:
    template <class T>
    void prop(std::string_view name, T&& val) {
        append_prop_name(name);
        append_value(str_, std::forward<T>(val));
    }

    template <class Func>
    void prop_arr(std::string_view name, Func&& func) {
        static_assert(std::is_invocable_v<Func&&, Array&>);
        append_prop_name(name);
        Array arr{str_};
        std::forward<Func>(func)(arr);
        str_ += ']';
    }

    std::string into_str() && {
        str_ += '}';
        return std::move(str_);
    }
};

} // namespace json_str
