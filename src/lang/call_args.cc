#include "call_args.hh"

#include <algorithm>
#include <chklib/lang/exceptions.hh>
#include <chklib/lang/operations.hh>

namespace chk::lang {

void check_args_num(std::string_view name, const std::vector<Value>& args, size_t min, size_t max) {
    size_t given = args.size();
    if (given >= min and given <= max) {
        return;
    }
    if (min == max) {
        if (max == 0) {
            raise(ExceptionKind::TYPE_ERROR, name, "() takes no arguments (", given, " given)");
        }
        if (max == 1) {
            raise(ExceptionKind::TYPE_ERROR, name, "() takes exactly one argument (", given, " given)");
        }
        raise(ExceptionKind::TYPE_ERROR, name, "() takes exactly ", max, " arguments (", given, " given)");
    }
    if (given < min) {
        raise(
            ExceptionKind::TYPE_ERROR,
            name,
            "() takes at least ",
            min,
            min == 1 ? " argument (" : " arguments (",
            given,
            " given)"
        );
    }
    raise(
        ExceptionKind::TYPE_ERROR,
        name,
        "() takes at most ",
        max,
        max == 1 ? " argument (" : " arguments (",
        given,
        " given)"
    );
}

void check_no_kwargs(std::string_view name, const KwArgs& kwargs) {
    if (not kwargs.empty()) {
        raise(ExceptionKind::TYPE_ERROR, name, "() takes no keyword arguments");
    }
}

std::optional<Value> take_kwarg(KwArgs& kwargs, std::string_view key) {
    auto it = std::find_if(kwargs.begin(), kwargs.end(), [key](const auto& kwarg) {
        return kwarg.first == key;
    });
    if (it == kwargs.end()) {
        return std::nullopt;
    }
    auto res = std::move(it->second);
    kwargs.erase(it);
    return res;
}

void check_kwargs_consumed(std::string_view name, const KwArgs& kwargs) {
    if (not kwargs.empty()) {
        raise(
            ExceptionKind::TYPE_ERROR,
            "'",
            kwargs.front().first,
            "' is an invalid keyword argument for ",
            name,
            "()"
        );
    }
}

int64_t to_index(const Value& val) {
    if (const auto* i = std::get_if<int64_t>(&val)) {
        return *i;
    }
    if (const auto* b = std::get_if<bool>(&val)) {
        return *b ? 1 : 0;
    }
    raise(
        ExceptionKind::TYPE_ERROR,
        "'",
        type_name(val),
        "' object cannot be interpreted as an integer"
    );
}

const StrPtr& to_str_arg(const Value& val, std::string_view what) {
    if (const auto* s = std::get_if<StrPtr>(&val)) {
        return *s;
    }
    raise(ExceptionKind::TYPE_ERROR, what, " must be str, not ", type_name(val));
}

} // namespace chk::lang
