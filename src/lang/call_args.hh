#pragma once

#include <chklib/lang/interpreter.hh>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

// Argument checking of built-in functions and methods
namespace chk::lang {

// Throws TypeError if the number of positional arguments is not in [@p min, @p max]
void check_args_num(std::string_view name, const std::vector<Value>& args, size_t min, size_t max);

void check_no_kwargs(std::string_view name, const KwArgs& kwargs);

// Removes and returns the keyword argument @p key
std::optional<Value> take_kwarg(KwArgs& kwargs, std::string_view key);

// Throws TypeError naming the first keyword argument left in @p kwargs
void check_kwargs_consumed(std::string_view name, const KwArgs& kwargs);

// Value of an int or a bool, TypeError for other types
int64_t to_index(const Value& val);

// @p val as StrPtr, TypeError naming @p what otherwise
const StrPtr& to_str_arg(const Value& val, std::string_view what);

} // namespace chk::lang
