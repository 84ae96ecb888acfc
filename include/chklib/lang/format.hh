#pragma once

#include <chklib/lang/value.hh>
#include <string>
#include <string_view>
#include <vector>

namespace chk::lang {

/**
 * @brief Python's format(val, spec)
 * @details Supported specification: `[[fill]align][sign][0][width][,][.precision][type]`
 *   with types `d f F e E % g G s`, for int, float, bool and str. Other values
 *   accept only the empty specification.
 *
 * @errors Throws RaisedException (ValueError or TypeError) on an invalid
 *   specification
 */
std::string format_value(const Value& val, std::string_view spec);

// Python's `fmt % args`
std::string percent_format(std::string_view fmt, const Value& args);

// Python's `fmt.format(*args, **kwargs)`
std::string str_format(std::string_view fmt, const std::vector<Value>& args, const KwArgs& kwargs);

} // namespace chk::lang
