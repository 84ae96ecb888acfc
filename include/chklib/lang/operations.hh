#pragma once

#include <chklib/lang/ast.hh>
#include <chklib/lang/exceptions.hh>
#include <chklib/lang/value.hh>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Operations on values that never allocate on the heap nor run learner code
namespace chk::lang {

// Python's name of the value's type, e.g. "int", "NoneType", "function"
std::string_view type_name(const Value& val) noexcept;

bool is_truthy(const Value& val);

// Structural equality (`==`), numbers compare by value across int, float and bool
bool values_equal(const Value& a, const Value& b);

/**
 * @brief Ordering comparison `a op b` for op in <, <=, >, >=
 *
 * @errors Throws RaisedException (TypeError) for unorderable operands
 */
bool compare_order(const Value& a, CompareOperator op, const Value& b);

/**
 * @brief Hash consistent with values_equal()
 *
 * @errors Throws RaisedException (TypeError) for unhashable values
 */
size_t hash_value(const Value& val);

std::string repr(const Value& val);

// Python's str()
std::string str(const Value& val);

// Shortest representation that reads back as @p x, like Python's repr(float)
std::string float_repr(double x);

// str() of an exception instance built from @p args
std::string exception_message(ExceptionKind kind, const std::vector<Value>& args);

/* UTF-8 helpers, str values are indexed by code points */

size_t utf8_length(std::string_view str) noexcept;

// Byte offset of the code point @p idx (str.size() if idx is the length)
size_t utf8_offset(std::string_view str, size_t idx) noexcept;

// Byte length of the code point starting at @p pos
size_t utf8_char_length(std::string_view str, size_t pos) noexcept;

void append_utf8(std::string& out, uint32_t code_point);

} // namespace chk::lang
