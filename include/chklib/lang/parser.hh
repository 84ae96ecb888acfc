#pragma once

#include <chklib/lang/ast.hh>
#include <chklib/lang/syntax_error.hh>
#include <chklib/lang/token.hh>
#include <chklib/result.hh>
#include <memory>
#include <string_view>
#include <vector>

namespace chk::lang {

/**
 * @brief Parses @p source as a module (a sequence of statements)
 * @details Only syntax is checked, like Python's ast.parse(): e.g. `return`
 *   outside a function is accepted here and rejected before execution.
 *
 * @errors Returns the first syntax error, nesting deeper than the limits in
 *   limits.hh is a syntax error too
 */
Result<std::unique_ptr<Module>, SyntaxError> parse_module(std::string_view source);

// Parses @p source as a single expression (Python's eval mode); leading
// blanks are ignored
Result<ExprPtr, SyntaxError> parse_expression(std::string_view source);

// Parses already tokenized expression, @p tokens have to end with END_MARKER
Result<ExprPtr, SyntaxError> parse_expression(std::vector<Token> tokens);

} // namespace chk::lang
