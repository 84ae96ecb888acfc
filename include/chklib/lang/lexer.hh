#pragma once

#include <chklib/lang/syntax_error.hh>
#include <chklib/lang/token.hh>
#include <chklib/result.hh>
#include <string>
#include <string_view>
#include <vector>

namespace chk::lang {

/**
 * @brief Splits @p source into tokens
 * @details Produces NEWLINE, INDENT and DEDENT tokens the way Python's
 *   tokenizer does: blank and comment-only lines produce nothing, newlines
 *   inside brackets are ignored, a backslash joins physical lines. The last
 *   token is always END_MARKER.
 *
 * @errors Returns the first lexical error
 */
Result<std::vector<Token>, SyntaxError> tokenize(std::string_view source);

// Same as tokenize() but throws SyntaxErrorException
std::vector<Token> tokenize_or_throw(std::string_view source);

/**
 * @brief Decodes backslash escapes of a string literal body
 *
 * @param body raw text between the quotes
 * @param line line on which @p body begins, used in errors
 *
 * @errors Throws SyntaxErrorException on a malformed escape
 */
std::string decode_string_escapes(std::string_view body, size_t line);

// Whether @p str is a valid identifier that is not a keyword
bool is_identifier(std::string_view str) noexcept;

bool is_keyword(std::string_view str) noexcept;

} // namespace chk::lang
