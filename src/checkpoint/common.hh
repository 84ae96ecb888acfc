#pragma once

#include <chklib/checkpoint/validation_result.hh>
#include <chklib/concat_tostr.hh>
#include <chklib/lang/syntax_error.hh>
#include <chklib/limits.hh>
#include <optional>
#include <string>
#include <string_view>

namespace chk::detail {

inline ValidationResult syntax_error_result(const lang::SyntaxError& error) {
    return {
        .passed = false,
        .message = "Syntax error in your code",
        .errors = {concat_tostr("Line ", error.line, ": ", error.message)},
        .hints = {"Check for missing colons, parentheses, or quotes"},
    };
}

inline std::optional<ValidationResult> check_submission_size(std::string_view code) {
    if (code.size() <= limits::max_submission_size_in_bytes) {
        return std::nullopt;
    }
    return ValidationResult{
        .passed = false,
        .message = "Your code is too long",
        .errors = {concat_tostr(
            "Code has ",
            code.size(),
            " bytes, at most ",
            limits::max_submission_size_in_bytes,
            " bytes are allowed"
        )},
        .hints = {},
    };
}

inline ValidationResult configuration_error_result(std::string error) {
    return {
        .passed = false,
        .message = "Invalid checkpoint configuration",
        .errors = {std::move(error)},
        .hints = {},
    };
}

} // namespace chk::detail
