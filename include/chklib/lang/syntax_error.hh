#pragma once

#include <chklib/concat_tostr.hh>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace chk::lang {

struct SyntaxError {
    size_t line; // Indexed from 1
    std::string message;
};

// Used internally by the lexer and the parser to unwind to their entry points
class SyntaxErrorException : public std::runtime_error {
    SyntaxError error_;

public:
    template <class... Args>
    explicit SyntaxErrorException(size_t line, Args&&... msg)
    : runtime_error(concat_tostr("line ", line, ": ", msg...))
    , error_{line, concat_tostr(std::forward<Args>(msg)...)} {}

    SyntaxErrorException(const SyntaxErrorException&) = default;
    SyntaxErrorException(SyntaxErrorException&&) noexcept = default;
    SyntaxErrorException& operator=(const SyntaxErrorException&) = default;
    SyntaxErrorException& operator=(SyntaxErrorException&&) noexcept = default;

    ~SyntaxErrorException() override = default;

    [[nodiscard]] const SyntaxError& error() const noexcept { return error_; }
};

} // namespace chk::lang
