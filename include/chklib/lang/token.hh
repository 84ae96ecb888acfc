#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace chk::lang {

struct Token {
    enum class Kind : uint8_t {
        NAME,
        INT,
        FLOAT,
        STRING,
        OP,
        NEWLINE,
        INDENT,
        DEDENT,
        END_MARKER,
    };

    Kind kind;
    // NAME: the identifier, OP: the operator, STRING: the decoded value (raw
    // body for f-strings), INT / FLOAT: the literal as written
    std::string text;
    size_t line; // Indexed from 1
    size_t column; // Indexed from 0, in bytes
    bool is_fstring = false;
    bool is_raw = false;
    int64_t int_value = 0;
    double float_value = 0;

    [[nodiscard]] bool is_op(std::string_view op) const noexcept {
        return kind == Kind::OP and text == op;
    }

    [[nodiscard]] bool is_keyword(std::string_view kw) const noexcept {
        return kind == Kind::NAME and text == kw;
    }
};

constexpr std::string_view to_str(Token::Kind kind) noexcept {
    switch (kind) {
    case Token::Kind::NAME: return "NAME";
    case Token::Kind::INT: return "INT";
    case Token::Kind::FLOAT: return "FLOAT";
    case Token::Kind::STRING: return "STRING";
    case Token::Kind::OP: return "OP";
    case Token::Kind::NEWLINE: return "NEWLINE";
    case Token::Kind::INDENT: return "INDENT";
    case Token::Kind::DEDENT: return "DEDENT";
    case Token::Kind::END_MARKER: return "END_MARKER";
    }
    return "unknown";
}

} // namespace chk::lang
