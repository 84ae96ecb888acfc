#include <algorithm>
#include <array>
#include <charconv>
#include <chklib/ctype.hh>
#include <chklib/lang/lexer.hh>
#include <chklib/limits.hh>
#include <cstdint>
#include <limits>
#include <system_error>

namespace chk::lang {
namespace {

constexpr std::array<std::string_view, 35> keywords = {
    "False", "None",   "True",    "and",      "as",       "assert", "async",
    "await", "break",  "class",   "continue", "def",      "del",    "elif",
    "else",  "except", "finally", "for",      "from",     "global", "if",
    "import", "in",    "is",      "lambda",   "nonlocal", "not",    "or",
    "pass",  "raise",  "return",  "try",      "while",    "with",   "yield",
};

constexpr std::array<std::string_view, 5> three_char_ops = {"**=", "//=", ">>=", "<<=", "..."};

constexpr std::array<std::string_view, 19> two_char_ops = {
    "**", "//", ">>", "<<", "<=", ">=", "==", "!=", "->", "+=",
    "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=", ":=",
};

constexpr std::string_view one_char_ops = "+-*/%@&|^~<>()[]{},:.;=";

constexpr bool is_name_start(unsigned char c) noexcept {
    return is_alpha(c) or c == '_' or c >= 0x80;
}

constexpr bool is_name_char(unsigned char c) noexcept {
    return is_alnum(c) or c == '_' or c >= 0x80;
}

void append_utf8(std::string& str, uint32_t cp) {
    if (cp < 0x80) {
        str += static_cast<char>(cp);
    } else if (cp < 0x800) {
        str += static_cast<char>(0xc0 | (cp >> 6));
        str += static_cast<char>(0x80 | (cp & 0x3f));
    } else if (cp < 0x10000) {
        str += static_cast<char>(0xe0 | (cp >> 12));
        str += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        str += static_cast<char>(0x80 | (cp & 0x3f));
    } else {
        str += static_cast<char>(0xf0 | (cp >> 18));
        str += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        str += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        str += static_cast<char>(0x80 | (cp & 0x3f));
    }
}

constexpr char closing_of(char opening) noexcept {
    switch (opening) {
    case '(': return ')';
    case '[': return ']';
    default: return '}';
    }
}

class Lexer {
    std::string src_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t line_beg_ = 0;
    bool at_line_start_ = true;
    std::vector<Token> tokens_;
    std::vector<size_t> indents_{0};

    struct OpenBracket {
        char c;
        size_t line;
    };

    std::vector<OpenBracket> brackets_;

public:
    explicit Lexer(std::string_view source) {
        // Normalize newlines to '\n'
        src_.reserve(source.size());
        for (size_t i = 0; i < source.size(); ++i) {
            if (source[i] == '\r') {
                if (i + 1 < source.size() and source[i + 1] == '\n') {
                    ++i;
                }
                src_ += '\n';
            } else {
                src_ += source[i];
            }
        }
        if (src_.starts_with("\xef\xbb\xbf")) {
            pos_ = line_beg_ = 3;
        }
    }

    std::vector<Token> run() &&;

private:
    [[nodiscard]] char peek(size_t offset = 0) const noexcept {
        return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
    }

    [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }

    [[nodiscard]] size_t column() const noexcept { return pos_ - line_beg_; }

    void new_line() noexcept {
        ++line_;
        line_beg_ = pos_;
    }

    template <class... Args>
    [[noreturn]] void error(Args&&... msg) const {
        throw SyntaxErrorException(line_, std::forward<Args>(msg)...);
    }

    Token& emit(Token::Kind kind, std::string text, size_t column) {
        return tokens_.emplace_back(Token{
            .kind = kind,
            .text = std::move(text),
            .line = line_,
            .column = column,
        });
    }

    void handle_line_start();
    void read_digits(bool (*is_valid_digit)(char) noexcept, std::string& cleaned);
    void lex_number();
    void lex_string(bool is_raw, bool is_fstring, size_t tok_column);
    void lex_name_or_prefixed_string();
    void lex_operator();
};

void Lexer::handle_line_start() {
    size_t col = 0;
    while (not eof()) {
        char c = src_[pos_];
        if (c == ' ') {
            ++col;
        } else if (c == '\t') {
            col = (col / 8 + 1) * 8;
        } else if (c == '\f') {
            col = 0;
        } else {
            break;
        }
        ++pos_;
    }
    if (eof()) {
        return;
    }
    if (src_[pos_] == '#' or src_[pos_] == '\n') {
        // Blank line
        while (not eof() and src_[pos_] != '\n') {
            ++pos_;
        }
        if (not eof()) {
            ++pos_;
            new_line();
        }
        return;
    }

    at_line_start_ = false;
    if (col > indents_.back()) {
        if (indents_.size() > limits::max_indentation_levels) {
            error("too many levels of indentation");
        }
        indents_.emplace_back(col);
        emit(Token::Kind::INDENT, "", column());
        return;
    }
    while (col < indents_.back()) {
        indents_.pop_back();
        emit(Token::Kind::DEDENT, "", column());
    }
    if (col != indents_.back()) {
        error("unindent does not match any outer indentation level");
    }
}

void Lexer::read_digits(bool (*is_valid_digit)(char) noexcept, std::string& cleaned) {
    while (not eof()) {
        char c = src_[pos_];
        if (is_valid_digit(c)) {
            cleaned += c;
            ++pos_;
        } else if (c == '_' and is_valid_digit(peek(1))) {
            ++pos_;
        } else if (c == '_') {
            error("invalid decimal literal");
        } else {
            break;
        }
    }
}

void Lexer::lex_number() {
    size_t tok_column = column();
    size_t beg = pos_;
    auto check_no_trailing_name = [&](std::string_view what) {
        if (peek() == 'j' or peek() == 'J') {
            error("complex literals are not supported");
        }
        if (is_name_char(static_cast<unsigned char>(peek()))) {
            error("invalid ", what, " literal");
        }
    };

    if (peek() == '0' and std::string_view{"xXoObB"}.find(peek(1)) != std::string_view::npos and
        peek(1) != '\0')
    {
        char prefix = to_lower(peek(1));
        pos_ += 2;
        int base = 16;
        std::string_view what = "hexadecimal";
        bool (*digit_pred)(char) noexcept = [](char c) noexcept { return is_xdigit(c); };
        if (prefix == 'o') {
            base = 8;
            what = "octal";
            digit_pred = [](char c) noexcept { return c >= '0' and c <= '7'; };
        } else if (prefix == 'b') {
            base = 2;
            what = "binary";
            digit_pred = [](char c) noexcept { return c == '0' or c == '1'; };
        }
        if (peek() == '_') {
            ++pos_;
        }
        std::string cleaned;
        read_digits(digit_pred, cleaned);
        if (cleaned.empty()) {
            error("invalid ", what, " literal");
        }
        check_no_trailing_name(what);

        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(cleaned.data(), cleaned.data() + cleaned.size(), value, base);
        if (ec != std::errc{}) {
            error("integer literal is too large");
        }
        emit(Token::Kind::INT, src_.substr(beg, pos_ - beg), tok_column).int_value = value;
        return;
    }

    bool (*decimal)(char) noexcept = [](char c) noexcept { return is_digit(c); };
    std::string cleaned;
    read_digits(decimal, cleaned);
    bool is_float = false;
    if (peek() == '.') {
        is_float = true;
        ++pos_;
        if (cleaned.empty()) {
            cleaned += '0';
        }
        cleaned += '.';
        size_t len = cleaned.size();
        read_digits(decimal, cleaned);
        if (cleaned.size() == len) {
            cleaned += '0';
        }
    }
    if ((peek() == 'e' or peek() == 'E') and
        (is_digit(peek(1)) or ((peek(1) == '+' or peek(1) == '-') and is_digit(peek(2)))))
    {
        is_float = true;
        cleaned += 'e';
        ++pos_;
        if (peek() == '+' or peek() == '-') {
            cleaned += peek();
            ++pos_;
        }
        read_digits(decimal, cleaned);
    }
    check_no_trailing_name("decimal");

    if (is_float) {
        double value = 0;
        auto [ptr, ec] = std::from_chars(cleaned.data(), cleaned.data() + cleaned.size(), value);
        if (ec == std::errc::result_out_of_range) {
            // Underflow is rounded to 0, overflow to infinity
            bool underflow = cleaned.find("e-") != std::string::npos;
            value = underflow ? 0.0 : std::numeric_limits<double>::infinity();
        } else if (ec != std::errc{}) {
            error("invalid decimal literal");
        }
        emit(Token::Kind::FLOAT, src_.substr(beg, pos_ - beg), tok_column).float_value = value;
        return;
    }

    if (cleaned.size() > 1 and cleaned[0] == '0' and
        cleaned.find_first_not_of('0') != std::string::npos)
    {
        error(
            "leading zeros in decimal integer literals are not permitted; use an 0o prefix for "
            "octal integers"
        );
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(cleaned.data(), cleaned.data() + cleaned.size(), value);
    if (ec != std::errc{}) {
        error("integer literal is too large");
    }
    emit(Token::Kind::INT, src_.substr(beg, pos_ - beg), tok_column).int_value = value;
}

void Lexer::lex_string(bool is_raw, bool is_fstring, size_t tok_column) {
    char quote = src_[pos_];
    bool triple = (peek(1) == quote and peek(2) == quote);
    size_t start_line = line_;
    pos_ += triple ? 3 : 1;
    size_t body_beg = pos_;

    auto unterminated = [&] {
        throw SyntaxErrorException(
            start_line,
            triple ? "unterminated triple-quoted string literal" : "unterminated string literal",
            " (detected at line ",
            line_,
            ')'
        );
    };

    for (;;) {
        if (eof()) {
            unterminated();
        }
        char c = src_[pos_];
        if (c == '\\') {
            ++pos_;
            if (eof()) {
                unterminated();
            }
            if (src_[pos_] == '\n') {
                ++pos_;
                new_line();
            } else {
                ++pos_;
            }
            continue;
        }
        if (c == '\n') {
            if (not triple) {
                unterminated();
            }
            ++pos_;
            new_line();
            continue;
        }
        if (c == quote and (not triple or (peek(1) == quote and peek(2) == quote))) {
            break;
        }
        ++pos_;
    }

    std::string_view body{src_.data() + body_beg, pos_ - body_beg};
    pos_ += triple ? 3 : 1;

    Token tok{
        .kind = Token::Kind::STRING,
        .text = (is_raw or is_fstring) ? std::string{body} : decode_string_escapes(body, start_line),
        .line = start_line,
        .column = tok_column,
        .is_fstring = is_fstring,
        .is_raw = is_raw,
    };
    tokens_.emplace_back(std::move(tok));
}

void Lexer::lex_name_or_prefixed_string() {
    size_t tok_column = column();
    size_t beg = pos_;
    while (not eof() and is_name_char(static_cast<unsigned char>(src_[pos_]))) {
        ++pos_;
    }
    std::string name = src_.substr(beg, pos_ - beg);

    if ((peek() == '\'' or peek() == '"') and name.size() <= 2) {
        std::string prefix;
        for (char c : name) {
            prefix += to_lower(c);
        }
        std::sort(prefix.begin(), prefix.end());
        if (prefix == "b" or prefix == "br") {
            error("bytes literals are not supported");
        }
        if (prefix == "r" or prefix == "u" or prefix == "f" or prefix == "fr") {
            lex_string(
                prefix.find('r') != std::string::npos,
                prefix.find('f') != std::string::npos,
                tok_column
            );
            return;
        }
    }
    emit(Token::Kind::NAME, std::move(name), tok_column);
}

void Lexer::lex_operator() {
    size_t tok_column = column();
    std::string_view rest{src_.data() + pos_, src_.size() - pos_};
    for (auto op : three_char_ops) {
        if (rest.starts_with(op)) {
            pos_ += op.size();
            emit(Token::Kind::OP, std::string{op}, tok_column);
            return;
        }
    }
    for (auto op : two_char_ops) {
        if (rest.starts_with(op)) {
            pos_ += op.size();
            emit(Token::Kind::OP, std::string{op}, tok_column);
            return;
        }
    }

    char c = src_[pos_];
    if (one_char_ops.find(c) == std::string_view::npos) {
        auto uc = static_cast<unsigned char>(c);
        if (not is_print(uc) and not is_space(uc)) {
            static constexpr char hex_digits[] = "0123456789ABCDEF";
            error(
                "invalid non-printable character U+00",
                hex_digits[uc >> 4],
                hex_digits[uc & 15]
            );
        }
        error("invalid syntax");
    }

    if (c == '(' or c == '[' or c == '{') {
        if (brackets_.size() >= limits::max_bracket_nesting) {
            error("too many nested parentheses");
        }
        brackets_.emplace_back(OpenBracket{.c = c, .line = line_});
    } else if (c == ')' or c == ']' or c == '}') {
        if (brackets_.empty()) {
            error("unmatched '", c, '\'');
        }
        auto open = brackets_.back();
        if (closing_of(open.c) != c) {
            if (open.line != line_) {
                error(
                    "closing parenthesis '",
                    c,
                    "' does not match opening parenthesis '",
                    open.c,
                    "' on line ",
                    open.line
                );
            }
            error("closing parenthesis '", c, "' does not match opening parenthesis '", open.c, '\'');
        }
        brackets_.pop_back();
    }
    ++pos_;
    emit(Token::Kind::OP, std::string(1, c), tok_column);
}

std::vector<Token> Lexer::run() && {
    if (src_.find('\0') != std::string::npos) {
        throw SyntaxErrorException(1, "source code cannot contain null bytes");
    }

    for (;;) {
        if (at_line_start_ and brackets_.empty()) {
            handle_line_start();
            if (at_line_start_) {
                if (eof()) {
                    break;
                }
                continue;
            }
        }
        if (eof()) {
            break;
        }

        char c = src_[pos_];
        if (c == ' ' or c == '\t' or c == '\f') {
            ++pos_;
        } else if (c == '#') {
            while (not eof() and src_[pos_] != '\n') {
                ++pos_;
            }
        } else if (c == '\\') {
            if (peek(1) == '\n') {
                pos_ += 2;
                new_line();
            } else if (pos_ + 1 >= src_.size()) {
                error("unexpected EOF while parsing");
            } else {
                error("unexpected character after line continuation character");
            }
        } else if (c == '\n') {
            if (brackets_.empty()) {
                emit(Token::Kind::NEWLINE, "", column());
                at_line_start_ = true;
            }
            ++pos_;
            new_line();
        } else if (is_name_start(static_cast<unsigned char>(c))) {
            lex_name_or_prefixed_string();
        } else if (is_digit(c) or (c == '.' and is_digit(peek(1)))) {
            lex_number();
        } else if (c == '\'' or c == '"') {
            lex_string(false, false, column());
        } else {
            lex_operator();
        }
    }

    if (not brackets_.empty()) {
        const auto& open = brackets_.back();
        throw SyntaxErrorException(open.line, '\'', open.c, "' was never closed");
    }
    if (not tokens_.empty() and tokens_.back().kind != Token::Kind::NEWLINE and
        tokens_.back().kind != Token::Kind::DEDENT)
    {
        emit(Token::Kind::NEWLINE, "", column());
    }
    while (indents_.size() > 1) {
        indents_.pop_back();
        emit(Token::Kind::DEDENT, "", column());
    }
    emit(Token::Kind::END_MARKER, "", column());
    return std::move(tokens_);
}

} // namespace

std::string decode_string_escapes(std::string_view body, size_t line) {
    std::string res;
    res.reserve(body.size());
    auto read_hex = [&](size_t& i, size_t digits, std::string_view what) {
        uint32_t value = 0;
        for (size_t k = 0; k < digits; ++k) {
            if (i + 1 >= body.size() or not is_xdigit(body[i + 1])) {
                throw SyntaxErrorException(
                    line,
                    "(unicode error) 'unicodeescape' codec can't decode bytes: truncated ",
                    what,
                    " escape"
                );
            }
            value = value * 16 + static_cast<uint32_t>(hex2dec(body[++i]));
        }
        return value;
    };

    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] != '\\' or i + 1 == body.size()) {
            res += body[i];
            if (body[i] == '\n') {
                ++line;
            }
            continue;
        }
        char c = body[++i];
        switch (c) {
        case '\n': ++line; break;
        case '\\':
        case '\'':
        case '"': res += c; break;
        case 'a': res += '\a'; break;
        case 'b': res += '\b'; break;
        case 'f': res += '\f'; break;
        case 'n': res += '\n'; break;
        case 'r': res += '\r'; break;
        case 't': res += '\t'; break;
        case 'v': res += '\v'; break;
        case 'x': append_utf8(res, read_hex(i, 2, "\\xXX")); break;
        case 'u': append_utf8(res, read_hex(i, 4, "\\uXXXX")); break;
        case 'U': {
            uint32_t cp = read_hex(i, 8, "\\UXXXXXXXX");
            if (cp > 0x10ffff) {
                throw SyntaxErrorException(
                    line,
                    "(unicode error) 'unicodeescape' codec can't decode bytes: illegal Unicode "
                    "character"
                );
            }
            append_utf8(res, cp);
            break;
        }
        case 'N':
            throw SyntaxErrorException(
                line,
                "(unicode error) 'unicodeescape' codec can't decode bytes: \\N{...} escapes are not "
                "supported"
            );
        default:
            if (c >= '0' and c <= '7') {
                uint32_t value = static_cast<uint32_t>(c - '0');
                for (int k = 0;
                     k < 2 and i + 1 < body.size() and body[i + 1] >= '0' and body[i + 1] <= '7';
                     ++k)
                {
                    value = value * 8 + static_cast<uint32_t>(body[++i] - '0');
                }
                append_utf8(res, value);
            } else {
                // Unknown escapes are kept verbatim
                res += '\\';
                res += c;
                if (c == '\n') {
                    ++line;
                }
            }
        }
    }
    return res;
}

bool is_keyword(std::string_view str) noexcept {
    return std::find(keywords.begin(), keywords.end(), str) != keywords.end();
}

bool is_identifier(std::string_view str) noexcept {
    if (str.empty() or not is_name_start(static_cast<unsigned char>(str[0]))) {
        return false;
    }
    return std::all_of(str.begin(), str.end(), [](char c) {
        return is_name_char(static_cast<unsigned char>(c));
    }) and not is_keyword(str);
}

std::vector<Token> tokenize_or_throw(std::string_view source) { return Lexer{source}.run(); }

Result<std::vector<Token>, SyntaxError> tokenize(std::string_view source) {
    try {
        return Ok{tokenize_or_throw(source)};
    } catch (const SyntaxErrorException& e) {
        return Err{e.error()};
    }
}

} // namespace chk::lang
