#include <chklib/checkpoint/checkpoint_file.hh>
#include <chklib/concat_tostr.hh>
#include <chklib/config_file.hh>
#include <chklib/ctype.hh>
#include <chklib/file_contents.hh>
#include <chklib/lang/lexer.hh>
#include <chklib/lang/literal.hh>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using chk::lang::LiteralValue;
using chk::lang::Token;
using std::string;
using std::string_view;
using std::vector;

namespace chk {

namespace {

template <class... Args>
[[noreturn]] void throw_error(size_t line, Args&&... msg) {
    throw CheckpointFileError(concat_tostr("line ", line, ": ", std::forward<Args>(msg)...));
}

vector<Token> tokenize_entry(string_view entry, size_t line) {
    while (not entry.empty() and (entry.front() == ' ' or entry.front() == '\t')) {
        entry.remove_prefix(1);
    }
    auto tokens = lang::tokenize(entry);
    if (tokens.is_err()) {
        auto err = std::move(tokens).unwrap_err();
        throw_error(line, "invalid entry `", entry, "`: ", err.message);
    }
    auto res = std::move(tokens).unwrap();
    // The trailing NEWLINE is of no use to the callers
    std::erase_if(res, [](const Token& tok) { return tok.kind == Token::Kind::NEWLINE; });
    return res;
}

LiteralValue parse_literal_tokens(
    const vector<Token>& tokens, size_t beg, size_t end, size_t line, string_view what
) {
    if (beg == end) {
        throw_error(line, "missing ", what);
    }
    vector<Token> expr_tokens(tokens.begin() + beg, tokens.begin() + end);
    expr_tokens.emplace_back(tokens.back()); // END_MARKER
    auto val = lang::parse_literal(std::move(expr_tokens));
    if (val.is_err()) {
        throw_error(line, "invalid ", what, ": ", std::move(val).unwrap_err());
    }
    return std::move(val).unwrap();
}

CheckRule parse_check(string_view entry, size_t line) {
    auto tokens = tokenize_entry(entry, line);
    // kind, requirement, pattern, message, END_MARKER
    if (tokens.size() != 5) {
        throw_error(
            line,
            "a check has to be `<kind> <required|optional> <pattern> <message>`, got: ",
            entry
        );
    }

    CheckRule rule;
    const auto& kind = tokens[0];
    if (kind.is_keyword("regex") or kind.is_keyword("pattern")) {
        rule.kind = CheckRule::Kind::PATTERN;
    } else if (kind.is_keyword("ast_contains") or kind.is_keyword("structure")) {
        rule.kind = CheckRule::Kind::STRUCTURE;
    } else {
        throw_error(line, "unknown check kind: `", kind.text, '`');
    }

    const auto& requirement = tokens[1];
    if (requirement.is_keyword("required")) {
        rule.required = true;
    } else if (requirement.is_keyword("optional")) {
        rule.required = false;
    } else {
        throw_error(
            line, "expected `required` or `optional`, got: `", requirement.text, '`'
        );
    }

    auto is_plain_string = [](const Token& tok) {
        return tok.kind == Token::Kind::STRING and not tok.is_fstring;
    };
    if (not is_plain_string(tokens[2])) {
        throw_error(line, "the pattern has to be a string literal, got: `", tokens[2].text, '`');
    }
    if (not is_plain_string(tokens[3])) {
        throw_error(line, "the message has to be a string literal, got: `", tokens[3].text, '`');
    }
    rule.pattern = std::move(tokens[2].text);
    rule.message = std::move(tokens[3].text);
    return rule;
}

// Index of the first token equal to @p op outside of any brackets
std::optional<size_t>
find_top_level_op(const vector<Token>& tokens, size_t beg, string_view op) {
    size_t depth = 0;
    for (size_t i = beg; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (tok.is_op("(") or tok.is_op("[") or tok.is_op("{")) {
            ++depth;
        } else if (tok.is_op(")") or tok.is_op("]") or tok.is_op("}")) {
            if (depth > 0) {
                --depth;
            }
        } else if (depth == 0 and tok.is_op(op)) {
            return i;
        }
    }
    return std::nullopt;
}

TestCase parse_test(string_view entry, size_t line) {
    auto tokens = tokenize_entry(entry, line);
    size_t end = tokens.size() - 1; // END_MARKER
    auto arrow = find_top_level_op(tokens, 0, "->");
    if (not arrow) {
        throw_error(line, "a test has to be `<input> -> <expected>[, <description>]`, got: ", entry);
    }

    TestCase test;
    auto input = parse_literal_tokens(tokens, 0, *arrow, line, "test input");
    auto* dict = std::get_if<LiteralValue::Dict>(&input.value);
    if (not dict) {
        throw_error(line, "test input has to be a dict of arguments, got: ", lang::repr(input));
    }
    for (size_t i = 0; i < dict->keys.size(); ++i) {
        auto* name = std::get_if<string>(&dict->keys[i].value);
        if (not name) {
            throw_error(
                line, "argument names have to be strings, got: ", lang::repr(dict->keys[i])
            );
        }
        for (const auto& [prev_name, val] : test.input) {
            if (prev_name == *name) {
                throw_error(line, "argument `", *name, "` is given more than once");
            }
        }
        test.input.emplace_back(std::move(*name), std::move(dict->values[i]));
    }

    // A trailing `, <string literal>` is the description
    size_t expected_end = end;
    for (size_t pos = *arrow + 1;;) {
        auto comma = find_top_level_op(tokens, pos, ",");
        if (not comma) {
            break;
        }
        if (*comma + 2 == end and tokens[*comma + 1].kind == Token::Kind::STRING and
            not tokens[*comma + 1].is_fstring)
        {
            test.description = tokens[*comma + 1].text;
            expected_end = *comma;
            break;
        }
        pos = *comma + 1;
    }
    test.expected = parse_literal_tokens(tokens, *arrow + 1, expected_end, line, "expected value");
    return test;
}

std::chrono::nanoseconds parse_timeout(const string& str, size_t line) {
    // <digits>[.<digits>]
    size_t pos = 0;
    int64_t seconds = 0;
    while (pos < str.size() and is_digit(str[pos])) {
        seconds = seconds * 10 + (str[pos++] - '0');
        if (seconds > 1'000'000) {
            throw_error(line, "timeout is too large: ", str);
        }
    }
    int64_t nanos = 0;
    int64_t unit = 1'000'000'000;
    bool valid = pos > 0;
    if (pos < str.size() and str[pos] == '.') {
        ++pos;
        valid = valid or (pos < str.size() and is_digit(str[pos]));
        while (pos < str.size() and is_digit(str[pos])) {
            unit /= 10;
            nanos += (str[pos++] - '0') * unit;
        }
    }
    if (not valid or pos != str.size()) {
        throw_error(line, "timeout has to be a number of seconds, got: `", str, '`');
    }
    return std::chrono::seconds{seconds} + std::chrono::nanoseconds{nanos};
}

const ConfigFile::Variable&
expect_string(const ConfigFile& cf, string_view name) {
    const auto& var = cf[name];
    if (var.is_array()) {
        throw_error(var.line(), '`', name, "` has to be a string");
    }
    return var;
}

const ConfigFile::Variable&
expect_array(const ConfigFile& cf, string_view name) {
    const auto& var = cf[name];
    if (var.is_set() and not var.is_array()) {
        throw_error(var.line(), '`', name, "` has to be an array");
    }
    return var;
}

} // namespace

CheckpointConfig parse_checkpoint_config(string contents) {
    ConfigFile cf;
    cf.add_vars("type", "checks", "function_name", "timeout", "tests");
    cf.load_config_from_string(std::move(contents));

    CheckpointConfig config;
    if (const auto& type = expect_string(cf, "type"); type.is_set()) {
        config.validator_kind = type.as_string();
    }

    const auto& checks = expect_array(cf, "checks");
    for (size_t i = 0; i < checks.as_array().size(); ++i) {
        config.rules.emplace_back(parse_check(checks.as_array()[i], checks.array_lines()[i]));
    }

    config.entry_point = expect_string(cf, "function_name").as_string();

    if (const auto& timeout = expect_string(cf, "timeout"); timeout.is_set()) {
        config.timeout = parse_timeout(timeout.as_string(), timeout.line());
    }

    const auto& tests = expect_array(cf, "tests");
    for (size_t i = 0; i < tests.as_array().size(); ++i) {
        config.tests.emplace_back(parse_test(tests.as_array()[i], tests.array_lines()[i]));
    }
    return config;
}

CheckpointConfig load_checkpoint_config(const string& path) {
    return parse_checkpoint_config(get_file_contents(path));
}

} // namespace chk
