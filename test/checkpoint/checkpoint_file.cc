#include <chklib/checkpoint/checkpoint_file.hh>
#include <chklib/config_file.hh>
#include <chklib/lang/literal.hh>
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using chk::CheckpointFileError;
using chk::CheckRule;
using chk::parse_checkpoint_config;
using std::string;
using std::vector;

using namespace std::chrono_literals;

namespace {

string file_error(string contents) {
    try {
        (void)parse_checkpoint_config(std::move(contents));
    } catch (const CheckpointFileError& e) {
        return e.what();
    }
    return "no error";
}

} // namespace

// NOLINTNEXTLINE
TEST(checkpoint_file, defaults) {
    auto config = parse_checkpoint_config("");
    EXPECT_EQ(config.validator_kind, "static");
    EXPECT_TRUE(config.rules.empty());
    EXPECT_TRUE(config.tests.empty());
    EXPECT_EQ(config.entry_point, "");
    EXPECT_EQ(config.timeout, 5s);
}

// NOLINTNEXTLINE
TEST(checkpoint_file, checks) {
    auto config = parse_checkpoint_config(R"(type: static
checks: [
    'regex required r"raise\s+ValueError" "Must raise ValueError"'
    'ast_contains optional "For" ''Consider a "for" loop'''
    'pattern optional ''\d+'' "Use a number"'
    'structure required "FunctionDef" "Define a function"'
]
)");
    EXPECT_EQ(config.validator_kind, "static");
    ASSERT_EQ(config.rules.size(), 4);

    EXPECT_EQ(config.rules[0].kind, CheckRule::Kind::PATTERN);
    EXPECT_TRUE(config.rules[0].required);
    EXPECT_EQ(config.rules[0].pattern, R"(raise\s+ValueError)");
    EXPECT_EQ(config.rules[0].message, "Must raise ValueError");

    EXPECT_EQ(config.rules[1].kind, CheckRule::Kind::STRUCTURE);
    EXPECT_FALSE(config.rules[1].required);
    EXPECT_EQ(config.rules[1].pattern, "For");
    EXPECT_EQ(config.rules[1].message, R"(Consider a "for" loop)");

    EXPECT_EQ(config.rules[2].kind, CheckRule::Kind::PATTERN);
    EXPECT_EQ(config.rules[2].pattern, "\\d+");

    EXPECT_EQ(config.rules[3].kind, CheckRule::Kind::STRUCTURE);
    EXPECT_TRUE(config.rules[3].required);
}

// NOLINTNEXTLINE
TEST(checkpoint_file, tests) {
    auto config = parse_checkpoint_config(R"(type: execution
function_name: f
timeout: 0.25
tests: [
    '{"x": 2} -> 4, "doubles 2"'
    '{"a": [1, 2], "b": None} -> {"k": (1, "x")}'
    '{} -> (1, 2)'
    '{} -> 1, 2'
    '{"s": "a -> b, c"} -> "a, b", "arrows and commas inside strings"'
]
)");
    EXPECT_EQ(config.validator_kind, "execution");
    EXPECT_EQ(config.entry_point, "f");
    EXPECT_EQ(config.timeout, 250ms);
    ASSERT_EQ(config.tests.size(), 5);

    const auto& t0 = config.tests[0];
    ASSERT_EQ(t0.input.size(), 1);
    EXPECT_EQ(t0.input[0].first, "x");
    EXPECT_EQ(chk::lang::repr(t0.input[0].second), "2");
    EXPECT_EQ(chk::lang::repr(t0.expected), "4");
    EXPECT_EQ(t0.description, "doubles 2");

    const auto& t1 = config.tests[1];
    ASSERT_EQ(t1.input.size(), 2);
    EXPECT_EQ(t1.input[0].first, "a");
    EXPECT_EQ(chk::lang::repr(t1.input[0].second), "[1, 2]");
    EXPECT_EQ(t1.input[1].first, "b");
    EXPECT_EQ(chk::lang::repr(t1.input[1].second), "None");
    EXPECT_EQ(chk::lang::repr(t1.expected), "{'k': (1, 'x')}");
    EXPECT_FALSE(t1.description.has_value());

    EXPECT_TRUE(config.tests[2].input.empty());
    EXPECT_EQ(chk::lang::repr(config.tests[2].expected), "(1, 2)");
    EXPECT_EQ(chk::lang::repr(config.tests[3].expected), "(1, 2)");
    EXPECT_FALSE(config.tests[3].description.has_value());

    const auto& t4 = config.tests[4];
    EXPECT_EQ(chk::lang::repr(t4.input[0].second), "'a -> b, c'");
    EXPECT_EQ(chk::lang::repr(t4.expected), "'a, b'");
    EXPECT_EQ(t4.description, "arrows and commas inside strings");
}

// NOLINTNEXTLINE
TEST(checkpoint_file, timeouts) {
    EXPECT_EQ(parse_checkpoint_config("timeout: 3").timeout, 3s);
    EXPECT_EQ(parse_checkpoint_config("timeout: 1.5").timeout, 1500ms);
    EXPECT_EQ(parse_checkpoint_config("timeout: .5").timeout, 500ms);
    EXPECT_EQ(parse_checkpoint_config("timeout: 2.").timeout, 2s);
    EXPECT_EQ(parse_checkpoint_config("timeout: 0").timeout, 0s);

    EXPECT_EQ(
        file_error("timeout: abc"),
        "line 1: timeout has to be a number of seconds, got: `abc`"
    );
    EXPECT_EQ(
        file_error("timeout: -1"),
        "line 1: timeout has to be a number of seconds, got: `-1`"
    );
    EXPECT_EQ(file_error("timeout: ."), "line 1: timeout has to be a number of seconds, got: `.`");
    EXPECT_EQ(
        file_error("timeout: 1s"),
        "line 1: timeout has to be a number of seconds, got: `1s`"
    );
    EXPECT_EQ(file_error("timeout: 99999999"), "line 1: timeout is too large: 99999999");
}

// NOLINTNEXTLINE
TEST(checkpoint_file, invalid_checks) {
    EXPECT_EQ(
        file_error("checks: ['regex required \"x\"']"),
        "line 1: a check has to be `<kind> <required|optional> <pattern> <message>`, got: "
        "regex required \"x\""
    );
    EXPECT_EQ(
        file_error("\nchecks: ['grep required \"x\" \"y\"']"),
        "line 2: unknown check kind: `grep`"
    );
    EXPECT_EQ(
        file_error("checks: ['regex mandatory \"x\" \"y\"']"),
        "line 1: expected `required` or `optional`, got: `mandatory`"
    );
    EXPECT_EQ(
        file_error("checks: ['regex required x \"y\"']"),
        "line 1: the pattern has to be a string literal, got: `x`"
    );
    EXPECT_EQ(
        file_error("checks: ['regex required \"x\" f\"y\"']"),
        "line 1: the message has to be a string literal, got: `y`"
    );
    EXPECT_EQ(
        file_error("checks: ['regex required \"x']").rfind("line 1: invalid entry `regex required \"x`: ", 0),
        0
    );
}

// NOLINTNEXTLINE
TEST(checkpoint_file, invalid_tests) {
    EXPECT_EQ(
        file_error("tests: ['{\"x\": 1} 2']"),
        "line 1: a test has to be `<input> -> <expected>[, <description>]`, got: {\"x\": 1} 2"
    );
    EXPECT_EQ(file_error("tests: ['-> 2']"), "line 1: missing test input");
    EXPECT_EQ(file_error("tests: ['{} ->']"), "line 1: missing expected value");
    EXPECT_EQ(file_error("tests: ['{} -> , \"d\"']"), "line 1: missing expected value");
    EXPECT_EQ(
        file_error("tests: ['[1] -> 2']"), "line 1: test input has to be a dict of arguments, got: [1]"
    );
    EXPECT_EQ(
        file_error("tests: ['{1: 2} -> 2']"), "line 1: argument names have to be strings, got: 1"
    );
    EXPECT_EQ(
        file_error("tests: ['{\"a\": 1, \"a\": 2} -> 2']"), "line 1: argument `a` is given more than once"
    );
    EXPECT_EQ(
        file_error("tests: ['{\"a\": x} -> 2']"),
        "line 1: invalid test input: malformed node or string on line 1: Name"
    );
    EXPECT_EQ(
        file_error("tests: ['{} -> len(x)']"),
        "line 1: invalid expected value: malformed node or string on line 1: Call"
    );
}

// NOLINTNEXTLINE
TEST(checkpoint_file, invalid_variable_types) {
    EXPECT_EQ(file_error("type: [static]"), "line 1: `type` has to be a string");
    EXPECT_EQ(file_error("function_name: [f]"), "line 1: `function_name` has to be a string");
    EXPECT_EQ(file_error("\n\nchecks: x"), "line 3: `checks` has to be an array");
    EXPECT_EQ(file_error("tests: x"), "line 1: `tests` has to be an array");
}

// NOLINTNEXTLINE
TEST(checkpoint_file, config_syntax_error) {
    EXPECT_THROW((void)parse_checkpoint_config("tests: [\n"), ConfigFile::ParseError);
}

// NOLINTNEXTLINE
TEST(checkpoint_file, load_from_file) {
    auto config = chk::load_checkpoint_config("checkpoints/square.chk");
    EXPECT_EQ(config.validator_kind, "execution");
    EXPECT_EQ(config.entry_point, "square");
    EXPECT_EQ(config.timeout, 2s);
    ASSERT_EQ(config.tests.size(), 4);
    EXPECT_EQ(config.tests[0].description, "squares a positive number");

    EXPECT_THROW(
        (void)chk::load_checkpoint_config("checkpoints/nonexistent.chk"), std::runtime_error
    );
}
