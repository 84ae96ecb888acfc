#include "checkpoint/recording_logger.hh"

#include <chklib/checkpoint/static_validator.hh>
#include <chklib/limits.hh>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using chk::CheckRule;
using chk::validate_static;
using std::string;
using std::vector;

namespace {

CheckRule pattern(string regex, string message, bool required = true) {
    return {
        .kind = CheckRule::Kind::PATTERN,
        .pattern = std::move(regex),
        .message = std::move(message),
        .required = required,
    };
}

CheckRule structure(string node_kind, string message, bool required = true) {
    return {
        .kind = CheckRule::Kind::STRUCTURE,
        .pattern = std::move(node_kind),
        .message = std::move(message),
        .required = required,
    };
}

constexpr const char* loop_code = "def total(xs):\n"
                                  "    s = 0\n"
                                  "    for x in xs:\n"
                                  "        s += x\n"
                                  "    return s\n";

} // namespace

// NOLINTNEXTLINE
TEST(static_validator, all_rules_satisfied) {
    auto res = validate_static(
        loop_code,
        {
            pattern(R"(def\s+total\s*\()", "Define total"),
            structure("For", "Use a for loop"),
            structure("AugAssign", "Use +="),
        }
    );
    EXPECT_TRUE(res.passed);
    EXPECT_EQ(res.message, "All checks passed!");
    EXPECT_TRUE(res.errors.empty());
    EXPECT_TRUE(res.hints.empty());
}

// NOLINTNEXTLINE
TEST(static_validator, required_failures_become_errors_in_rule_order) {
    auto res = validate_static(
        loop_code,
        {
            structure("While", "Use a while loop"),
            pattern("print", "Print the result"),
            structure("For", "Use a for loop"),
        }
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Some checks failed");
    EXPECT_EQ(res.errors, (vector<string>{"Use a while loop", "Print the result"}));
    EXPECT_TRUE(res.hints.empty());
}

// NOLINTNEXTLINE
TEST(static_validator, optional_failures_become_hints) {
    auto res = validate_static(
        loop_code,
        {
            structure("For", "Use a for loop"),
            pattern(R"(sum\()", "Consider using sum()", false),
            structure("ListComp", "Consider a comprehension", false),
        }
    );
    EXPECT_TRUE(res.passed);
    EXPECT_EQ(res.message, "All checks passed!");
    EXPECT_TRUE(res.errors.empty());
    EXPECT_EQ(res.hints, (vector<string>{"Consider using sum()", "Consider a comprehension"}));
}

// NOLINTNEXTLINE
TEST(static_validator, no_rules_pass) {
    auto res = validate_static("x = 1\n", {});
    EXPECT_TRUE(res.passed);
    EXPECT_EQ(res.message, "All checks passed!");
}

// NOLINTNEXTLINE
TEST(static_validator, syntax_error_stops_validation) {
    RecordingLogger logger;
    auto res = validate_static(
        "def f(:\n    pass\n", {structure("FunctionDef", "Define a function")}, &logger
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Syntax error in your code");
    ASSERT_EQ(res.errors.size(), 1);
    EXPECT_EQ(res.errors[0].rfind("Line 1: ", 0), 0) << res.errors[0];
    EXPECT_EQ(res.hints, (vector<string>{"Check for missing colons, parentheses, or quotes"}));
    EXPECT_TRUE(logger.events.empty());
}

// NOLINTNEXTLINE
TEST(static_validator, syntax_error_line) {
    auto res = validate_static("x = 1\nif x\n    pass\n", {});
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.errors, (vector<string>{"Line 2: expected ':'"}));
}

// NOLINTNEXTLINE
TEST(static_validator, invalid_regex_is_a_configuration_error) {
    auto res = validate_static(
        loop_code, {structure("For", "Use a for loop"), pattern("([a-z", "Broken rule")}
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Invalid checkpoint configuration");
    ASSERT_EQ(res.errors.size(), 1);
    EXPECT_EQ(res.errors[0].rfind("invalid regular expression `([a-z`: ", 0), 0) << res.errors[0];
    EXPECT_TRUE(res.hints.empty());
}

// NOLINTNEXTLINE
TEST(static_validator, patterns_see_raw_text_including_comments) {
    auto res = validate_static(
        "# for x in range(10)\nx = 1\n",
        {pattern(R"(for \w+ in)", "Mention a loop"), structure("For", "Use a for loop")}
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.errors, (vector<string>{"Use a for loop"}));
}

// NOLINTNEXTLINE
TEST(static_validator, unknown_node_kind_warns) {
    RecordingLogger logger;
    auto res = validate_static("x = 1\n", {structure("Assignment", "Assign something")}, &logger);
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(
        logger.events,
        (vector<string>{
            "warning no syntax tree node is named `Assignment`, the rule is never satisfied",
            "rule Assignment failed",
        })
    );
}

// NOLINTNEXTLINE
TEST(static_validator, logs_every_rule) {
    RecordingLogger logger;
    (void)validate_static(
        loop_code,
        {structure("For", "Use a for loop"), pattern("while", "Use while", false)},
        &logger
    );
    EXPECT_EQ(logger.events, (vector<string>{"rule For ok", "rule while failed"}));
}

// NOLINTNEXTLINE
TEST(static_validator, oversized_submission) {
    string code(chk::limits::max_submission_size_in_bytes + 1, '#');
    auto res = validate_static(code, {structure("For", "Use a for loop")});
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Your code is too long");
    EXPECT_EQ(
        res.errors,
        (vector<string>{concat_tostr(
            "Code has ",
            code.size(),
            " bytes, at most ",
            chk::limits::max_submission_size_in_bytes,
            " bytes are allowed"
        )})
    );
}
