#include "checkpoint/recording_logger.hh"

#include <chklib/checkpoint/sandbox_executor.hh>
#include <chklib/lang/literal.hh>
#include <chrono>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

using chk::TestCase;
using chk::validate_execution;
using std::string;
using std::vector;

using namespace std::chrono_literals;

namespace {

chk::lang::LiteralValue lit(string text) { return chk::lang::parse_literal(text).unwrap(); }

TestCase test_case(
    vector<std::pair<string, string>> args,
    string expected,
    std::optional<string> description = {}
) {
    TestCase res;
    for (auto& [name, val] : args) {
        res.input.emplace_back(std::move(name), lit(std::move(val)));
    }
    res.expected = lit(std::move(expected));
    res.description = std::move(description);
    return res;
}

constexpr const char* square_code = "def square(x):\n"
                                    "    return x * x\n";

} // namespace

// NOLINTNEXTLINE
TEST(sandbox_executor, all_tests_pass) {
    auto res = validate_execution(
        square_code,
        {
            test_case({{"x", "2"}}, "4"),
            test_case({{"x", "-3"}}, "9"),
            test_case({{"x", "1.5"}}, "2.25"),
        },
        "square",
        5s
    );
    EXPECT_TRUE(res.passed);
    EXPECT_EQ(res.message, "All 3 test(s) passed!");
    EXPECT_TRUE(res.errors.empty());
    EXPECT_TRUE(res.hints.empty());
}

// NOLINTNEXTLINE
TEST(sandbox_executor, no_tests) {
    auto res = validate_execution(square_code, {}, "square", 5s);
    EXPECT_TRUE(res.passed);
    EXPECT_EQ(res.message, "All 0 test(s) passed!");
}

// NOLINTNEXTLINE
TEST(sandbox_executor, failed_tests_are_reported_in_order) {
    auto res = validate_execution(
        "def greet(name):\n    return 'Hello ' + name\n",
        {
            test_case({{"name", "'Bob'"}}, "'Hello, Bob!'", "greets Bob"),
            test_case({{"name", "'Ann'"}}, "'Hello Ann'"),
            test_case({{"name", "'Eve'"}}, "'Hi Eve'"),
        },
        "greet",
        5s
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "2 test(s) failed");
    EXPECT_EQ(
        res.errors,
        (vector<string>{
            "greets Bob: Expected Hello, Bob!, got Hello Bob",
            "Test 3: Expected Hi Eve, got Hello Eve",
        })
    );
}

// NOLINTNEXTLINE
TEST(sandbox_executor, non_string_values_are_shown_with_repr) {
    auto res = validate_execution(
        "def pair(a, b):\n    return [a, str(b)]\n",
        {test_case({{"a", "1"}, {"b", "2"}}, "[1, 2]")},
        "pair",
        5s
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.errors, (vector<string>{"Test 1: Expected [1, 2], got [1, '2']"}));
}

// NOLINTNEXTLINE
TEST(sandbox_executor, numeric_equality_across_types) {
    auto res = validate_execution(
        "def half(x):\n    return x / 2\n", {test_case({{"x", "4"}}, "2")}, "half", 5s
    );
    EXPECT_TRUE(res.passed);
}

// NOLINTNEXTLINE
TEST(sandbox_executor, exception_fails_only_its_test) {
    auto res = validate_execution(
        "def inverse(x):\n    return 1 / x\n",
        {test_case({{"x", "0"}}, "0"), test_case({{"x", "2"}}, "0.5")},
        "inverse",
        5s
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "1 test(s) failed");
    EXPECT_EQ(res.errors, (vector<string>{"Test 1: Expected 0, got error: division by zero"}));
}

// NOLINTNEXTLINE
TEST(sandbox_executor, expected_exception_message) {
    auto res = validate_execution(
        "def check(age):\n"
        "    if age < 0:\n"
        "        raise ValueError('Age cannot be negative')\n"
        "    return age\n",
        {test_case({{"age", "-1"}}, "'Age cannot be negative'")},
        "check",
        5s
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(
        res.errors,
        (vector<string>{"Test 1: Expected Age cannot be negative, got error: Age cannot be negative"})
    );
}

// NOLINTNEXTLINE
TEST(sandbox_executor, wrong_argument_name) {
    auto res = validate_execution(square_code, {test_case({{"y", "2"}}, "4")}, "square", 5s);
    EXPECT_FALSE(res.passed);
    ASSERT_EQ(res.errors.size(), 1);
    EXPECT_EQ(res.errors[0].rfind("Test 1: Expected 4, got error: ", 0), 0) << res.errors[0];
}

// NOLINTNEXTLINE
TEST(sandbox_executor, error_in_module_code) {
    auto res = validate_execution(
        "x = undefined_name\n\ndef f():\n    return 1\n", {test_case({}, "1")}, "f", 5s
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Error executing your code");
    EXPECT_EQ(res.errors, (vector<string>{"name 'undefined_name' is not defined"}));
}

// NOLINTNEXTLINE
TEST(sandbox_executor, compile_time_error) {
    auto res = validate_execution("return 5\n", {}, "f", 5s);
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Error executing your code");
    EXPECT_EQ(res.errors, (vector<string>{"'return' outside function (<student_code>, line 1)"}));
}

// NOLINTNEXTLINE
TEST(sandbox_executor, syntax_error) {
    RecordingLogger logger;
    auto res = validate_execution("def f(\n", {test_case({}, "1")}, "f", 5s, &logger);
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Syntax error in your code");
    EXPECT_EQ(res.hints, (vector<string>{"Check for missing colons, parentheses, or quotes"}));
    EXPECT_TRUE(logger.events.empty());
}

// NOLINTNEXTLINE
TEST(sandbox_executor, missing_entry_point) {
    auto res = validate_execution(square_code, {test_case({{"x", "2"}}, "4")}, "cube", 5s);
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Function \"cube\" not found in your code");
    EXPECT_EQ(res.errors, (vector<string>{"Expected to find function: cube"}));
}

// NOLINTNEXTLINE
TEST(sandbox_executor, entry_point_is_not_callable) {
    auto res = validate_execution("f = 5\n", {test_case({}, "5")}, "f", 5s);
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Function \"f\" not found in your code");
}

// NOLINTNEXTLINE
TEST(sandbox_executor, infinite_loop_in_module_code) {
    auto res = validate_execution("while True:\n    pass\n", {test_case({}, "1")}, "f", 200ms);
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Code execution timeout");
    EXPECT_EQ(res.errors, (vector<string>{"Code execution timed out after 0.2 seconds"}));
    EXPECT_EQ(res.hints, (vector<string>{"Your code might have an infinite loop"}));
}

// NOLINTNEXTLINE
TEST(sandbox_executor, infinite_loop_in_a_test_discards_all_results) {
    auto res = validate_execution(
        "def f(n):\n"
        "    while n != 0:\n"
        "        n -= 2\n"
        "    return 0\n",
        {test_case({{"n", "4"}}, "0"), test_case({{"n", "5"}}, "0"), test_case({{"n", "2"}}, "1")},
        "f",
        1s
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Code execution timeout");
    EXPECT_EQ(res.errors, (vector<string>{"Code execution timed out after 1 seconds"}));
}

// NOLINTNEXTLINE
TEST(sandbox_executor, only_whitelisted_names_are_available) {
    auto res = validate_execution(
        "def f():\n    return open('/etc/passwd').read()\n", {test_case({}, "''")}, "f", 5s
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(
        res.errors,
        (vector<string>{"Test 1: Expected , got error: name 'open' is not defined"})
    );

    res = validate_execution("import os\n\ndef f():\n    return 1\n", {test_case({}, "1")}, "f", 5s);
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Error executing your code");
}

// NOLINTNEXTLINE
TEST(sandbox_executor, state_persists_between_tests) {
    auto res = validate_execution(
        "calls = []\n"
        "\n"
        "def f(x):\n"
        "    calls.append(x)\n"
        "    return len(calls)\n",
        {test_case({{"x", "'a'"}}, "1"), test_case({{"x", "'b'"}}, "2")},
        "f",
        5s
    );
    EXPECT_TRUE(res.passed);
}

// NOLINTNEXTLINE
TEST(sandbox_executor, logging) {
    RecordingLogger logger;
    (void)validate_execution(
        "print('hi')\n\ndef f(x):\n    print(x)\n    return x\n",
        {test_case({{"x", "1"}}, "1"), test_case({{"x", "2"}}, "3")},
        "f",
        5s,
        &logger
    );
    EXPECT_EQ(
        logger.events,
        (vector<string>{"test 1 ok", "test 2 failed: Test 2: Expected 3, got 2", "output"})
    );
    EXPECT_EQ(logger.output, "hi\n1\n2\n");
    EXPECT_FALSE(logger.output_truncated);
}
