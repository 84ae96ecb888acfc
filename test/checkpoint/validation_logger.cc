#include "intercept_logger.hh"

#include <chklib/checkpoint/validation_logger.hh>
#include <chrono>
#include <gtest/gtest.h>

using chk::CheckRule;
using chk::StdlogValidationLogger;

using namespace std::chrono_literals;

// NOLINTNEXTLINE
TEST(validation_logger, static_validation) {
    Logger logger(static_cast<FILE*>(nullptr));
    StdlogValidationLogger vlog{logger};
    auto logged = intercept_logger(logger, [&] {
        vlog.begin("static", 120);
        vlog.rule(
            {.kind = CheckRule::Kind::PATTERN, .pattern = R"(def\s+f)", .message = "", .required = true},
            true
        );
        vlog.rule(
            {.kind = CheckRule::Kind::STRUCTURE, .pattern = "While", .message = "", .required = false},
            false
        );
        vlog.warning("something is odd");
        vlog.end(
            {.passed = true, .message = "All checks passed!", .errors = {}, .hints = {}}, 12'345'678ns
        );
    });
    EXPECT_EQ(
        logged,
        "Validating (static): 120 bytes of code {\n"
        "  pattern `def\\s+f`: \033[1;32msatisfied\033[m\n"
        "  structure (optional) `While`: \033[1;31mnot satisfied\033[m\n"
        "  \033[1;33mWarning:\033[m something is odd\n"
        "} \033[1;32mpassed\033[m: All checks passed! (12.345 ms)\n"
    );
}

// NOLINTNEXTLINE
TEST(validation_logger, execution) {
    Logger logger(static_cast<FILE*>(nullptr));
    StdlogValidationLogger vlog{logger};
    auto logged = intercept_logger(logger, [&] {
        vlog.begin("execution", 7);
        vlog.test(1, true, "");
        vlog.test(2, false, "Test 2: Expected 4, got 5");
        vlog.program_output("first\nsecond\n", false);
        vlog.end(
            {.passed = false, .message = "1 test(s) failed", .errors = {}, .hints = {}}, 1'500us
        );
    });
    EXPECT_EQ(
        logged,
        "Validating (execution): 7 bytes of code {\n"
        "  Test 1: \033[1;32mOK\033[m\n"
        "  Test 2: \033[1;31mFAILED\033[m (Test 2: Expected 4, got 5)\n"
        "  Program output (13 bytes):\n"
        "  | first\n"
        "  | second\n"
        "} \033[1;31mfailed\033[m: 1 test(s) failed (1.500 ms)\n"
    );
}

// NOLINTNEXTLINE
TEST(validation_logger, program_output) {
    Logger logger(static_cast<FILE*>(nullptr));
    StdlogValidationLogger vlog{logger};
    EXPECT_EQ(intercept_logger(logger, [&] { vlog.program_output("", false); }), "");
    EXPECT_EQ(
        intercept_logger(logger, [&] { vlog.program_output("no newline", true); }),
        "  Program output (10 bytes, truncated):\n"
        "  | no newline\n"
    );
    EXPECT_EQ(
        intercept_logger(logger, [&] { vlog.program_output("\n\nx", false); }),
        "  Program output (3 bytes):\n"
        "  | \n"
        "  | \n"
        "  | x\n"
    );
}

// NOLINTNEXTLINE
TEST(validation_logger, elapsed_time) {
    Logger logger(static_cast<FILE*>(nullptr));
    StdlogValidationLogger vlog{logger};
    auto end_line = [&](std::chrono::nanoseconds elapsed) {
        return intercept_logger(logger, [&] {
            vlog.end({.passed = true, .message = "ok", .errors = {}, .hints = {}}, elapsed);
        });
    };
    EXPECT_EQ(end_line(7us), "} \033[1;32mpassed\033[m: ok (0.007 ms)\n");
    EXPECT_EQ(end_line(2'050us), "} \033[1;32mpassed\033[m: ok (2.050 ms)\n");
    EXPECT_EQ(end_line(3s), "} \033[1;32mpassed\033[m: ok (3000.000 ms)\n");
}
