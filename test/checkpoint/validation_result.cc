#include <chklib/checkpoint/validation_result.hh>
#include <gtest/gtest.h>

using chk::ValidationResult;

// NOLINTNEXTLINE
TEST(validation_result, passed_result_omits_empty_lists) {
    ValidationResult res{.passed = true, .message = "All checks passed!", .errors = {}, .hints = {}};
    EXPECT_EQ(res.to_json(), R"({"passed":true,"message":"All checks passed!"})");
}

// NOLINTNEXTLINE
TEST(validation_result, failed_result) {
    ValidationResult res{
        .passed = false,
        .message = "Some checks failed",
        .errors = {"Must use a for loop", "Must define function"},
        .hints = {"Consider using f-strings"},
    };
    EXPECT_EQ(
        res.to_json(),
        R"({"passed":false,"message":"Some checks failed",)"
        R"("errors":["Must use a for loop","Must define function"],)"
        R"("hints":["Consider using f-strings"]})"
    );
}

// NOLINTNEXTLINE
TEST(validation_result, hints_without_errors) {
    ValidationResult res{.passed = true, .message = "ok", .errors = {}, .hints = {"hint"}};
    EXPECT_EQ(res.to_json(), R"({"passed":true,"message":"ok","hints":["hint"]})");
}

// NOLINTNEXTLINE
TEST(validation_result, strings_are_escaped) {
    ValidationResult res{
        .passed = false,
        .message = "Test \"x\": Expected\tA\nB\\",
        .errors = {std::string{"\x01"}},
        .hints = {},
    };
    EXPECT_EQ(
        res.to_json(),
        R"({"passed":false,"message":"Test \"x\": Expected\tA\nB\\","errors":["\u0001"]})"
    );
}
