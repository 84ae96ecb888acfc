#include "checkpoint/recording_logger.hh"
#include "intercept_logger.hh"

#include <chklib/checkpoint/checkpoint_file.hh>
#include <chklib/checkpoint/dispatcher.hh>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using chk::CheckpointConfig;
using chk::dispatch;
using chk::parse_checkpoint_config;
using std::string;
using std::vector;

using namespace std::chrono_literals;

namespace {

CheckpointConfig execution_config(string function_name, std::chrono::nanoseconds timeout) {
    CheckpointConfig config;
    config.validator_kind = "execution";
    config.entry_point = std::move(function_name);
    config.timeout = timeout;
    return config;
}

// Throws from the step named in the constructor, records the other steps
class FailingLogger : public RecordingLogger {
    string failing_step_;

    void fail_at(std::string_view step) {
        if (step == failing_step_) {
            throw std::runtime_error(concat_tostr(step, " logging failed"));
        }
    }

public:
    explicit FailingLogger(string failing_step) : failing_step_{std::move(failing_step)} {}

    void rule(const chk::CheckRule& rule, bool satisfied) override {
        fail_at("rule");
        RecordingLogger::rule(rule, satisfied);
    }

    void test(size_t test_no, bool passed, std::string_view detail) override {
        fail_at("test");
        RecordingLogger::test(test_no, passed, detail);
    }

    void program_output(std::string_view out, bool truncated) override {
        fail_at("program_output");
        RecordingLogger::program_output(out, truncated);
    }

    void end(const chk::ValidationResult& result, std::chrono::nanoseconds elapsed) override {
        fail_at("end");
        RecordingLogger::end(result, elapsed);
    }
};

CheckpointConfig square_config() {
    return parse_checkpoint_config(R"(type: execution
function_name: square
tests: ['{"x": 3} -> 9']
)");
}

constexpr const char* square_code = "def square(x):\n"
                                    "    print(x)\n"
                                    "    return x * x\n";

} // namespace

// NOLINTNEXTLINE
TEST(dispatcher, static_checkpoint) {
    auto config = chk::load_checkpoint_config("checkpoints/validate_age.chk");
    auto res = dispatch(
        config,
        "def validate_age(age):\n"
        "    if age < 0:\n"
        "        raise ValueError('Age cannot be negative')\n"
        "    return age\n"
    );
    EXPECT_TRUE(res.passed);
    EXPECT_EQ(res.message, "All checks passed!");

    res = dispatch(config, "def validate_age(age):\n    return age\n");
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(
        res.errors,
        (vector<string>{"Raise an exception for invalid input", "Raise a ValueError"})
    );
    EXPECT_EQ(res.hints, (vector<string>{"Compare the age with the allowed bounds"}));
}

// NOLINTNEXTLINE
TEST(dispatcher, execution_checkpoint) {
    auto config = chk::load_checkpoint_config("checkpoints/word_count.chk");
    auto res = dispatch(
        config,
        "def word_count(text):\n"
        "    counts = {}\n"
        "    for word in text.lower().split():\n"
        "        counts[word] = counts.get(word, 0) + 1\n"
        "    return counts\n"
    );
    EXPECT_TRUE(res.passed);
    EXPECT_EQ(res.message, "All 3 test(s) passed!");

    res = dispatch(
        config,
        "def word_count(text):\n"
        "    return {w: text.split().count(w) for w in text.split()}\n"
    );
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "1 test(s) failed");
    EXPECT_EQ(
        res.errors,
        (vector<string>{"is case insensitive: Expected {'hi': 2}, got {'Hi': 1, 'hi': 1}"})
    );
}

// NOLINTNEXTLINE
TEST(dispatcher, unknown_validator_kind) {
    CheckpointConfig config;
    config.validator_kind = "manual";
    auto res = dispatch(config, "x = 1\n");
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Unknown validator type: manual");
    EXPECT_EQ(res.errors, (vector<string>{"Validator type \"manual\" not supported"}));
    EXPECT_TRUE(res.hints.empty());
}

// NOLINTNEXTLINE
TEST(dispatcher, invalid_execution_config) {
    auto res = dispatch(execution_config("", 1s), "x = 1\n");
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Invalid checkpoint configuration");
    EXPECT_EQ(res.errors, (vector<string>{"Execution checkpoint does not name a function"}));

    res = dispatch(execution_config("my func", 1s), "x = 1\n");
    EXPECT_EQ(res.message, "Invalid checkpoint configuration");
    EXPECT_EQ(res.errors, (vector<string>{"Function name \"my func\" is not an identifier"}));

    res = dispatch(execution_config("f", 0s), "def f():\n    return 1\n");
    EXPECT_EQ(res.message, "Invalid checkpoint configuration");
    EXPECT_EQ(res.errors, (vector<string>{"Timeout has to be positive"}));
}

// NOLINTNEXTLINE
TEST(dispatcher, timeout_is_clamped) {
    auto config = parse_checkpoint_config(R"(type: execution
function_name: f
timeout: 3600
tests: ['{} -> 1']
)");
    auto start = std::chrono::steady_clock::now();
    auto res = dispatch(config, "while True:\n    pass\n");
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Code execution timeout");
    EXPECT_EQ(res.errors, (vector<string>{"Code execution timed out after 10 seconds"}));
    EXPECT_LT(elapsed, 60s);
}

// NOLINTNEXTLINE
TEST(dispatcher, logger_receives_begin_and_end) {
    RecordingLogger logger;
    CheckpointConfig config;
    config.rules.push_back({
        .kind = chk::CheckRule::Kind::STRUCTURE,
        .pattern = "Return",
        .message = "Return something",
        .required = true,
    });
    (void)dispatch(config, "x = 1\n", &logger);
    EXPECT_EQ(
        logger.events, (vector<string>{"begin static 6", "rule Return failed", "end failed"})
    );

    logger.events.clear();
    config.validator_kind = "manual";
    (void)dispatch(config, "", &logger);
    EXPECT_EQ(logger.events, (vector<string>{"begin manual 0", "end failed"}));
}

// NOLINTNEXTLINE
TEST(dispatcher, stdlog_logger) {
    Logger logger(static_cast<FILE*>(nullptr));
    chk::StdlogValidationLogger vlog{logger};
    CheckpointConfig config;
    config.validator_kind = "manual";
    auto logged = intercept_logger(logger, [&] { (void)dispatch(config, "abc", &vlog); });
    EXPECT_EQ(
        logged.rfind(
            "Validating (manual): 3 bytes of code {\n"
            "} \033[1;31mfailed\033[m: Unknown validator type: manual (",
            0
        ),
        0
    ) << logged;
}

// NOLINTNEXTLINE
TEST(dispatcher, failing_output_logging_becomes_internal_error) {
    FailingLogger logger{"program_output"};
    chk::ValidationResult res;
    auto logged = intercept_logger(errlog, [&] {
        res = dispatch(square_config(), square_code, &logger);
    });
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Internal validation error");
    EXPECT_TRUE(res.errors.empty());
    EXPECT_TRUE(res.hints.empty());
    EXPECT_EQ(logged, "Internal validation error: program_output logging failed\n");
    EXPECT_EQ(logger.events, (vector<string>{"begin execution 45", "test 1 ok", "end failed"}));
}

// NOLINTNEXTLINE
TEST(dispatcher, failing_test_logging_still_logs_output) {
    FailingLogger logger{"test"};
    chk::ValidationResult res;
    auto logged = intercept_logger(errlog, [&] {
        res = dispatch(square_config(), square_code, &logger);
    });
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Internal validation error");
    EXPECT_EQ(logged, "Internal validation error: test logging failed\n");
    EXPECT_EQ(logger.events, (vector<string>{"begin execution 45", "output", "end failed"}));
    EXPECT_EQ(logger.output, "3\n");
}

// NOLINTNEXTLINE
TEST(dispatcher, failing_rule_logging_becomes_internal_error) {
    FailingLogger logger{"rule"};
    CheckpointConfig config;
    config.rules.push_back({
        .kind = chk::CheckRule::Kind::PATTERN,
        .pattern = "x",
        .message = "Mention x",
        .required = true,
    });
    chk::ValidationResult res;
    auto logged = intercept_logger(errlog, [&] { res = dispatch(config, "x = 1\n", &logger); });
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.message, "Internal validation error");
    EXPECT_EQ(logged, "Internal validation error: rule logging failed\n");
    EXPECT_EQ(logger.events, (vector<string>{"begin static 6", "end failed"}));
}

// NOLINTNEXTLINE
TEST(dispatcher, failing_end_logging_keeps_the_result) {
    FailingLogger logger{"end"};
    chk::ValidationResult res;
    auto logged = intercept_logger(errlog, [&] {
        res = dispatch(square_config(), square_code, &logger);
    });
    EXPECT_TRUE(res.passed);
    EXPECT_EQ(res.message, "All 1 test(s) passed!");
    EXPECT_EQ(logged, "Validation logger failed: end logging failed\n");
}
