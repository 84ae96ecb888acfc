#pragma once

#include <chklib/checkpoint/checkpoint_config.hh>
#include <chklib/checkpoint/validation_result.hh>
#include <chklib/logger.hh>
#include <chrono>
#include <cstddef>
#include <string_view>

namespace chk {

// Receives the steps of a single validation, in order of occurrence
class ValidationLogger {
public:
    ValidationLogger() = default;

    ValidationLogger(const ValidationLogger&) = delete;
    ValidationLogger(ValidationLogger&&) = delete;
    ValidationLogger& operator=(const ValidationLogger&) = delete;
    ValidationLogger& operator=(ValidationLogger&&) = delete;

    virtual void begin(std::string_view validator_kind, size_t code_size) = 0;

    virtual void rule(const CheckRule& rule, bool satisfied) = 0;

    // @p detail is empty for a passed test, otherwise it is the error line
    virtual void test(size_t test_no, bool passed, std::string_view detail) = 0;

    // Called once per execution with everything the submission printed
    virtual void program_output(std::string_view output, bool truncated) = 0;

    virtual void warning(std::string_view message) = 0;

    virtual void end(const ValidationResult& result, std::chrono::nanoseconds elapsed) = 0;

    virtual ~ValidationLogger() = default;
};

class StdlogValidationLogger : public ValidationLogger {
    Logger& logger_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)

public:
    explicit StdlogValidationLogger(Logger& logger) noexcept : logger_{logger} {}

    StdlogValidationLogger(const StdlogValidationLogger&) = delete;
    StdlogValidationLogger(StdlogValidationLogger&&) = delete;
    StdlogValidationLogger& operator=(const StdlogValidationLogger&) = delete;
    StdlogValidationLogger& operator=(StdlogValidationLogger&&) = delete;
    ~StdlogValidationLogger() override = default;

    void begin(std::string_view validator_kind, size_t code_size) override;

    void rule(const CheckRule& rule, bool satisfied) override;

    void test(size_t test_no, bool passed, std::string_view detail) override;

    void program_output(std::string_view output, bool truncated) override;

    void warning(std::string_view message) override;

    void end(const ValidationResult& result, std::chrono::nanoseconds elapsed) override;
};

} // namespace chk
