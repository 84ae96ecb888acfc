#pragma once

#include <chklib/checkpoint/checkpoint_config.hh>
#include <chklib/checkpoint/validation_logger.hh>
#include <chklib/checkpoint/validation_result.hh>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace chk {

/**
 * @brief Runs @p code and then calls its function @p entry_point once per
 *   test case, comparing the returned value with the expected one
 * @details Execution happens in a fresh interpreter that sees only the
 *   capability whitelist. A single deadline of @p timeout covers the module
 *   code and all the test calls; when it passes, the whole validation fails
 *   with a timeout result and no test result is kept. Every test is run even
 *   if an earlier one failed; an exception raised by a test call fails only
 *   that test.
 *
 * @param logger may be nullptr
 */
ValidationResult validate_execution(
    std::string_view code,
    const std::vector<TestCase>& tests,
    const std::string& entry_point,
    std::chrono::nanoseconds timeout,
    ValidationLogger* logger = nullptr
);

} // namespace chk
