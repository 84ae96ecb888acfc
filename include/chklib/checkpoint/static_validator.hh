#pragma once

#include <chklib/checkpoint/checkpoint_config.hh>
#include <chklib/checkpoint/validation_logger.hh>
#include <chklib/checkpoint/validation_result.hh>
#include <string_view>
#include <vector>

namespace chk {

/**
 * @brief Checks @p code against @p rules without executing it
 * @details The code is parsed first, a syntax error fails the validation
 *   before any rule is evaluated. Then every rule is evaluated, in order:
 *   a failed required rule adds its message to the errors, a failed optional
 *   one to the hints. The result passes iff there are no errors.
 *
 *   An invalid regular expression fails the validation as a configuration
 *   error.
 *
 * @param logger may be nullptr
 */
ValidationResult validate_static(
    std::string_view code, const std::vector<CheckRule>& rules, ValidationLogger* logger = nullptr
);

} // namespace chk
