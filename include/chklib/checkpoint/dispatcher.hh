#pragma once

#include <chklib/checkpoint/checkpoint_config.hh>
#include <chklib/checkpoint/validation_logger.hh>
#include <chklib/checkpoint/validation_result.hh>
#include <string_view>

namespace chk {

/**
 * @brief Validates @p code as the checkpoint @p config describes
 * @details Runs validate_static() or validate_execution() depending on
 *   config.validator_kind. An unknown kind or an inconsistent execution
 *   configuration yields a failed result naming the problem. The timeout of
 *   an execution checkpoint is clamped to limits::max_execution_timeout.
 *
 *   No exception leaves this function: an internal fault is logged to errlog
 *   and reported as a failed result.
 *
 * @param logger may be nullptr
 */
ValidationResult
dispatch(const CheckpointConfig& config, std::string_view code, ValidationLogger* logger = nullptr);

} // namespace chk
