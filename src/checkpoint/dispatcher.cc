#include "common.hh"

#include <algorithm>
#include <chklib/checkpoint/dispatcher.hh>
#include <chklib/checkpoint/sandbox_executor.hh>
#include <chklib/checkpoint/static_validator.hh>
#include <chklib/lang/lexer.hh>
#include <chklib/logger.hh>
#include <exception>

using std::string_view;

namespace chk {

namespace {

std::optional<ValidationResult> check_execution_config(const CheckpointConfig& config) {
    if (config.entry_point.empty()) {
        return detail::configuration_error_result("Execution checkpoint does not name a function");
    }
    if (not lang::is_identifier(config.entry_point)) {
        return detail::configuration_error_result(
            concat_tostr("Function name \"", config.entry_point, "\" is not an identifier")
        );
    }
    if (config.timeout <= std::chrono::nanoseconds::zero()) {
        return detail::configuration_error_result("Timeout has to be positive");
    }
    return std::nullopt;
}

ValidationResult
dispatch_impl(const CheckpointConfig& config, string_view code, ValidationLogger* logger) {
    if (config.validator_kind == "static") {
        return validate_static(code, config.rules, logger);
    }
    if (config.validator_kind == "execution") {
        if (auto res = check_execution_config(config)) {
            return *std::move(res);
        }
        auto timeout = std::min<std::chrono::nanoseconds>(
            config.timeout, limits::max_execution_timeout
        );
        return validate_execution(code, config.tests, config.entry_point, timeout, logger);
    }
    return {
        .passed = false,
        .message = concat_tostr("Unknown validator type: ", config.validator_kind),
        .errors = {concat_tostr("Validator type \"", config.validator_kind, "\" not supported")},
        .hints = {},
    };
}

} // namespace

ValidationResult dispatch(const CheckpointConfig& config, string_view code, ValidationLogger* logger) {
    auto start = std::chrono::steady_clock::now();
    ValidationResult res;
    try {
        if (logger) {
            logger->begin(config.validator_kind, code.size());
        }
        res = dispatch_impl(config, code, logger);
    } catch (const std::exception& e) {
        errlog("Internal validation error: ", e.what());
        res = {
            .passed = false,
            .message = "Internal validation error",
            .errors = {},
            .hints = {},
        };
    }

    if (logger) {
        try {
            logger->end(res, std::chrono::steady_clock::now() - start);
        } catch (const std::exception& e) {
            errlog("Validation logger failed: ", e.what());
        }
    }
    return res;
}

} // namespace chk
