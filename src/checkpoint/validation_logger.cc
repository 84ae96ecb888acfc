#include <chklib/checkpoint/validation_logger.hh>
#include <chklib/concat_tostr.hh>
#include <string>

using std::string;
using std::string_view;

namespace {

// e.g. "12.345 ms"
string to_ms_str(std::chrono::nanoseconds duration) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(duration).count();
    auto frac = us % 1000;
    return concat_tostr(
        us / 1000, '.', frac < 100 ? "0" : "", frac < 10 ? "0" : "", frac, " ms"
    );
}

} // namespace

namespace chk {

void StdlogValidationLogger::begin(string_view validator_kind, size_t code_size) {
    logger_("Validating (", validator_kind, "): ", code_size, " bytes of code {");
}

void StdlogValidationLogger::rule(const CheckRule& rule, bool satisfied) {
    logger_(
        "  ",
        to_str(rule.kind),
        rule.required ? "" : " (optional)",
        " `",
        rule.pattern,
        "`: ",
        satisfied ? "\033[1;32msatisfied\033[m" : "\033[1;31mnot satisfied\033[m"
    );
}

void StdlogValidationLogger::test(size_t test_no, bool passed, string_view detail) {
    if (passed) {
        logger_("  Test ", test_no, ": \033[1;32mOK\033[m");
    } else {
        logger_("  Test ", test_no, ": \033[1;31mFAILED\033[m (", detail, ')');
    }
}

void StdlogValidationLogger::program_output(string_view output, bool truncated) {
    if (output.empty()) {
        return;
    }
    logger_("  Program output (", output.size(), " bytes", truncated ? ", truncated" : "", "):");
    while (not output.empty()) {
        auto pos = output.find('\n');
        logger_("  | ", output.substr(0, pos));
        if (pos == string_view::npos) {
            break;
        }
        output.remove_prefix(pos + 1);
    }
}

void StdlogValidationLogger::warning(string_view message) {
    logger_("  \033[1;33mWarning:\033[m ", message);
}

void StdlogValidationLogger::end(const ValidationResult& result, std::chrono::nanoseconds elapsed) {
    logger_(
        "} ",
        result.passed ? "\033[1;32mpassed\033[m" : "\033[1;31mfailed\033[m",
        ": ",
        result.message,
        " (",
        to_ms_str(elapsed),
        ')'
    );
}

} // namespace chk
