#include "common.hh"

#include <chklib/checkpoint/sandbox_executor.hh>
#include <chklib/lang/deadline.hh>
#include <chklib/lang/exceptions.hh>
#include <chklib/lang/interpreter.hh>
#include <chklib/lang/operations.hh>
#include <chklib/lang/parser.hh>
#include <chklib/lang/scope_analysis.hh>
#include <exception>
#include <variant>

using std::string;
using std::string_view;
using std::vector;

namespace chk {

namespace {

// Python's str() of the value
string to_display_str(const lang::LiteralValue& val) {
    if (const auto* s = std::get_if<string>(&val.value)) {
        return *s;
    }
    return lang::repr(val);
}

// e.g. "5" or "0.5"
string seconds_str(std::chrono::nanoseconds timeout) {
    if (timeout.count() % 1'000'000'000 == 0) {
        return concat_tostr(timeout.count() / 1'000'000'000);
    }
    return lang::float_repr(std::chrono::duration<double>(timeout).count());
}

string test_description(const TestCase& test, size_t test_no) {
    return test.description ? *test.description : concat_tostr("Test ", test_no);
}

// Returns the error line or std::nullopt if the test passed
std::optional<string>
run_test(lang::Interpreter& interpreter, const lang::Value& entry, const TestCase& test, size_t test_no) {
    try {
        lang::KwArgs kwargs;
        kwargs.reserve(test.input.size());
        for (const auto& [name, val] : test.input) {
            kwargs.emplace_back(name, interpreter.from_literal(val));
        }
        auto result = interpreter.call(entry, {}, std::move(kwargs));
        auto expected = interpreter.from_literal(test.expected);
        if (lang::values_equal(result, expected)) {
            return std::nullopt;
        }
        return concat_tostr(
            test_description(test, test_no),
            ": Expected ",
            to_display_str(test.expected),
            ", got ",
            lang::str(result)
        );
    } catch (const lang::RaisedException& e) {
        return concat_tostr(
            test_description(test, test_no),
            ": Expected ",
            to_display_str(test.expected),
            ", got error: ",
            e.message()
        );
    }
}

ValidationResult run_tests(
    lang::Interpreter& interpreter,
    const vector<TestCase>& tests,
    const string& entry_point,
    ValidationLogger* logger
) {
    try {
        interpreter.run_module();
    } catch (const lang::RaisedException& e) {
        return {
            .passed = false,
            .message = "Error executing your code",
            .errors = {e.message()},
            .hints = {},
        };
    }

    auto entry = interpreter.lookup_global(entry_point);
    if (not entry or not lang::Interpreter::is_callable(*entry)) {
        return {
            .passed = false,
            .message = concat_tostr("Function \"", entry_point, "\" not found in your code"),
            .errors = {concat_tostr("Expected to find function: ", entry_point)},
            .hints = {},
        };
    }

    ValidationResult res;
    for (size_t i = 0; i < tests.size(); ++i) {
        auto error = run_test(interpreter, *entry, tests[i], i + 1);
        if (logger) {
            logger->test(i + 1, not error, error ? string_view{*error} : string_view{});
        }
        if (error) {
            res.errors.emplace_back(*std::move(error));
        }
    }

    res.passed = res.errors.empty();
    res.message = res.passed ? concat_tostr("All ", tests.size(), " test(s) passed!")
                             : concat_tostr(res.errors.size(), " test(s) failed");
    return res;
}

ValidationResult run(
    const lang::Module& module,
    const lang::ScopeTable& scopes,
    const lang::Deadline& deadline,
    const vector<TestCase>& tests,
    const string& entry_point,
    ValidationLogger* logger
) {
    lang::Interpreter interpreter{module, scopes, deadline};
    // The output is logged on every exit path, a logger failure propagates to the caller
    auto log_output = [&] {
        if (logger) {
            logger->program_output(interpreter.output(), interpreter.output_truncated());
        }
    };

    ValidationResult res;
    try {
        res = run_tests(interpreter, tests, entry_point, logger);
    } catch (const std::exception&) {
        log_output();
        throw;
    }
    log_output();
    return res;
}

} // namespace

ValidationResult validate_execution(
    string_view code,
    const vector<TestCase>& tests,
    const string& entry_point,
    std::chrono::nanoseconds timeout,
    ValidationLogger* logger
) {
    if (auto res = detail::check_submission_size(code)) {
        return *std::move(res);
    }

    auto parsed = lang::parse_module(code);
    if (parsed.is_err()) {
        return detail::syntax_error_result(std::move(parsed).unwrap_err());
    }
    auto module = std::move(parsed).unwrap();

    // Checks done by Python's compile(): they surface as an error of the execution
    auto analyzed = lang::analyze_scopes(*module);
    if (analyzed.is_err()) {
        auto error = std::move(analyzed).unwrap_err();
        return {
            .passed = false,
            .message = "Error executing your code",
            .errors = {concat_tostr(error.message, " (<student_code>, line ", error.line, ')')},
            .hints = {},
        };
    }
    auto scopes = std::move(analyzed).unwrap();

    lang::Deadline deadline{timeout};
    try {
        return run(*module, scopes, deadline, tests, entry_point, logger);
    } catch (const lang::ExecutionTimeout&) {
        return {
            .passed = false,
            .message = "Code execution timeout",
            .errors = {concat_tostr("Code execution timed out after ", seconds_str(timeout), " seconds")
            },
            .hints = {"Your code might have an infinite loop"},
        };
    }
}

} // namespace chk
