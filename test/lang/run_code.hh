#pragma once

#include <chklib/concat_tostr.hh>
#include <chklib/lang/deadline.hh>
#include <chklib/lang/exceptions.hh>
#include <chklib/lang/interpreter.hh>
#include <chklib/lang/parser.hh>
#include <chklib/lang/scope_analysis.hh>
#include <chrono>
#include <string>
#include <string_view>

/**
 * Runs @p code in a fresh interpreter and returns what it printed. An
 * uncaught exception is appended as `<name>: <message>`, a syntax error is
 * returned as `SyntaxError: line <n>: <message>`.
 */
inline std::string run_code(std::string_view code) {
    using namespace chk::lang;

    auto parsed = parse_module(code);
    if (parsed.is_err()) {
        auto err = std::move(parsed).unwrap_err();
        return concat_tostr("SyntaxError: line ", err.line, ": ", err.message);
    }
    auto module = std::move(parsed).unwrap();
    auto analyzed = analyze_scopes(*module);
    if (analyzed.is_err()) {
        auto err = std::move(analyzed).unwrap_err();
        return concat_tostr("SyntaxError: line ", err.line, ": ", err.message);
    }
    auto scopes = std::move(analyzed).unwrap();

    Deadline deadline{std::chrono::seconds{10}};
    Interpreter interpreter{*module, scopes, deadline};
    try {
        interpreter.run_module();
    } catch (const RaisedException& e) {
        return concat_tostr(interpreter.output(), exception_kind_name(e.kind()), ": ", e.message());
    }
    return interpreter.output();
}
