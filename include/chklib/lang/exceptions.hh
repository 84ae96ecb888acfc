#pragma once

#include <chklib/concat_tostr.hh>
#include <chklib/lang/value.hh>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>

namespace chk::lang {

// Built-in exception classes of the runtime, in the hierarchy of Python's
// built-in exceptions
enum class ExceptionKind : uint8_t {
    BASE_EXCEPTION,
    EXCEPTION,
    ARITHMETIC_ERROR,
    ZERO_DIVISION_ERROR,
    OVERFLOW_ERROR,
    LOOKUP_ERROR,
    INDEX_ERROR,
    KEY_ERROR,
    NAME_ERROR,
    UNBOUND_LOCAL_ERROR,
    TYPE_ERROR,
    VALUE_ERROR,
    ATTRIBUTE_ERROR,
    MEMORY_ERROR,
    RUNTIME_ERROR,
    RECURSION_ERROR,
    NOT_IMPLEMENTED_ERROR,
    ASSERTION_ERROR,
    IMPORT_ERROR,
    STOP_ITERATION,
    SYNTAX_ERROR,
};

std::string_view exception_kind_name(ExceptionKind kind) noexcept;

// Whether @p kind is @p base or derives from it
bool is_exception_subclass(ExceptionKind kind, ExceptionKind base) noexcept;

/**
 * @brief A language-level exception propagating through the interpreter
 * @details Runtime errors carry only their kind and message, the exception
 *   instance is created when learner code binds it (`except E as e`).
 *   Raised by learner code, it carries the instance.
 */
class RaisedException : public std::exception {
    ExceptionKind kind_;
    std::string message_; // str() of the exception
    ObjRef instance_; // may be null

public:
    RaisedException(ExceptionKind kind, std::string message) noexcept
    : kind_{kind}
    , message_{std::move(message)} {}

    RaisedException(ExceptionKind kind, std::string message, ObjRef instance) noexcept
    : kind_{kind}
    , message_{std::move(message)}
    , instance_{std::move(instance)} {}

    RaisedException(const RaisedException&) = default;
    RaisedException(RaisedException&&) noexcept = default;
    RaisedException& operator=(const RaisedException&) = default;
    RaisedException& operator=(RaisedException&&) noexcept = default;
    ~RaisedException() override = default;

    [[nodiscard]] ExceptionKind kind() const noexcept { return kind_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const ObjRef& instance() const noexcept { return instance_; }

    void set_instance(ObjRef instance) noexcept { instance_ = std::move(instance); }

    [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }
};

template <class... Args>
[[noreturn]] void raise(ExceptionKind kind, Args&&... message) {
    throw RaisedException(kind, concat_tostr(std::forward<Args>(message)...));
}

// Thrown when the execution deadline passes, learner code cannot catch it
class ExecutionTimeout : public std::exception {
public:
    [[nodiscard]] const char* what() const noexcept override {
        return "execution deadline exceeded";
    }
};

} // namespace chk::lang
