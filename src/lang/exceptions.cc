#include <chklib/lang/exceptions.hh>

namespace chk::lang {

namespace {

constexpr std::optional<ExceptionKind> parent_of(ExceptionKind kind) noexcept {
    using EK = ExceptionKind;
    switch (kind) {
    case EK::BASE_EXCEPTION: return std::nullopt;
    case EK::EXCEPTION: return EK::BASE_EXCEPTION;
    case EK::ZERO_DIVISION_ERROR:
    case EK::OVERFLOW_ERROR: return EK::ARITHMETIC_ERROR;
    case EK::INDEX_ERROR:
    case EK::KEY_ERROR: return EK::LOOKUP_ERROR;
    case EK::UNBOUND_LOCAL_ERROR: return EK::NAME_ERROR;
    case EK::RECURSION_ERROR:
    case EK::NOT_IMPLEMENTED_ERROR: return EK::RUNTIME_ERROR;
    case EK::ARITHMETIC_ERROR:
    case EK::LOOKUP_ERROR:
    case EK::NAME_ERROR:
    case EK::TYPE_ERROR:
    case EK::VALUE_ERROR:
    case EK::ATTRIBUTE_ERROR:
    case EK::MEMORY_ERROR:
    case EK::RUNTIME_ERROR:
    case EK::ASSERTION_ERROR:
    case EK::IMPORT_ERROR:
    case EK::STOP_ITERATION:
    case EK::SYNTAX_ERROR: return EK::EXCEPTION;
    }
    return std::nullopt;
}

} // namespace

std::string_view exception_kind_name(ExceptionKind kind) noexcept {
    using EK = ExceptionKind;
    switch (kind) {
    case EK::BASE_EXCEPTION: return "BaseException";
    case EK::EXCEPTION: return "Exception";
    case EK::ARITHMETIC_ERROR: return "ArithmeticError";
    case EK::ZERO_DIVISION_ERROR: return "ZeroDivisionError";
    case EK::OVERFLOW_ERROR: return "OverflowError";
    case EK::LOOKUP_ERROR: return "LookupError";
    case EK::INDEX_ERROR: return "IndexError";
    case EK::KEY_ERROR: return "KeyError";
    case EK::NAME_ERROR: return "NameError";
    case EK::UNBOUND_LOCAL_ERROR: return "UnboundLocalError";
    case EK::TYPE_ERROR: return "TypeError";
    case EK::VALUE_ERROR: return "ValueError";
    case EK::ATTRIBUTE_ERROR: return "AttributeError";
    case EK::MEMORY_ERROR: return "MemoryError";
    case EK::RUNTIME_ERROR: return "RuntimeError";
    case EK::RECURSION_ERROR: return "RecursionError";
    case EK::NOT_IMPLEMENTED_ERROR: return "NotImplementedError";
    case EK::ASSERTION_ERROR: return "AssertionError";
    case EK::IMPORT_ERROR: return "ImportError";
    case EK::STOP_ITERATION: return "StopIteration";
    case EK::SYNTAX_ERROR: return "SyntaxError";
    }
    return "Exception";
}

bool is_exception_subclass(ExceptionKind kind, ExceptionKind base) noexcept {
    for (std::optional<ExceptionKind> cur = kind; cur; cur = parent_of(*cur)) {
        if (*cur == base) {
            return true;
        }
    }
    return false;
}

} // namespace chk::lang
