#pragma once

#include <utility>

// Calls func at the end of the scope, also when the scope is left by an exception
template <class Func>
class Defer {
    Func func_;

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Defer(Func func) try : func_(std::move(func)) {
    } catch (...) {
        func();
        throw;
    }

    Defer(const Defer&) = delete;
    Defer(Defer&&) = delete;
    Defer& operator=(const Defer&) = delete;
    Defer& operator=(Defer&&) = delete;

    ~Defer() { func_(); }
};
