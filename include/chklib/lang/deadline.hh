#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

namespace chk::lang {

/**
 * @brief Wall-clock deadline of a single execution
 * @details A watchdog thread raises the expiry flag once the deadline passes.
 *   The interpreter polls the flag at every step and throws ExecutionTimeout.
 *   cancel() (or the destructor) stops and joins the watchdog.
 */
class Deadline {
    std::atomic<bool> expired_ = false;
    std::promise<void> cancelled_promise_;
    std::future<void> cancelled_;
    std::thread watchdog_;
    bool running_ = false;

public:
    // Starts the watchdog
    explicit Deadline(std::chrono::nanoseconds timeout);

    // A deadline that never passes
    Deadline() noexcept = default;

    Deadline(const Deadline&) = delete;
    Deadline(Deadline&&) = delete;
    Deadline& operator=(const Deadline&) = delete;
    Deadline& operator=(Deadline&&) = delete;

    ~Deadline() { cancel(); }

    void cancel() noexcept;

    [[nodiscard]] bool expired() const noexcept {
        return expired_.load(std::memory_order_relaxed);
    }

    // Throws ExecutionTimeout if the deadline has passed
    void check() const;
};

} // namespace chk::lang
