#include <chklib/lang/deadline.hh>
#include <chklib/lang/exceptions.hh>

namespace chk::lang {

Deadline::Deadline(std::chrono::nanoseconds timeout)
: cancelled_{cancelled_promise_.get_future()} {
    watchdog_ = std::thread{[this, timeout] {
        if (cancelled_.wait_for(timeout) == std::future_status::timeout) {
            expired_.store(true, std::memory_order_relaxed);
        }
    }};
    running_ = true;
}

void Deadline::cancel() noexcept {
    if (running_) {
        cancelled_promise_.set_value();
        watchdog_.join();
        running_ = false;
    }
}

void Deadline::check() const {
    if (expired()) {
        throw ExecutionTimeout{};
    }
}

} // namespace chk::lang
