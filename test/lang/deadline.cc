#include <chklib/lang/deadline.hh>
#include <chklib/lang/exceptions.hh>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using chk::lang::Deadline;
using chk::lang::ExecutionTimeout;
using std::chrono_literals::operator""ms;

// NOLINTNEXTLINE
TEST(deadline, expires_after_timeout) {
    Deadline deadline{200ms};
    EXPECT_FALSE(deadline.expired());
    EXPECT_NO_THROW(deadline.check());
    auto start = std::chrono::steady_clock::now();
    while (not deadline.expired() and std::chrono::steady_clock::now() - start < 5000ms) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(deadline.expired());
    EXPECT_THROW(deadline.check(), ExecutionTimeout);
}

// NOLINTNEXTLINE
TEST(deadline, default_never_expires) {
    Deadline deadline;
    std::this_thread::sleep_for(10ms);
    EXPECT_FALSE(deadline.expired());
    EXPECT_NO_THROW(deadline.check());
}

// NOLINTNEXTLINE
TEST(deadline, cancel_stops_the_watchdog) {
    auto start = std::chrono::steady_clock::now();
    {
        Deadline deadline{std::chrono::seconds{30}};
        deadline.cancel();
        EXPECT_FALSE(deadline.expired());
        deadline.cancel();
    }
    // Neither cancel() nor the destructor waits for the timeout
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{10});
}

// NOLINTNEXTLINE
TEST(deadline, cancelled_deadline_does_not_expire) {
    Deadline deadline{30ms};
    deadline.cancel();
    std::this_thread::sleep_for(60ms);
    EXPECT_FALSE(deadline.expired());
    deadline.cancel();
}
