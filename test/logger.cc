#include "intercept_logger.hh"

#include <chklib/logger.hh>
#include <gtest/gtest.h>
#include <cstdio>
#include <regex>

// NOLINTNEXTLINE
TEST(Logger, appender_writes_one_line) {
    auto logged = intercept_logger(stdlog, [] {
        stdlog("abc ", 42, ' ', 'x');
        auto app = stdlog("first part");
        app(", second part");
    });
    EXPECT_EQ(logged, "abc 42 x\nfirst part, second part\n");
}

// NOLINTNEXTLINE
TEST(Logger, flush_no_nl) {
    auto logged = intercept_logger(errlog, [] {
        auto app = errlog("progress: ");
        app.flush_no_nl();
        app("done");
    });
    EXPECT_EQ(logged, "progress: done\n");
}

// NOLINTNEXTLINE
TEST(Logger, label) {
    Logger logger(static_cast<FILE*>(nullptr));
    auto logged = intercept_logger(logger, [&] {
        logger.label(true);
        logger("labeled");
    });
    EXPECT_TRUE(std::regex_match(
        logged, std::regex{R"(\[ \d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} \] labeled\n)"}
    )) << logged;
}

// NOLINTNEXTLINE
TEST(Logger, dummy_logger_discards) {
    Logger logger(static_cast<FILE*>(nullptr));
    logger("nothing happens");
    EXPECT_EQ(logger.exchange_log_stream(nullptr), nullptr);
}
