#pragma once

#include <chklib/defer.hh>
#include <chklib/logger.hh>
#include <chklib/throw_assert.hh>
#include <cstdio>
#include <memory>
#include <string>

// Returns what @p logging_func logged to @p logger, labels are disabled meanwhile
template <class LoggingFunc>
std::string intercept_logger(Logger& logger, LoggingFunc&& logging_func) {
    std::unique_ptr<FILE, int (*)(FILE*)> stream = {tmpfile(), fclose};
    throw_assert(stream);

    FILE* logger_stream = stream.get();
    FILE* old_stream = logger.exchange_log_stream(logger_stream);
    bool old_label = logger.label(false);
    Defer guard = [&] {
        logger.exchange_log_stream(old_stream);
        logger.label(old_label);
    };

    logging_func();

    // Get logged data
    rewind(logger_stream);
    std::string res;
    char buff[4096];
    size_t len = 0;
    while ((len = fread(buff, 1, sizeof(buff), logger_stream)) > 0) {
        res.append(buff, len);
    }
    throw_assert(not ferror(logger_stream));
    return res;
}
