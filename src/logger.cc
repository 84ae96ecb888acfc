#include <cerrno>
#include <chklib/logger.hh>
#include <chklib/macros/throw.hh>
#include <cstring>
#include <ctime>

namespace {

std::string local_datetime() {
    time_t now = time(nullptr);
    struct tm local {};
    if (localtime_r(&now, &local) == nullptr) {
        THROW("localtime_r() failed");
    }
    char buff[32];
    size_t len = strftime(buff, sizeof(buff), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buff, len);
}

} // namespace

Logger::Logger(const char* filename) : f_(fopen(filename, "ae")) {
    if (f_ == nullptr) {
        THROW("fopen('", filename, "') failed - ", strerror(errno));
    }
    opened_ = true;
}

void Logger::open(const char* filename) {
    FILE* f = fopen(filename, "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed - ", strerror(errno));
    }

    close();
    f_ = f;
    opened_ = true;
}

void Logger::Appender::flush_impl(const char* newline_or_empty_str) noexcept {
    if (flushed_) {
        return;
    }

    if (logger_.lock()) {
        if (label_) {
            try {
                (void)fprintf(
                    logger_.f_,
                    "[ %s ] %.*s%s",
                    local_datetime().c_str(),
                    static_cast<int>(buff_.size()),
                    buff_.data(),
                    newline_or_empty_str
                );
            } catch (const std::exception&) {
                (void)fprintf(
                    logger_.f_,
                    "[ unknown time ] %.*s%s",
                    static_cast<int>(buff_.size()),
                    buff_.data(),
                    newline_or_empty_str
                );
            }
        } else {
            (void)fprintf(
                logger_.f_,
                "%.*s%s",
                static_cast<int>(buff_.size()),
                buff_.data(),
                newline_or_empty_str
            );
        }

        (void)fflush(logger_.f_);
        logger_.unlock();
    }

    flushed_ = true;
    buff_.clear();
}
