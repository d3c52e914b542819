#pragma once

#include <cstdio>
#include <cstdarg>
#include <ctime>
#include <mutex>

#include <sys/time.h>

namespace loanrecon {

// Levelled logger. The server logs to stderr because stdout carries the
// protocol stream; tests pass a temporary file as sink to inspect output.
// Each line is prefixed with a UTC timestamp and level tag. Lines from
// concurrent threads are not interleaved.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::FILE* sink = stderr)
        : level_(level), sink_(sink) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    void error(const char* fmt, ...) const {
        if (level_ < kError) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        if (level_ < kWarn) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        if (level_ < kInfo) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        if (level_ < kDebug) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    std::FILE* sink_;
    mutable std::mutex mutex_;

    void log_impl(const char* tag, const char* fmt, va_list ap) const {
        struct timeval tv;
        ::gettimeofday(&tv, nullptr);
        struct tm tm_utc;
        ::gmtime_r(&tv.tv_sec, &tm_utc);
        char ts[32];
        std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%S", &tm_utc);

        std::lock_guard<std::mutex> lock(mutex_);
        std::fprintf(sink_, "%s.%03dZ [%s] ", ts,
                     static_cast<int>(tv.tv_usec / 1000), tag);
        std::vfprintf(sink_, fmt, ap);
        std::fprintf(sink_, "\n");
        std::fflush(sink_);
    }
};

} // namespace loanrecon
