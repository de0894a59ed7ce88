#pragma once

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <string>

namespace asmhom {

// Simple logger writing to stderr. Each message is formatted in full into
// one buffer and written with a single fwrite, so concurrent requests do
// not interleave within a line.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo) : level_(level) {}

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

    static void log_impl(const char* tag, const char* fmt, va_list ap) {
        char prefix[64];
        std::time_t now = std::time(nullptr);
        std::tm tm_buf;
        gmtime_r(&now, &tm_buf);
        size_t plen = std::strftime(prefix, sizeof(prefix), "%Y-%m-%dT%H:%M:%SZ ", &tm_buf);
        int t = std::snprintf(prefix + plen, sizeof(prefix) - plen, "[%s] ", tag);
        if (t > 0) plen = std::min(plen + static_cast<size_t>(t), sizeof(prefix) - 1);

        std::string line(prefix, plen);
        va_list ap2;
        va_copy(ap2, ap);
        char body[4096];
        int m = std::vsnprintf(body, sizeof(body), fmt, ap);
        if (m < 0) {
            line += fmt;
        } else if (static_cast<size_t>(m) < sizeof(body)) {
            line.append(body, static_cast<size_t>(m));
        } else {
            // Long messages (tool output) are formatted in full
            std::string big(static_cast<size_t>(m) + 1, '\0');
            std::vsnprintf(&big[0], big.size(), fmt, ap2);
            big.resize(static_cast<size_t>(m));
            line += big;
        }
        va_end(ap2);
        line += '\n';
        std::fwrite(line.data(), 1, line.size(), stderr);
    }
};

} // namespace asmhom
