#pragma once

#include <cstdarg>
#include <cstddef>
#include <cstdio>

namespace fastaio {

// Leveled printf-style logger. Writes "[LEVEL] message" lines to stderr
// unless another FILE* sink is given. Counts the warnings it has issued,
// whether or not they were printed.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::FILE* sink = nullptr)
        : level_(level), sink_(sink) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    size_t num_warnings() const { return num_warnings_; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl("ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) {
        ++num_warnings_;
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
    size_t num_warnings_ = 0;

    void log_impl(const char* tag, const char* fmt, va_list ap) const {
        std::FILE* out = sink_ ? sink_ : stderr;
        std::fprintf(out, "[%s] ", tag);
        std::vfprintf(out, fmt, ap);
        std::fprintf(out, "\n");
    }
};

} // namespace fastaio
