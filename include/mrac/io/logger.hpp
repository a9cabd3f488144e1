#pragma once

#include <cstdio>
#include <cstdarg>

#include "mrac/core/time.hpp"

namespace mrac{
    enum class LogLevel {
        kTrace,
        kDebug,
        kInfo,
        kWarn,
        kError
    };

    inline constexpr const char* to_string(LogLevel lvl) noexcept{
        switch (lvl){
            case LogLevel::kTrace: return "TRACE";
            case LogLevel::kDebug: return "DEBUG";
            case LogLevel::kInfo:  return "INFO";
            case LogLevel::kWarn:  return "WARN";
            case LogLevel::kError: return "ERROR";
        }
        return "?";
    }

    struct LoggerSink{
        virtual ~LoggerSink() = default;
        virtual void log(LogLevel lvl, const char *msg, t_ns t) noexcept = 0;
    };

    // // printf style into a fixed stack buffer -> no heap on the tick path; null sink is a no-op
    #if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
    #endif
    inline void log_fmt(LoggerSink* sink, LogLevel lvl, t_ns t, const char* fmt, ...) noexcept{
        if (!sink) return;
        char buf[256];
        va_list ap;
        va_start(ap, fmt);
        std::vsnprintf(buf, sizeof(buf), fmt, ap);
        va_end(ap);
        sink->log(lvl, buf, t);
    }

    // // Minimal sink for tools/examples, drops anything below min_level
    class StderrLogger final : public LoggerSink{
        public:
            explicit StderrLogger(LogLevel min_level = LogLevel::kInfo) noexcept : min_(min_level) {}

            void log(LogLevel lvl, const char* msg, t_ns t) noexcept override{
                if (static_cast<int>(lvl) < static_cast<int>(min_)) return;
                std::fprintf(stderr, "[%s] t=%.6f %s\n", to_string(lvl), static_cast<double>(to_seconds(t)), msg);
            }

        private:
            LogLevel min_;
    };

} // namespace mrac
