#pragma once

#include "LogLevel.h"

#include <fmt/core.h>

#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#define LOG_DEBUG(FMT, ...)                                                \
    do {                                                                   \
        if (Logger::current_min_log_level() <= LogLevel::Debug) {          \
            Logger::logf<LogLevel::Debug>(FMT __VA_OPT__(, ) __VA_ARGS__); \
        }                                                                  \
    } while (false)

#define LOG_STATUS(FMT, ...)                                                \
    do {                                                                    \
        if (Logger::current_min_log_level() <= LogLevel::Status) {          \
            Logger::logf<LogLevel::Status>(FMT __VA_OPT__(, ) __VA_ARGS__); \
        }                                                                   \
    } while (false)

#define LOG_INFO(FMT, ...)                                                \
    do {                                                                  \
        if (Logger::current_min_log_level() <= LogLevel::Info) {          \
            Logger::logf<LogLevel::Info>(FMT __VA_OPT__(, ) __VA_ARGS__); \
        }                                                                 \
    } while (false)

#define LOG_WARNING(FMT, ...)                                                \
    do {                                                                     \
        if (Logger::current_min_log_level() <= LogLevel::Warning) {          \
            Logger::logf<LogLevel::Warning>(FMT __VA_OPT__(, ) __VA_ARGS__); \
        }                                                                    \
    } while (false)

#define LOG_ERROR(FMT, ...)                                                \
    do {                                                                   \
        if (Logger::current_min_log_level() <= LogLevel::Error) {          \
            Logger::logf<LogLevel::Error>(FMT __VA_OPT__(, ) __VA_ARGS__); \
        }                                                                  \
    } while (false)

/*
    Writes straight to stdout on the calling thread.
    The engine is single-threaded, the mutex only keeps lines of the replay tool
    and the tests from interleaving.
*/
class Logger
{
public:
    template <LogLevel level>
    static void log(std::string && str);

    template <LogLevel level, typename... Args>
    static void logf(std::string_view fmt, Args &&... args)
    {
        str_logf<level>(fmt, to_string(args)...);
    }

    static void set_min_log_level(LogLevel ll);
    static LogLevel current_min_log_level();

private:
    Logger() = default;
    static Logger & i();

    template <class T>
    static std::string to_string(const T & v)
    {
        std::stringstream ss;
        ss << v;
        return ss.str();
    }

    template <LogLevel level, typename... Args>
    static void str_logf(std::string_view fmt, Args &&... args)
    {
        static_assert(
                (std::is_same_v<Args, std::string> && ...),
                "Here we accept only strings");
        log<level>(fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

    void write(LogLevel level, const std::string & str);

private:
    std::mutex m_mutex;

    LogLevel m_min_log_level = LogLevel::Info;
};
