#include "Logger.h"

#include <fmt/chrono.h>

#include <chrono>
#include <iostream>

Logger & Logger::i()
{
    static Logger l;
    return l;
}

void Logger::write(LogLevel level, const std::string & str)
{
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
    const std::string line = fmt::format("[{:%Y-%m-%d %H:%M:%S}][{}]: {}",
                                         ms,
                                         ::to_string(level),
                                         str);

    std::lock_guard lock(m_mutex);
    std::cout << line << std::endl;
}

template <LogLevel level>
void Logger::log(std::string && str)
{
    auto & logger = i();
    if (level < logger.m_min_log_level) {
        return;
    }
    logger.write(level, str);
}

void Logger::set_min_log_level(LogLevel ll)
{
    i().m_min_log_level = ll;
}

LogLevel Logger::current_min_log_level()
{
    return i().m_min_log_level;
}

template void Logger::log<LogLevel::Debug>(std::string && str);
template void Logger::log<LogLevel::Status>(std::string && str);
template void Logger::log<LogLevel::Info>(std::string && str);
template void Logger::log<LogLevel::Warning>(std::string && str);
template void Logger::log<LogLevel::Error>(std::string && str);
