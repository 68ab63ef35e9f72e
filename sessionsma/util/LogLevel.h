#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

enum class LogLevel
{
    Debug = 0,
    Status = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
};

std::ostream & operator<<(std::ostream & os, LogLevel level);
std::string to_string(LogLevel level);

// case-sensitive, accepts the names printed by operator<<
std::optional<LogLevel> log_level_from_string(std::string_view str);
