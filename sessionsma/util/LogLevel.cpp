#include "LogLevel.h"

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<LogLevel, std::string_view>, 5> s_level_names = {{
        {LogLevel::Debug, "Debug"},
        {LogLevel::Status, "Status"},
        {LogLevel::Info, "Info"},
        {LogLevel::Warning, "Warning"},
        {LogLevel::Error, "Error"},
}};

} // namespace

std::ostream & operator<<(std::ostream & os, LogLevel level)
{
    for (const auto & [l, name] : s_level_names) {
        if (l == level) {
            return os << name;
        }
    }
    return os << "Unknown";
}

std::string to_string(LogLevel level)
{
    for (const auto & [l, name] : s_level_names) {
        if (l == level) {
            return std::string{name};
        }
    }
    return "Unknown";
}

std::optional<LogLevel> log_level_from_string(std::string_view str)
{
    for (const auto & [l, name] : s_level_names) {
        if (name == str) {
            return l;
        }
    }
    return std::nullopt;
}
