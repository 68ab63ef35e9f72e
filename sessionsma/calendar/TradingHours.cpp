#include "TradingHours.h"

#include <nlohmann/json.hpp>

#include <fmt/core.h>

#include <charconv>
#include <system_error>
#include <stdexcept>

namespace {

std::optional<int> parse_field(std::string_view str, int max)
{
    if (str.size() != 2) {
        return std::nullopt;
    }
    int value = 0;
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size() || value < 0 || value > max) {
        return std::nullopt;
    }
    return value;
}

std::chrono::seconds parse_or_throw(const nlohmann::json & j, const char * key)
{
    const auto str = j.at(key).get<std::string>();
    const auto res = TradingHours::parse(str);
    if (!res.has_value()) {
        throw std::invalid_argument(fmt::format("Bad time of day for '{}': '{}'", key, str));
    }
    return *res;
}

} // namespace

bool TradingHours::is_valid() const
{
    const std::chrono::seconds day = std::chrono::hours{24};
    return std::chrono::seconds{0} <= morning_open &&
            morning_open < morning_close &&
            morning_close < afternoon_open &&
            afternoon_open < afternoon_close &&
            afternoon_close < day;
}

std::optional<std::chrono::seconds> TradingHours::parse(std::string_view str)
{
    if (str.size() != 8 || str[2] != ':' || str[5] != ':') {
        return std::nullopt;
    }
    const auto h = parse_field(str.substr(0, 2), 23);
    const auto m = parse_field(str.substr(3, 2), 59);
    const auto s = parse_field(str.substr(6, 2), 59);
    if (!h || !m || !s) {
        return std::nullopt;
    }
    return std::chrono::hours{*h} + std::chrono::minutes{*m} + std::chrono::seconds{*s};
}

std::string TradingHours::format(std::chrono::seconds time_of_day)
{
    const auto total = time_of_day.count();
    return fmt::format("{:02}:{:02}:{:02}", total / 3600, total % 3600 / 60, total % 60);
}

nlohmann::json TradingHours::to_json() const
{
    nlohmann::json j = {
            {"morning_start", format(morning_open)},
            {"morning_end", format(morning_close)},
            {"afternoon_start", format(afternoon_open)},
            {"afternoon_end", format(afternoon_close)},
    };
    return j;
}

void from_json(const nlohmann::json & j, TradingHours & hours)
{
    hours.morning_open = parse_or_throw(j, "morning_start");
    hours.morning_close = parse_or_throw(j, "morning_end");
    hours.afternoon_open = parse_or_throw(j, "afternoon_start");
    hours.afternoon_close = parse_or_throw(j, "afternoon_end");
}
