#pragma once

#include "nlohmann/json_fwd.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

/*
    Two daily sessions separated by a midday break, boundaries are
    seconds since local midnight and are included in their session.
*/
struct TradingHours
{
    std::chrono::seconds morning_open = std::chrono::hours{9} + std::chrono::minutes{30};
    std::chrono::seconds morning_close = std::chrono::hours{11} + std::chrono::minutes{30};
    std::chrono::seconds afternoon_open = std::chrono::hours{13};
    std::chrono::seconds afternoon_close = std::chrono::hours{15};

    bool is_valid() const;

    nlohmann::json to_json() const;

    // "HH:MM:SS"
    static std::optional<std::chrono::seconds> parse(std::string_view str);
    static std::string format(std::chrono::seconds time_of_day);
};

// throws std::invalid_argument on a malformed boundary
void from_json(const nlohmann::json & j, TradingHours & hours);
