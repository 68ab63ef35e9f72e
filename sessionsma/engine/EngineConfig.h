#pragma once

#include "Timestamp.h"
#include "TradingHours.h"

#include "nlohmann/json_fwd.hpp"

#include <cstddef>
#include <optional>

struct EngineConfig
{
    size_t capacity = 10;
    Timestamp window{1000.};

    // reported for an instant when nothing was pushed yet
    double default_price = 100.;

    TradingHours trading_hours;

    bool is_valid() const;

    nlohmann::json to_json() const;

    // empty and a warning logged on missing or mistyped fields
    static std::optional<EngineConfig> from_json(const nlohmann::json & json);
};
