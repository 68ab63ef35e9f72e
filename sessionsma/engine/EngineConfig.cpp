#include "EngineConfig.h"

#include "Logger.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

bool EngineConfig::is_valid() const
{
    return capacity >= 1 && window.count() > 0. && default_price > 0. && trading_hours.is_valid();
}

nlohmann::json EngineConfig::to_json() const
{
    nlohmann::json j = {
            {"capacity", capacity},
            {"window_s", window.count()},
            {"default_price", default_price},
            {"trading_hours", trading_hours.to_json()},
    };
    return j;
}

std::optional<EngineConfig> EngineConfig::from_json(const nlohmann::json & json)
{
    EngineConfig config;
    try {
        const auto capacity = json.at("capacity").get<long>();
        if (capacity < 1) {
            LOG_WARNING("Capacity must be positive, got {}", capacity);
            return std::nullopt;
        }
        config.capacity = static_cast<size_t>(capacity);
        config.window = Timestamp{json.at("window_s").get<double>()};

        if (json.contains("default_price")) {
            config.default_price = json.at("default_price").get<double>();
        }
        if (json.contains("trading_hours")) {
            json.at("trading_hours").get_to(config.trading_hours);
        }
    }
    catch (const nlohmann::json::exception & e) {
        LOG_WARNING("Bad engine config: {}", e.what());
        return std::nullopt;
    }
    catch (const std::invalid_argument & e) {
        LOG_WARNING("Bad trading hours: {}", e.what());
        return std::nullopt;
    }

    if (!config.is_valid()) {
        LOG_WARNING("Invalid engine config: {}", config.to_json().dump());
        return std::nullopt;
    }
    return config;
}
