#include "ReplayConfig.h"

#include "DateTimeConverter.h"
#include "Logger.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

nlohmann::json ReplayConfig::to_json() const
{
    nlohmann::json j = {
            {"engine", engine.to_json()},
            {"start", DateTimeConverter::date_time(start)},
            {"points", generator.points},
            {"seed", generator.seed},
            {"start_price", generator.start_price},
            {"audit_csv", audit_csv},
            {"log_level", to_string(log_level)},
    };
    return j;
}

std::optional<std::filesystem::path> ReplayConfigLoader::config_path(int argc, char * argv[])
{
    if (argc > 1) {
        return std::filesystem::path{argv[1]};
    }

    const auto env_value = std::getenv(s_config_env_var.data());
    if (!env_value || std::string_view{env_value}.empty()) {
        LOG_WARNING("No config path given and environment variable {} is not set", s_config_env_var);
        return std::nullopt;
    }
    return std::filesystem::path{env_value};
}

std::optional<ReplayConfig> ReplayConfigLoader::load(const std::filesystem::path & path)
{
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        LOG_ERROR("Can't open config file {}", path.string());
        return std::nullopt;
    }

    const auto json = nlohmann::json::parse(ifs, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        LOG_ERROR("Not a JSON object in config file {}", path.string());
        return std::nullopt;
    }

    LOG_INFO("Loading config from file: {}", path.string());
    return parse(json);
}

std::optional<ReplayConfig> ReplayConfigLoader::parse(const nlohmann::json & json)
{
    if (!json.contains("engine")) {
        LOG_WARNING("No 'engine' section in config");
        return std::nullopt;
    }
    const auto engine_opt = EngineConfig::from_json(json.at("engine"));
    if (!engine_opt.has_value()) {
        return std::nullopt;
    }

    ReplayConfig config;
    config.engine = *engine_opt;

    try {
        const auto start_str = json.value("start", std::string{"2025-04-04 09:30:00"});
        const auto start_opt = DateTimeConverter::from_date_time(start_str);
        if (!start_opt.has_value()) {
            LOG_WARNING("Bad start date time: '{}', expected YYYY-MM-DD HH:MM:SS", start_str);
            return std::nullopt;
        }
        config.start = *start_opt;

        const auto points = json.value("points", 20L);
        if (points <= 0) {
            LOG_WARNING("Number of points must be positive, got {}", points);
            return std::nullopt;
        }
        config.generator.points = static_cast<size_t>(points);
        config.generator.seed = json.value("seed", config.generator.seed);
        config.generator.start_price = json.value("start_price", config.generator.start_price);
        config.audit_csv = json.value("audit_csv", std::string{});

        const auto level_str = json.value("log_level", to_string(config.log_level));
        const auto level_opt = log_level_from_string(level_str);
        if (!level_opt.has_value()) {
            LOG_WARNING("Unknown log level: '{}'", level_str);
            return std::nullopt;
        }
        config.log_level = *level_opt;
    }
    catch (const nlohmann::json::exception & e) {
        LOG_WARNING("Bad replay config: {}", e.what());
        return std::nullopt;
    }

    LOG_DEBUG("Replay config loaded: {}", config.to_json().dump(2));
    return config;
}
