#pragma once

#include "EngineConfig.h"
#include "LogLevel.h"
#include "SyntheticPriceGenerator.h"
#include "Timestamp.h"

#include "nlohmann/json_fwd.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

struct ReplayConfig
{
    EngineConfig engine;
    SyntheticPriceGeneratorConfig generator;

    Timestamp start;
    std::string audit_csv; // empty for no audit file
    LogLevel log_level = LogLevel::Info;

    nlohmann::json to_json() const;
};

class ReplayConfigLoader
{
public:
    static constexpr std::string_view s_config_env_var = "SESSIONSMA_CONFIG";

    // the command line argument wins over the environment variable
    static std::optional<std::filesystem::path> config_path(int argc, char * argv[]);

    static std::optional<ReplayConfig> load(const std::filesystem::path & path);
    static std::optional<ReplayConfig> parse(const nlohmann::json & json);
};
