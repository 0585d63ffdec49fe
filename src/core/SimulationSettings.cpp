#include "SimulationSettings.h"
#include "LoggingChannels.h"
#include <algorithm>
#include <fstream>
#include <thread>

namespace SandSim {

SimulationSettings getDefaultSimulationSettings()
{
    return SimulationSettings{ .worker_threads = 0,
                               .random_seed = 1337,
                               .fire_enabled = true,
                               .reactions_enabled = true,
                               .contacts_enabled = true,
                               .liquid_flow_enabled = true,
                               .gas_dissipation_enabled = true,
                               .log_step_summary = false };
}

uint32_t resolveWorkerThreads(const SimulationSettings& settings)
{
    if (settings.worker_threads > 0) {
        return settings.worker_threads;
    }
    const uint32_t hardware = std::thread::hardware_concurrency();
    return std::clamp<uint32_t>(hardware / 2, 1, 8);
}

Result<SimulationSettings, ConfigError> parseSimulationSettings(const nlohmann::json& json)
{
    using R = Result<SimulationSettings, ConfigError>;

    if (!json.is_object()) {
        return R::error(ConfigError{ "settings", "expected a JSON object" });
    }

    const nlohmann::json known = getDefaultSimulationSettings();
    for (const auto& [key, value] : json.items()) {
        if (!known.contains(key)) {
            return R::error(ConfigError{ "settings." + key, "unknown setting" });
        }
    }

    try {
        return R::okay(json.get<SimulationSettings>());
    }
    catch (const nlohmann::json::exception& e) {
        return R::error(ConfigError{ "settings", e.what() });
    }
}

Result<SimulationSettings, ConfigError> loadSimulationSettings(const std::string& path)
{
    using R = Result<SimulationSettings, ConfigError>;

    std::ifstream file(path);
    if (!file.is_open()) {
        return R::error(ConfigError{ path, "cannot open settings file" });
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e) {
        return R::error(ConfigError{ path, e.what() });
    }

    auto result = parseSimulationSettings(json);
    if (result.isValue()) {
        LoggingChannels::cli()->debug("Loaded simulation settings from {}", path);
    }
    return result;
}

} // namespace SandSim
