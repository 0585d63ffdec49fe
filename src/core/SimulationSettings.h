#pragma once

#include "ConfigError.h"
#include "ReflectSerializer.h"
#include "Result.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace SandSim {

/**
 * @brief Engine-wide knobs. Material tuning lives in the material registry.
 *
 * Serializable via ReflectSerializer. Defaults come from
 * getDefaultSimulationSettings().
 */
struct SimulationSettings {
    uint32_t worker_threads;   // 0 picks a count from the hardware.
    uint32_t random_seed;      // Feeds every per-cell random roll.
    bool fire_enabled;
    bool reactions_enabled;
    bool contacts_enabled;
    bool liquid_flow_enabled;  // Horizontal/compression flow; falling still happens.
    bool gas_dissipation_enabled;
    bool log_step_summary;     // One scheduler debug line per step.
};

SimulationSettings getDefaultSimulationSettings();

/**
 * Worker count actually used for a settings value: half the hardware
 * threads, between 1 and 8, when worker_threads is 0.
 */
uint32_t resolveWorkerThreads(const SimulationSettings& settings);

/**
 * Overlay a JSON file onto the defaults. Unknown keys are rejected.
 */
Result<SimulationSettings, ConfigError> loadSimulationSettings(const std::string& path);
Result<SimulationSettings, ConfigError> parseSimulationSettings(const nlohmann::json& json);

inline void to_json(nlohmann::json& j, const SimulationSettings& settings)
{
    j = ReflectSerializer::to_json(settings);
}

inline void from_json(const nlohmann::json& j, SimulationSettings& settings)
{
    settings = getDefaultSimulationSettings();
    ReflectSerializer::update_from_json(j, settings);
}

} // namespace SandSim
