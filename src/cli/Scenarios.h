#pragma once

#include "core/Result.h"
#include <functional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace SandSim {

class World;

namespace Cli {

struct ScenarioMetadata {
    std::string name;
    std::string description;
    std::vector<std::string> requiredMaterials;
};

/**
 * Named world generators for the CLI. Each scenario paints terrain into an
 * empty World and may register actor hitboxes.
 */
class ScenarioRegistry {
public:
    using SetupFunction = std::function<void(World&)>;

    static ScenarioRegistry createDefault();

    void registerScenario(const std::string& id, ScenarioMetadata metadata, SetupFunction setup);

    const ScenarioMetadata* getMetadata(const std::string& id) const;

    // Sorted.
    std::vector<std::string> getScenarioIds() const;

    /**
     * Reset the world and build the scenario. Fails, leaving the world
     * untouched, for an unknown id or when the registry lacks a material
     * the scenario needs.
     */
    Result<std::monostate, std::string> setup(const std::string& id, World& world) const;

private:
    struct ScenarioEntry {
        ScenarioMetadata metadata;
        SetupFunction setup;
    };
    std::unordered_map<std::string, ScenarioEntry> scenarios_;
};

} // namespace Cli
} // namespace SandSim
