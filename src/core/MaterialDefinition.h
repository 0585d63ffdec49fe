#pragma once

#include "Cell.h"
#include "ConfigError.h"
#include "Result.h"
#include <array>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <set>
#include <string>
#include <variant>

namespace SandSim {

// Density assigned to empty cells: anything denser sinks, anything lighter rises.
constexpr float AIR_DENSITY = 1.0f;

struct StaticPhysics {};

struct PowderPhysics {
    float density = 16.0f;
};

struct LiquidPhysics {
    float density = 10.0f;
    float flow_rate = 1.0f;       // Fraction (0, 1] of a level difference moved per tick.
    float dry_threshold = 0.001f; // Smaller transfers are skipped; smaller cells dry up.
    float max_compression = 1.02f; // Fill a full cell may reach under a column of liquid.
};

struct GasPhysics {
    float density = 0.5f;
    int32_t dissipate = -1; // Ticks to fade out completely, -1 never.
};

// Variant order is the dispatch-table order in MaterialRules.
using PhysicsType = std::variant<StaticPhysics, PowderPhysics, LiquidPhysics, GasPhysics>;

enum class PhysicsKind : uint8_t { Static = 0, Powder, Liquid, Gas };

struct FireParameters {
    float probability = 0.0f; // Ignition chance per tick while igniting.
    int32_t fire_hp = 1;      // Ticks a cell burns before converting.
    bool requires_oxygen = true;
    bool try_to_ignite = false; // Attempts ignition on its own, oxygen or not.
    std::string burns_into;     // Material name; empty means the cell becomes empty.
    MaterialId burns_into_id = MATERIAL_EMPTY;
};

struct DamageContact {
    float amount = 0.0f;
};

struct HealContact {
    float amount = 0.0f;
};

struct ExplodeContact {
    float radius = 0.0f;
    float damage = 0.0f;
    float force = 0.0f;
};

using ContactEffect = std::variant<DamageContact, HealContact, ExplodeContact>;

using Rgba = std::array<uint8_t, 4>;

/**
 * Immutable description of one material, owned by the MaterialRegistry.
 */
struct MaterialDefinition {
    MaterialId id = MATERIAL_EMPTY;
    std::string name;
    std::string display_name;
    Rgba color = { 0, 0, 0, 0 };
    uint8_t color_offset = 0;
    PhysicsType physics = StaticPhysics{};
    std::optional<FireParameters> fire;
    std::optional<ContactEffect> contact;
    std::optional<Rgba> lighting;
    std::optional<float> durability;
    std::set<std::string> tags;

    PhysicsKind kind() const { return static_cast<PhysicsKind>(physics.index()); }
    bool isStatic() const { return kind() == PhysicsKind::Static; }
    bool isEmptyMaterial() const { return id == MATERIAL_EMPTY; }
    bool isFlammable() const { return fire.has_value(); }
    bool hasTag(const std::string& tag) const { return tags.count(tag) > 0; }

    /**
     * Density used by the displacement rule. Empty is air; static
     * materials report infinity and are never displaced.
     */
    float density() const;

    // Resting fill for freshly created cells of this material.
    float defaultFill() const { return isEmptyMaterial() ? 0.0f : Cell::FULL; }
};

const char* physicsKindName(PhysicsKind kind);

/**
 * Parse one entry of the "materials" array. The id is assigned by the caller;
 * cross references (burns_into) are resolved by the registry afterwards.
 */
Result<MaterialDefinition, ConfigError> parseMaterialDefinition(
    const nlohmann::json& json, const std::string& entryName);

nlohmann::json materialDefinitionToJson(const MaterialDefinition& material);

} // namespace SandSim
