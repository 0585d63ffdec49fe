#include "MaterialRules.h"
#include "ChunkNeighborhood.h"
#include "LoggingChannels.h"
#include "MaterialRegistry.h"
#include "SimulationSettings.h"
#include <algorithm>
#include <cmath>

namespace SandSim {
namespace MaterialRules {

namespace {

constexpr float GAS_GONE_FILL = 1e-4f;

} // namespace

bool canDisplace(
    const MaterialDefinition& mover, const Cell* target, const MaterialRegistry& registry, int dy)
{
    if (!target) {
        return false;
    }

    const float moverDensity = mover.density();
    if (target->isEmpty()) {
        if (dy > 0) return moverDensity > AIR_DENSITY;
        if (dy < 0) return moverDensity < AIR_DENSITY;
        return true;
    }

    if (target->material == mover.id) {
        return false;
    }
    const auto& other = registry.get(target->material);
    if (other.isStatic()) {
        return false;
    }

    const float otherDensity = other.density();
    if (dy < 0) {
        return otherDensity > moverDensity;
    }
    return otherDensity < moverDensity;
}

float stableLowerFill(float total, float maxCompression)
{
    const float compress = maxCompression - 1.0f;
    if (total <= Cell::FULL) {
        return Cell::FULL;
    }
    if (total < 2.0f * Cell::FULL + compress) {
        return (Cell::FULL * Cell::FULL + total * compress) / (Cell::FULL + compress);
    }
    return (total + compress) / 2.0f;
}

std::optional<Vector2i> updateStatic(ChunkNeighborhood&, Vector2i pos, const MaterialDefinition&)
{
    return pos;
}

std::optional<Vector2i> updatePowder(
    ChunkNeighborhood& hood, Vector2i pos, const MaterialDefinition& material)
{
    const auto& registry = hood.registry();
    const Vector2i below{ pos.x, pos.y + 1 };

    if (canDisplace(material, hood.peek(below.x, below.y), registry, 1)) {
        hood.swap(pos, below);
        return below;
    }

    // Diagonal: the side cell must give way too, so grains don't slip through corners.
    const int first = hood.randomDirection(pos.x, pos.y, CellRandom::SALT_DIRECTION);
    for (const int side : { first, -first }) {
        const Vector2i diagonal{ pos.x + side, pos.y + 1 };
        if (canDisplace(material, hood.peek(diagonal.x, diagonal.y), registry, 1)
            && canDisplace(material, hood.peek(pos.x + side, pos.y), registry, 0)) {
            hood.swap(pos, diagonal);
            return diagonal;
        }
    }

    return pos;
}

std::optional<Vector2i> updateLiquid(
    ChunkNeighborhood& hood, Vector2i pos, const MaterialDefinition& material)
{
    const auto& registry = hood.registry();
    const auto& params = std::get<LiquidPhysics>(material.physics);
    const int x = pos.x;
    const int y = pos.y;

    // Falling or sinking through something lighter moves the whole cell.
    const Cell* below = hood.peek(x, y + 1);
    if (canDisplace(material, below, registry, 1)) {
        hood.swap(pos, { x, y + 1 });
        return Vector2i{ x, y + 1 };
    }

    Cell* self = hood.mutableCell(x, y);
    float remaining = self->fill_level;
    bool changed = false;

    if (hood.settings().liquid_flow_enabled) {
        // Down into the same liquid, up to what the lower cell holds at rest.
        if (below && below->material == self->material) {
            Cell* lower = hood.mutableCell(x, y + 1);
            float flow = stableLowerFill(remaining + lower->fill_level, params.max_compression)
                - lower->fill_level;
            flow = std::clamp(flow, 0.0f, remaining);
            if (flow > params.dry_threshold) {
                lower->fill_level += flow;
                remaining -= flow;
                hood.touch(x, y + 1);
                changed = true;
            }
        }

        // Sideways toward the preferred direction first.
        int hint = self->velocity_hint;
        if (hint == 0) {
            hint = hood.randomDirection(x, y, CellRandom::SALT_FLOW);
        }
        const int preferred = hint;
        for (const int side : { preferred, -preferred }) {
            if (remaining <= params.dry_threshold) {
                break;
            }
            Cell* neighbour = hood.mutableCell(x + side, y);
            const bool open = neighbour
                && (neighbour->isEmpty() || neighbour->material == self->material);
            if (!open) {
                if (side == preferred) {
                    hint = -preferred;
                }
                continue;
            }

            const float neighbourFill = neighbour->isEmpty() ? 0.0f : neighbour->fill_level;
            float flow = (remaining - neighbourFill) * params.flow_rate / 4.0f;
            if (flow < params.dry_threshold) {
                continue;
            }
            flow = std::min(flow, remaining);

            if (neighbour->isEmpty()) {
                Cell spill = Cell::of(self->material, flow);
                spill.velocity_hint = static_cast<int8_t>(side);
                hood.write(x + side, y, spill);
            }
            else {
                neighbour->fill_level += flow;
                hood.touch(x + side, y);
            }
            remaining -= flow;
            changed = true;
        }

        // Compressed cells push their excess upward.
        if (remaining > Cell::FULL) {
            Cell* upper = hood.mutableCell(x, y - 1);
            if (upper && (upper->isEmpty() || upper->material == self->material)) {
                const float upperFill = upper->isEmpty() ? 0.0f : upper->fill_level;
                float flow = remaining - stableLowerFill(remaining + upperFill, params.max_compression);
                if (flow > params.dry_threshold) {
                    flow = std::min(flow * 0.5f, remaining);
                    if (upper->isEmpty()) {
                        hood.write(x, y - 1, Cell::of(self->material, flow));
                    }
                    else {
                        upper->fill_level += flow;
                        hood.touch(x, y - 1);
                    }
                    remaining -= flow;
                    changed = true;
                }
            }
        }

        // A resting cell keeps its old hint so settled liquid stays bit-identical.
        if (changed) {
            self->velocity_hint = static_cast<int8_t>(hint);
        }
    }

    if (remaining < params.dry_threshold) {
        hood.write(x, y, Cell::empty());
        hood.result().dissipated++;
        return std::nullopt;
    }

    if (changed) {
        self->fill_level = remaining;
        self->last_tick = hood.tick();
        hood.touch(x, y);
    }
    return pos;
}

std::optional<Vector2i> updateGas(
    ChunkNeighborhood& hood, Vector2i pos, const MaterialDefinition& material)
{
    const auto& registry = hood.registry();
    const auto& params = std::get<GasPhysics>(material.physics);
    const int x = pos.x;
    const int y = pos.y;
    Cell* self = hood.mutableCell(x, y);
    bool changed = false;

    if (params.dissipate > 0 && hood.settings().gas_dissipation_enabled) {
        self->fill_level -= Cell::FULL / static_cast<float>(params.dissipate);
        if (self->fill_level <= GAS_GONE_FILL) {
            hood.write(x, y, Cell::empty());
            hood.result().dissipated++;
            return std::nullopt;
        }
        changed = true;
    }

    const int vertical = material.density() < AIR_DENSITY ? -1 : 1;
    const Vector2i straight{ x, y + vertical };
    if (canDisplace(material, hood.peek(straight.x, straight.y), registry, vertical)) {
        hood.swap(pos, straight);
        return straight;
    }

    const int first = hood.randomDirection(x, y, CellRandom::SALT_GAS);
    for (const int side : { first, -first }) {
        const Vector2i diagonal{ x + side, y + vertical };
        if (canDisplace(material, hood.peek(diagonal.x, diagonal.y), registry, vertical)) {
            hood.swap(pos, diagonal);
            return diagonal;
        }
    }

    // Nowhere to rise: wander along the ceiling.
    const Cell* drift = hood.peek(x + first, y);
    if (drift && drift->isEmpty()) {
        hood.swap(pos, { x + first, y });
        return Vector2i{ x + first, y };
    }

    if (changed) {
        self->last_tick = hood.tick();
        hood.touch(x, y);
    }
    return pos;
}

const std::array<RuleFunction, std::variant_size_v<PhysicsType>>& dispatchTable()
{
    static const std::array<RuleFunction, std::variant_size_v<PhysicsType>> table = {
        &updateStatic, // StaticPhysics
        &updatePowder, // PowderPhysics
        &updateLiquid, // LiquidPhysics
        &updateGas,    // GasPhysics
    };
    return table;
}

std::optional<Vector2i> applyMovement(ChunkNeighborhood& hood, Vector2i pos)
{
    const Cell* cell = hood.peek(pos.x, pos.y);
    if (!cell || cell->isEmpty()) {
        return std::nullopt;
    }

    const auto& material = hood.registry().get(cell->material);
    const bool fluid = material.kind() == PhysicsKind::Liquid || material.kind() == PhysicsKind::Gas;
    if (fluid && (!std::isfinite(cell->fill_level) || cell->fill_level < 0.0f)) {
        LoggingChannels::rules()->warn(
            "Invalid fill {} for {} at {}, clearing cell",
            cell->fill_level,
            material.name,
            pos.toString());
        hood.write(pos.x, pos.y, Cell::empty());
        hood.result().corrected++;
        return std::nullopt;
    }

    return dispatchTable()[material.physics.index()](hood, pos, material);
}

} // namespace MaterialRules
} // namespace SandSim
