#pragma once

#include "MaterialDefinition.h"
#include "Vector2.h"
#include <array>
#include <optional>
#include <variant>

namespace SandSim {

class ChunkNeighborhood;
class MaterialRegistry;

/**
 * \file
 * Movement rules, one per physics type, looked up by the PhysicsType
 * variant index. Each rule takes the cell at `pos` and returns where it
 * ended up, or nullopt if it disappeared (dried up, dissipated).
 */
namespace MaterialRules {

using RuleFunction =
    std::optional<Vector2i> (*)(ChunkNeighborhood& hood, Vector2i pos, const MaterialDefinition& material);

std::optional<Vector2i> updateStatic(
    ChunkNeighborhood& hood, Vector2i pos, const MaterialDefinition& material);
std::optional<Vector2i> updatePowder(
    ChunkNeighborhood& hood, Vector2i pos, const MaterialDefinition& material);
std::optional<Vector2i> updateLiquid(
    ChunkNeighborhood& hood, Vector2i pos, const MaterialDefinition& material);
std::optional<Vector2i> updateGas(
    ChunkNeighborhood& hood, Vector2i pos, const MaterialDefinition& material);

const std::array<RuleFunction, std::variant_size_v<PhysicsType>>& dispatchTable();

// Runs the movement rule for whatever occupies `pos`.
std::optional<Vector2i> applyMovement(ChunkNeighborhood& hood, Vector2i pos);

/**
 * The density rule. May `mover` trade places with `target` when moving by
 * `dy` rows (+1 down, -1 up, 0 sideways)? Walls (nullptr), static cells and
 * cells of the same material are never displaced.
 */
bool canDisplace(
    const MaterialDefinition& mover, const Cell* target, const MaterialRegistry& registry, int dy);

/**
 * Fill the lower of two stacked liquid cells holds at rest when together
 * they contain `total`. Above one full cell the lower cell is compressed by
 * up to `maxCompression - 1` per cell stacked on it.
 */
float stableLowerFill(float total, float maxCompression);

} // namespace MaterialRules

} // namespace SandSim
