#pragma once

#include "Vector2.h"

namespace SandSim {

class ChunkNeighborhood;

/**
 * @brief Combustion for one cell: Unburnt -> Igniting -> Burning -> converted.
 *
 * - Igniting cells (marked by a burning neighbour, or materials with
 *   try_to_ignite) roll their material's ignition probability each tick.
 * - Burning cells mark flammable neighbours as igniting and lose one hp per
 *   tick. The tick a cell ignites does not count, so hp N burns exactly N ticks.
 * - At zero hp the cell becomes its burns_into material (empty by default).
 * - Materials that require oxygen need an empty or gas neighbour to ignite or
 *   keep burning; without one the fire goes out.
 */
class WorldFireCalculator {
public:
    // Returns true if the cell burned out this tick.
    static bool update(ChunkNeighborhood& hood, Vector2i pos);

    static bool hasOxygen(const ChunkNeighborhood& hood, Vector2i pos);
};

} // namespace SandSim
