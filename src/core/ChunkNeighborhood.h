#pragma once

#include "Cell.h"
#include "CellRandom.h"
#include "Chunk.h"
#include "DirtyRect.h"
#include "Vector2.h"
#include <array>
#include <cstdint>

namespace SandSim {

class MaterialRegistry;
struct MaterialDefinition;
struct SimulationSettings;

/**
 * Everything one chunk update produced apart from the cell writes themselves.
 * Owned by a single task and merged into the Grid after the pass barrier.
 */
struct ChunkUpdateResult {
    // Indexed like Grid::neighborhoodChunks(), local coordinates of each slot.
    std::array<DirtyRect, 9> renderRects;
    std::array<DirtyRect, 9> wakeRects;

    uint32_t cellsVisited = 0;
    uint32_t cellsChanged = 0;
    uint32_t moves = 0;
    uint32_t reactions = 0;
    uint32_t ignitions = 0;
    uint32_t burnouts = 0;
    uint32_t extinguished = 0;
    uint32_t dissipated = 0;
    uint32_t corrected = 0;
};

/**
 * @brief Bounded read/write view used to update one chunk during a pass.
 *
 * Covers the centre chunk plus CHUNK_MAX_REACH cells into each neighbour.
 * Anything further away, or inside an unloaded chunk, reads as a wall
 * (nullptr) and cannot be written. Chunks updated concurrently are two
 * chunks apart, so their views never share a cell.
 *
 * All coordinates are world coordinates.
 */
class ChunkNeighborhood {
public:
    ChunkNeighborhood(
        const std::array<Chunk*, 9>& chunks,
        uint32_t tick,
        const MaterialRegistry& registry,
        const SimulationSettings& settings,
        const CellRandom& random,
        ChunkUpdateResult& result);

    Chunk& center() { return *chunks_[4]; }
    Vector2i origin() const { return origin_; }
    uint32_t tick() const { return tick_; }
    const MaterialRegistry& registry() const { return registry_; }
    const SimulationSettings& settings() const { return settings_; }
    ChunkUpdateResult& result() { return result_; }

    bool isAccessible(int x, int y) const;

    // nullptr for walls: unloaded or out of reach.
    const Cell* peek(int x, int y) const;
    Cell* mutableCell(int x, int y);

    const MaterialDefinition* materialAt(int x, int y) const;

    // True for accessible empty cells and gases (what fire needs to burn).
    bool isAirLike(int x, int y) const;

    // Stores a cell stamped with the current tick and marks it changed.
    void write(int x, int y, Cell cell);

    // Marks an in-place edit (through mutableCell) as changed.
    void touch(int x, int y);

    // Exchanges two accessible cells, stamping both.
    void swap(Vector2i a, Vector2i b);

    // Visit this cell again next step without treating it as changed.
    void keepAlive(int x, int y);

    float roll(int x, int y, uint32_t salt) const { return random_.unit(tick_, x, y, salt); }
    int randomDirection(int x, int y, uint32_t salt) const
    {
        return random_.direction(tick_, x, y, salt);
    }

private:
    struct Slot {
        int index = -1;
        Vector2i local;
    };

    Slot locate(int x, int y) const;
    Slot locateWithinReach(int x, int y) const;
    void markChanged(int x, int y);

    std::array<Chunk*, 9> chunks_;
    Vector2i origin_;
    uint32_t tick_;
    const MaterialRegistry& registry_;
    const SimulationSettings& settings_;
    const CellRandom& random_;
    ChunkUpdateResult& result_;
};

} // namespace SandSim
