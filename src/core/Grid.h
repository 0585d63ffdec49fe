#pragma once

#include "Cell.h"
#include "Chunk.h"
#include "ChunkCoords.h"
#include "DirtyRect.h"
#include "Vector2.h"
#include <array>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace SandSim {

class MaterialRegistry;

/**
 * A changed area reported to rendering consumers, in world coordinates.
 */
struct DirtyRegion {
    Vector2i chunk;
    DirtyRect rect;
};

/**
 * @brief Sparse, unbounded world of chunks addressed by world cell coordinates.
 *
 * Chunks live in an arena (stable heap addresses) indexed by chunk coordinate.
 * Unloaded space reads as empty and is never written by the simulation.
 *
 * Everything here is for use between steps. During a step the scheduler only
 * touches chunks through ChunkNeighborhood views.
 */
class Grid {
public:
    explicit Grid(const MaterialRegistry& registry);
    ~Grid();

    Grid(const Grid&) = delete;
    Grid& operator=(const Grid&) = delete;

    const MaterialRegistry& registry() const { return registry_; }

    uint32_t tick() const { return tick_; }
    void setTick(uint32_t tick) { tick_ = tick; }
    uint32_t advanceTick() { return ++tick_; }

    // Copy of the cell, or an empty cell for unloaded coordinates.
    Cell getCell(int worldX, int worldY) const;
    const Cell* tryGetCell(int worldX, int worldY) const;

    /**
     * Store a cell, creating its chunk if needed. The cell is checked against
     * the registry first; anything invalid is corrected and logged.
     * @return false if the cell had to be corrected.
     */
    bool setCell(int worldX, int worldY, const Cell& cell);

    // Exchange two cells. Both must be loaded.
    bool swapCells(Vector2i a, Vector2i b);

    // Visit every loaded cell inside a world rect, row by row.
    void regionQuery(
        const DirtyRect& worldRect, const std::function<void(Vector2i, const Cell&)>& visit) const;

    void fillRect(const DirtyRect& worldRect, const Cell& cell);

    // Clears loaded cells within `radius` of `center`; returns how many were non-empty.
    size_t carveCircle(Vector2i center, float radius);

    // Creating a chunk wakes the facing edge cells of its loaded neighbours.
    Chunk& ensureChunk(Vector2i coord);
    bool unloadChunk(Vector2i coord);
    bool hasChunk(Vector2i coord) const { return index_.count(coord) > 0; }
    Chunk* findChunk(Vector2i coord);
    const Chunk* findChunk(Vector2i coord) const;

    size_t chunkCount() const { return chunks_.size(); }

    // Loaded chunk coordinates ordered by (y, x).
    std::vector<Vector2i> chunkCoords() const;

    // Active chunks ordered by (y, x).
    std::vector<Chunk*> activeChunks();
    size_t activeChunkCount() const;
    bool isChunkActive(Vector2i coord) const;

    /**
     * The 3x3 block around `center`, row-major from the top-left; unloaded
     * slots are nullptr.
     */
    std::array<Chunk*, 9> neighborhoodChunks(Vector2i center);

    void promoteUpdateRects();

    std::vector<DirtyRegion> dirtyRects() const;
    std::vector<DirtyRegion> takeDirtyRects();

    // Marks the 3x3 cells around a world cell for the next step.
    void wakeAround(int worldX, int worldY);

    void clear();

    /**
     * Returns a cell that satisfies the cell invariants, logging any correction.
     */
    Cell sanitize(const Cell& cell, Vector2i where, bool* corrected = nullptr) const;

private:
    void markChanged(int worldX, int worldY);

    const MaterialRegistry& registry_;
    uint32_t tick_ = 0;
    std::vector<std::unique_ptr<Chunk>> chunks_;
    std::unordered_map<Vector2i, size_t> index_;
};

} // namespace SandSim
