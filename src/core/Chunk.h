#pragma once

#include "Cell.h"
#include "ChunkCoords.h"
#include "DirtyRect.h"
#include "Vector2.h"
#include <vector>

namespace SandSim {

/**
 * \file
 * A CHUNK_SIZE x CHUNK_SIZE tile of cells: the unit of dirty tracking and
 * of parallel scheduling.
 *
 * Three rects in local coordinates drive it:
 * - renderRect: cells changed since the last dirty-rect poll.
 * - updateRect: cells the current (or next) step visits.
 * - nextUpdateRect: wake area collected while stepping, promoted afterwards.
 */
class Chunk {
public:
    explicit Chunk(Vector2i coord);

    Vector2i coord() const { return coord_; }
    Vector2i origin() const { return chunkOrigin(coord_); }

    Cell& at(int localX, int localY) { return cells_[localY * CHUNK_SIZE + localX]; }
    const Cell& at(int localX, int localY) const { return cells_[localY * CHUNK_SIZE + localX]; }

    const std::vector<Cell>& cells() const { return cells_; }
    std::vector<Cell>& cells() { return cells_; }

    DirtyRect& renderRect() { return renderRect_; }
    const DirtyRect& renderRect() const { return renderRect_; }
    DirtyRect& updateRect() { return updateRect_; }
    const DirtyRect& updateRect() const { return updateRect_; }
    DirtyRect& nextUpdateRect() { return nextUpdateRect_; }
    const DirtyRect& nextUpdateRect() const { return nextUpdateRect_; }

    bool isActive() const { return !updateRect_.isEmpty(); }

    // Ends a step: the wake area collected during it becomes the next visit area.
    void promoteUpdateRect();

    // Marks every cell for the next step and for redraw (after bulk loads).
    void wakeAll();

    size_t countNonEmpty() const;

    static DirtyRect bounds() { return DirtyRect::fromBounds(0, 0, CHUNK_SIZE - 1, CHUNK_SIZE - 1); }

private:
    Vector2i coord_;
    std::vector<Cell> cells_;
    DirtyRect renderRect_;
    DirtyRect updateRect_;
    DirtyRect nextUpdateRect_;
};

} // namespace SandSim
