#include "Chunk.h"
#include <algorithm>

namespace SandSim {

Chunk::Chunk(Vector2i coord) : coord_(coord), cells_(CHUNK_AREA)
{}

void Chunk::promoteUpdateRect()
{
    updateRect_ = nextUpdateRect_.clippedTo(bounds());
    nextUpdateRect_.clear();
}

void Chunk::wakeAll()
{
    updateRect_ = bounds();
    renderRect_ = bounds();
}

size_t Chunk::countNonEmpty() const
{
    return static_cast<size_t>(
        std::count_if(cells_.begin(), cells_.end(), [](const Cell& cell) { return !cell.isEmpty(); }));
}

} // namespace SandSim
