#include "ChunkNeighborhood.h"
#include "ChunkCoords.h"
#include "MaterialRegistry.h"
#include <utility>

namespace SandSim {

ChunkNeighborhood::ChunkNeighborhood(
    const std::array<Chunk*, 9>& chunks,
    uint32_t tick,
    const MaterialRegistry& registry,
    const SimulationSettings& settings,
    const CellRandom& random,
    ChunkUpdateResult& result)
    : chunks_(chunks),
      origin_(chunks[4]->origin()),
      tick_(tick),
      registry_(registry),
      settings_(settings),
      random_(random),
      result_(result)
{}

ChunkNeighborhood::Slot ChunkNeighborhood::locate(int x, int y) const
{
    const int relX = x - origin_.x;
    const int relY = y - origin_.y;
    if (relX < -CHUNK_SIZE || relX >= 2 * CHUNK_SIZE || relY < -CHUNK_SIZE
        || relY >= 2 * CHUNK_SIZE) {
        return {};
    }

    const int slotX = floorDiv(relX, CHUNK_SIZE) + 1;
    const int slotY = floorDiv(relY, CHUNK_SIZE) + 1;
    const int index = slotY * 3 + slotX;
    if (!chunks_[index]) {
        return {};
    }
    return Slot{ index, { floorMod(relX, CHUNK_SIZE), floorMod(relY, CHUNK_SIZE) } };
}

ChunkNeighborhood::Slot ChunkNeighborhood::locateWithinReach(int x, int y) const
{
    const int relX = x - origin_.x;
    const int relY = y - origin_.y;
    if (relX < -CHUNK_MAX_REACH || relX >= CHUNK_SIZE + CHUNK_MAX_REACH
        || relY < -CHUNK_MAX_REACH || relY >= CHUNK_SIZE + CHUNK_MAX_REACH) {
        return {};
    }
    return locate(x, y);
}

bool ChunkNeighborhood::isAccessible(int x, int y) const
{
    return locateWithinReach(x, y).index >= 0;
}

const Cell* ChunkNeighborhood::peek(int x, int y) const
{
    const Slot slot = locateWithinReach(x, y);
    if (slot.index < 0) {
        return nullptr;
    }
    return &chunks_[slot.index]->at(slot.local.x, slot.local.y);
}

Cell* ChunkNeighborhood::mutableCell(int x, int y)
{
    const Slot slot = locateWithinReach(x, y);
    if (slot.index < 0) {
        return nullptr;
    }
    return &chunks_[slot.index]->at(slot.local.x, slot.local.y);
}

const MaterialDefinition* ChunkNeighborhood::materialAt(int x, int y) const
{
    const Cell* cell = peek(x, y);
    return cell ? &registry_.get(cell->material) : nullptr;
}

bool ChunkNeighborhood::isAirLike(int x, int y) const
{
    const Cell* cell = peek(x, y);
    if (!cell) {
        return false;
    }
    return cell->isEmpty() || registry_.get(cell->material).kind() == PhysicsKind::Gas;
}

void ChunkNeighborhood::write(int x, int y, Cell cell)
{
    Cell* target = mutableCell(x, y);
    if (!target) {
        return;
    }
    cell.last_tick = tick_;
    *target = cell;
    markChanged(x, y);
}

void ChunkNeighborhood::touch(int x, int y)
{
    if (isAccessible(x, y)) {
        markChanged(x, y);
    }
}

void ChunkNeighborhood::swap(Vector2i a, Vector2i b)
{
    Cell* cellA = mutableCell(a.x, a.y);
    Cell* cellB = mutableCell(b.x, b.y);
    if (!cellA || !cellB) {
        return;
    }
    std::swap(*cellA, *cellB);
    cellA->last_tick = tick_;
    cellB->last_tick = tick_;
    markChanged(a.x, a.y);
    markChanged(b.x, b.y);
    result_.moves++;
}

void ChunkNeighborhood::keepAlive(int x, int y)
{
    const Slot slot = locate(x, y);
    if (slot.index >= 0) {
        result_.wakeRects[slot.index].extend(slot.local.x, slot.local.y);
    }
}

void ChunkNeighborhood::markChanged(int x, int y)
{
    const Slot slot = locate(x, y);
    if (slot.index >= 0) {
        result_.renderRects[slot.index].extend(slot.local.x, slot.local.y);
    }
    result_.cellsChanged++;

    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            const Slot wake = locate(x + dx, y + dy);
            if (wake.index >= 0) {
                result_.wakeRects[wake.index].extend(wake.local.x, wake.local.y);
            }
        }
    }
}

} // namespace SandSim
