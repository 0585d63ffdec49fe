#include "Grid.h"
#include "LoggingChannels.h"
#include "MaterialRegistry.h"
#include <algorithm>
#include <cmath>

namespace SandSim {

namespace {

bool chunkOrderLess(Vector2i a, Vector2i b)
{
    return a.y != b.y ? a.y < b.y : a.x < b.x;
}

} // namespace

Grid::Grid(const MaterialRegistry& registry) : registry_(registry)
{}

Grid::~Grid() = default;

Cell Grid::getCell(int worldX, int worldY) const
{
    const Cell* cell = tryGetCell(worldX, worldY);
    return cell ? *cell : Cell::empty();
}

const Cell* Grid::tryGetCell(int worldX, int worldY) const
{
    const auto address = toCellAddress(worldX, worldY);
    const Chunk* chunk = findChunk(address.chunk);
    if (!chunk) {
        return nullptr;
    }
    return &chunk->at(address.local.x, address.local.y);
}

Cell Grid::sanitize(const Cell& input, Vector2i where, bool* corrected) const
{
    auto logger = LoggingChannels::grid();
    bool changed = false;
    Cell cell = input;

    if (!registry_.contains(cell.material)) {
        logger->warn(
            "Unknown material id {} at {}, storing empty", cell.material, where.toString());
        cell = Cell::empty();
        changed = true;
    }

    if (cell.isEmpty()) {
        Cell empty = Cell::empty();
        empty.last_tick = cell.last_tick;
        if (cell.fill_level != 0.0f || cell.fire || cell.velocity_hint != 0) {
            changed = true;
        }
        if (corrected) *corrected = changed;
        return empty;
    }

    const auto& material = registry_.get(cell.material);

    if (!std::isfinite(cell.fill_level) || cell.fill_level < 0.0f) {
        logger->warn(
            "Invalid fill {} for {} at {}, clamping",
            cell.fill_level,
            material.name,
            where.toString());
        cell.fill_level = 0.0f;
        changed = true;
    }

    switch (material.kind()) {
        case PhysicsKind::Static:
        case PhysicsKind::Powder:
            if (cell.fill_level != Cell::FULL) {
                logger->debug(
                    "Fill {} for solid {} at {}, forcing full",
                    cell.fill_level,
                    material.name,
                    where.toString());
                cell.fill_level = Cell::FULL;
                changed = true;
            }
            break;
        case PhysicsKind::Liquid:
            // Compression grows with column depth, so any finite fill is legal.
            break;
        case PhysicsKind::Gas:
            if (cell.fill_level > Cell::FULL) {
                logger->warn(
                    "Fill {} for gas {} at {}, clamping to full",
                    cell.fill_level,
                    material.name,
                    where.toString());
                cell.fill_level = Cell::FULL;
                changed = true;
            }
            break;
    }

    if (cell.fill_level <= 0.0f) {
        logger->warn("Zero fill for {} at {}, storing empty", material.name, where.toString());
        Cell empty = Cell::empty();
        empty.last_tick = cell.last_tick;
        if (corrected) *corrected = true;
        return empty;
    }

    if (cell.fire && !material.isFlammable()) {
        logger->warn("Dropping fire state on non-flammable {} at {}", material.name, where.toString());
        cell.fire.reset();
        changed = true;
    }

    if (cell.velocity_hint < -1 || cell.velocity_hint > 1) {
        cell.velocity_hint = cell.velocity_hint < 0 ? -1 : 1;
        changed = true;
    }

    if (corrected) *corrected = changed;
    return cell;
}

bool Grid::setCell(int worldX, int worldY, const Cell& cell)
{
    bool corrected = false;
    const Cell stored = sanitize(cell, { worldX, worldY }, &corrected);

    const auto address = toCellAddress(worldX, worldY);
    Chunk& chunk = ensureChunk(address.chunk);
    chunk.at(address.local.x, address.local.y) = stored;
    markChanged(worldX, worldY);
    return !corrected;
}

bool Grid::swapCells(Vector2i a, Vector2i b)
{
    const auto addressA = toCellAddress(a.x, a.y);
    const auto addressB = toCellAddress(b.x, b.y);
    Chunk* chunkA = findChunk(addressA.chunk);
    Chunk* chunkB = findChunk(addressB.chunk);
    if (!chunkA || !chunkB) {
        return false;
    }

    std::swap(
        chunkA->at(addressA.local.x, addressA.local.y),
        chunkB->at(addressB.local.x, addressB.local.y));
    markChanged(a.x, a.y);
    markChanged(b.x, b.y);
    return true;
}

void Grid::regionQuery(
    const DirtyRect& worldRect, const std::function<void(Vector2i, const Cell&)>& visit) const
{
    if (worldRect.isEmpty()) {
        return;
    }
    for (int y = worldRect.minY; y <= worldRect.maxY; ++y) {
        for (int x = worldRect.minX; x <= worldRect.maxX; ++x) {
            if (const Cell* cell = tryGetCell(x, y)) {
                visit({ x, y }, *cell);
            }
        }
    }
}

void Grid::fillRect(const DirtyRect& worldRect, const Cell& cell)
{
    if (worldRect.isEmpty()) {
        return;
    }
    for (int y = worldRect.minY; y <= worldRect.maxY; ++y) {
        for (int x = worldRect.minX; x <= worldRect.maxX; ++x) {
            setCell(x, y, cell);
        }
    }
}

size_t Grid::carveCircle(Vector2i center, float radius)
{
    const int reach = static_cast<int>(std::ceil(radius));
    const float radiusSquared = radius * radius;
    size_t cleared = 0;

    for (int dy = -reach; dy <= reach; ++dy) {
        for (int dx = -reach; dx <= reach; ++dx) {
            if (static_cast<float>(dx * dx + dy * dy) > radiusSquared) {
                continue;
            }
            const int x = center.x + dx;
            const int y = center.y + dy;
            const auto address = toCellAddress(x, y);
            Chunk* chunk = findChunk(address.chunk);
            if (!chunk) {
                continue;
            }
            Cell& cell = chunk->at(address.local.x, address.local.y);
            if (cell.isEmpty()) {
                continue;
            }
            cell = Cell::empty();
            markChanged(x, y);
            ++cleared;
        }
    }

    LoggingChannels::grid()->debug(
        "Carved radius {} at {}: {} cells cleared", radius, center.toString(), cleared);
    return cleared;
}

Chunk& Grid::ensureChunk(Vector2i coord)
{
    auto it = index_.find(coord);
    if (it != index_.end()) {
        return *chunks_[it->second];
    }

    index_[coord] = chunks_.size();
    chunks_.push_back(std::make_unique<Chunk>(coord));
    LoggingChannels::grid()->debug("Created chunk {}", coord.toString());

    // Cells bordering the new chunk were blocked by unloaded space; retry them.
    const DirtyRect border = Chunk::bounds().translated(chunkOrigin(coord)).expanded(1);
    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            if (dx == 0 && dy == 0) {
                continue;
            }
            if (Chunk* neighbour = findChunk({ coord.x + dx, coord.y + dy })) {
                const Vector2i origin = neighbour->origin();
                neighbour->updateRect().extend(
                    border.translated(-origin).clippedTo(Chunk::bounds()));
            }
        }
    }
    return *chunks_.back();
}

bool Grid::unloadChunk(Vector2i coord)
{
    auto it = index_.find(coord);
    if (it == index_.end()) {
        return false;
    }

    const size_t slot = it->second;
    index_.erase(it);
    if (slot != chunks_.size() - 1) {
        chunks_[slot] = std::move(chunks_.back());
        index_[chunks_[slot]->coord()] = slot;
    }
    chunks_.pop_back();
    LoggingChannels::grid()->debug("Unloaded chunk {}", coord.toString());
    return true;
}

Chunk* Grid::findChunk(Vector2i coord)
{
    auto it = index_.find(coord);
    return it == index_.end() ? nullptr : chunks_[it->second].get();
}

const Chunk* Grid::findChunk(Vector2i coord) const
{
    auto it = index_.find(coord);
    return it == index_.end() ? nullptr : chunks_[it->second].get();
}

std::vector<Vector2i> Grid::chunkCoords() const
{
    std::vector<Vector2i> coords;
    coords.reserve(chunks_.size());
    for (const auto& chunk : chunks_) {
        coords.push_back(chunk->coord());
    }
    std::sort(coords.begin(), coords.end(), chunkOrderLess);
    return coords;
}

std::vector<Chunk*> Grid::activeChunks()
{
    std::vector<Chunk*> active;
    for (const auto& chunk : chunks_) {
        if (chunk->isActive()) {
            active.push_back(chunk.get());
        }
    }
    std::sort(active.begin(), active.end(), [](const Chunk* a, const Chunk* b) {
        return chunkOrderLess(a->coord(), b->coord());
    });
    return active;
}

size_t Grid::activeChunkCount() const
{
    return static_cast<size_t>(std::count_if(
        chunks_.begin(), chunks_.end(), [](const auto& chunk) { return chunk->isActive(); }));
}

bool Grid::isChunkActive(Vector2i coord) const
{
    const Chunk* chunk = findChunk(coord);
    return chunk && chunk->isActive();
}

std::array<Chunk*, 9> Grid::neighborhoodChunks(Vector2i center)
{
    std::array<Chunk*, 9> result{};
    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            result[(dy + 1) * 3 + (dx + 1)] = findChunk({ center.x + dx, center.y + dy });
        }
    }
    return result;
}

void Grid::promoteUpdateRects()
{
    for (auto& chunk : chunks_) {
        chunk->promoteUpdateRect();
    }
}

std::vector<DirtyRegion> Grid::dirtyRects() const
{
    std::vector<DirtyRegion> regions;
    for (const auto& coord : chunkCoords()) {
        const Chunk* chunk = findChunk(coord);
        if (!chunk->renderRect().isEmpty()) {
            regions.push_back({ coord, chunk->renderRect().translated(chunk->origin()) });
        }
    }
    return regions;
}

std::vector<DirtyRegion> Grid::takeDirtyRects()
{
    auto regions = dirtyRects();
    for (auto& chunk : chunks_) {
        chunk->renderRect().clear();
    }
    return regions;
}

void Grid::wakeAround(int worldX, int worldY)
{
    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            const auto address = toCellAddress(worldX + dx, worldY + dy);
            if (Chunk* chunk = findChunk(address.chunk)) {
                chunk->updateRect().extend(address.local.x, address.local.y);
            }
        }
    }
}

void Grid::markChanged(int worldX, int worldY)
{
    const auto address = toCellAddress(worldX, worldY);
    if (Chunk* chunk = findChunk(address.chunk)) {
        chunk->renderRect().extend(address.local.x, address.local.y);
    }
    wakeAround(worldX, worldY);
}

void Grid::clear()
{
    chunks_.clear();
    index_.clear();
    tick_ = 0;
}

} // namespace SandSim
