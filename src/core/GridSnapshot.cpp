#include "GridSnapshot.h"
#include "ChunkCoords.h"
#include "Grid.h"
#include "LoggingChannels.h"
#include "MaterialRegistry.h"
#include <nlohmann/json.hpp>
#include <unordered_set>

namespace SandSim {

GridSnapshot GridSnapshot::capture(const Grid& grid)
{
    GridSnapshot snapshot;
    snapshot.tick = grid.tick();

    for (const auto& coord : grid.chunkCoords()) {
        const Chunk* chunk = grid.findChunk(coord);
        snapshot.chunks.push_back(ChunkRecord{ .coord = coord, .cells = chunk->cells() });
    }

    LoggingChannels::persist()->debug(
        "Captured snapshot at tick {} ({} chunks)", snapshot.tick, snapshot.chunks.size());
    return snapshot;
}

Result<std::monostate, std::string> GridSnapshot::restore(Grid& grid) const
{
    using R = Result<std::monostate, std::string>;
    const MaterialRegistry& registry = grid.registry();

    if (magic != MAGIC) {
        return R::error("Not a grid snapshot (bad magic)");
    }
    if (version != FORMAT_VERSION) {
        return R::error(
            "Unsupported snapshot version " + std::to_string(version) + " (expected "
            + std::to_string(FORMAT_VERSION) + ")");
    }

    std::unordered_set<Vector2i> seen;
    for (const auto& record : chunks) {
        if (!seen.insert(record.coord).second) {
            return R::error("Duplicate chunk " + record.coord.toString());
        }
        if (record.cells.size() != static_cast<size_t>(CHUNK_AREA)) {
            return R::error(
                "Chunk " + record.coord.toString() + " has " + std::to_string(record.cells.size())
                + " cells, expected " + std::to_string(CHUNK_AREA));
        }
        for (size_t i = 0; i < record.cells.size(); ++i) {
            if (!registry.contains(record.cells[i].material)) {
                return R::error(
                    "Chunk " + record.coord.toString() + " cell " + std::to_string(i)
                    + " has unknown material id " + std::to_string(record.cells[i].material));
            }
        }
    }

    grid.clear();
    grid.setTick(tick);

    size_t corrections = 0;
    for (const auto& record : chunks) {
        Chunk& chunk = grid.ensureChunk(record.coord);
        auto& cells = chunk.cells();
        for (size_t i = 0; i < record.cells.size(); ++i) {
            const Vector2i where = toWorld(
                record.coord,
                { static_cast<int>(i % CHUNK_SIZE), static_cast<int>(i / CHUNK_SIZE) });
            bool corrected = false;
            cells[i] = grid.sanitize(record.cells[i], where, &corrected);
            if (corrected) {
                corrections++;
            }
        }
        chunk.wakeAll();
    }

    if (corrections > 0) {
        LoggingChannels::persist()->warn("Corrected {} cells while restoring snapshot", corrections);
    }
    LoggingChannels::persist()->info(
        "Restored snapshot at tick {} ({} chunks)", tick, chunks.size());
    return R::okay(std::monostate{});
}

std::vector<std::byte> GridSnapshot::toBytes() const
{
    std::vector<std::byte> data;
    zpp::bits::out out(data);
    out(*this).or_throw();
    return data;
}

Result<GridSnapshot, std::string> GridSnapshot::fromBytes(const std::vector<std::byte>& data)
{
    using R = Result<GridSnapshot, std::string>;
    GridSnapshot snapshot;
    try {
        zpp::bits::in in(data);
        in(snapshot).or_throw();
    }
    catch (const std::exception& e) {
        return R::error(std::string("Failed to decode snapshot: ") + e.what());
    }
    if (snapshot.magic != MAGIC) {
        return R::error("Not a grid snapshot (bad magic)");
    }
    return R::okay(std::move(snapshot));
}

nlohmann::json GridSnapshot::toJson() const
{
    nlohmann::json chunkArray = nlohmann::json::array();
    for (const auto& record : chunks) {
        nlohmann::json cells = nlohmann::json::array();
        for (const auto& cell : record.cells) {
            cells.push_back(cell.toJson());
        }
        chunkArray.push_back({ { "coord", record.coord }, { "cells", std::move(cells) } });
    }
    return nlohmann::json{ { "version", version }, { "tick", tick }, { "chunks", chunkArray } };
}

Result<GridSnapshot, std::string> GridSnapshot::fromJson(const nlohmann::json& json)
{
    using R = Result<GridSnapshot, std::string>;
    GridSnapshot snapshot;
    try {
        snapshot.version = json.at("version").get<uint32_t>();
        snapshot.tick = json.at("tick").get<uint32_t>();
        for (const auto& entry : json.at("chunks")) {
            ChunkRecord record;
            record.coord = entry.at("coord").get<Vector2i>();
            for (const auto& cell : entry.at("cells")) {
                record.cells.push_back(Cell::fromJson(cell));
            }
            snapshot.chunks.push_back(std::move(record));
        }
    }
    catch (const nlohmann::json::exception& e) {
        return R::error(std::string("Invalid snapshot JSON: ") + e.what());
    }
    return R::okay(std::move(snapshot));
}

size_t GridSnapshot::cellCount() const
{
    size_t count = 0;
    for (const auto& record : chunks) {
        for (const auto& cell : record.cells) {
            if (!cell.isEmpty()) {
                count++;
            }
        }
    }
    return count;
}

} // namespace SandSim
