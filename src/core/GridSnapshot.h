#pragma once

#include "Cell.h"
#include "Result.h"
#include "Vector2.h"
#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <variant>
#include <vector>
#include <zpp_bits.h>

namespace SandSim {

class Grid;
class MaterialRegistry;

struct ChunkRecord {
    Vector2i coord;
    std::vector<Cell> cells; // CHUNK_AREA cells, row-major.

    using serialize = zpp::bits::members<2>;
};

/**
 * @brief Complete copy of a Grid's loaded chunks and tick counter.
 *
 * Binary form is zpp_bits; JSON form exists for inspection and tests.
 * Cells are stored exactly as held in the grid, so a save/load round trip
 * preserves material, fill, fire state, last_tick and velocity hint.
 * Dirty and wake rects are not saved: a restored grid wakes every chunk.
 */
struct GridSnapshot {
    static constexpr uint32_t MAGIC = 0x53414E44; // "SAND"
    static constexpr uint32_t FORMAT_VERSION = 1;

    uint32_t magic = MAGIC;
    uint32_t version = FORMAT_VERSION;
    uint32_t tick = 0;
    std::vector<ChunkRecord> chunks; // Ordered by (y, x).

    using serialize = zpp::bits::members<4>;

    static GridSnapshot capture(const Grid& grid);

    /**
     * Replace the grid contents with this snapshot. Validates everything
     * (format, chunk sizes, duplicate chunks, material ids) before touching
     * the grid; on error the grid is unchanged.
     */
    Result<std::monostate, std::string> restore(Grid& grid) const;

    std::vector<std::byte> toBytes() const;
    static Result<GridSnapshot, std::string> fromBytes(const std::vector<std::byte>& data);

    nlohmann::json toJson() const;
    static Result<GridSnapshot, std::string> fromJson(const nlohmann::json& json);

    size_t cellCount() const;
};

} // namespace SandSim
