#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <zpp_bits.h>

namespace SandSim {

using MaterialId = uint16_t;

// Id 0 is always the empty (air) material.
constexpr MaterialId MATERIAL_EMPTY = 0;

/**
 * Per-cell combustion state. A cell without a FireState is unburnt.
 */
struct FireState {
    int32_t hp = 0;        // Ticks of burning left once burning.
    bool burning = false;
    bool igniting = false; // Exposed to fire, rolling for ignition each tick.

    using serialize = zpp::bits::members<3>;

    bool operator==(const FireState& other) const = default;
};

/**
 * \file
 * Cell is the smallest simulated unit: one material plus how full it is.
 *
 * Invariants (kept by Grid::setCell and the update rules):
 * - an empty cell has fill_level 0, no fire and no velocity hint;
 * - static and powder cells are always full (fill_level 1);
 * - fill_level is never negative.
 */
struct Cell {
    static constexpr float FULL = 1.0f;

    MaterialId material = MATERIAL_EMPTY;
    float fill_level = 0.0f;
    std::optional<FireState> fire;
    uint32_t last_tick = 0;   // Step that last moved or rewrote this cell.
    int8_t velocity_hint = 0; // Preferred sideways flow direction (-1, 0, +1).

    using serialize = zpp::bits::members<5>;

    static Cell empty() { return Cell{}; }
    static Cell of(MaterialId material, float fill = FULL);

    bool isEmpty() const { return material == MATERIAL_EMPTY; }
    bool isBurning() const { return fire.has_value() && fire->burning; }
    bool isIgniting() const { return fire.has_value() && fire->igniting; }

    bool operator==(const Cell& other) const = default;

    nlohmann::json toJson() const;
    static Cell fromJson(const nlohmann::json& json);

    std::string toString() const;
};

void to_json(nlohmann::json& j, const Cell& cell);
void from_json(const nlohmann::json& j, Cell& cell);

} // namespace SandSim
