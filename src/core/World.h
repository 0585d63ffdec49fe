#pragma once

#include "Cell.h"
#include "DirtyRect.h"
#include "Grid.h"
#include "Result.h"
#include "SimulationSettings.h"
#include "SimulationStats.h"
#include "Vector2.h"
#include "WorldEvents.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <variant>
#include <vector>

namespace SandSim {

class MaterialRegistry;
class Timers;

/**
 * @brief The simulation facade: a Grid plus everything needed to step it.
 *
 * The registry must outlive the World. All methods are for the thread that
 * drives the simulation; external edits and reads happen between advance()
 * calls, and advance() is not re-entrant.
 */
class World {
public:
    explicit World(
        const MaterialRegistry& registry,
        const SimulationSettings& settings = getDefaultSimulationSettings());
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;
    World(World&&) noexcept;
    World& operator=(World&&) noexcept;

    // =================================================================
    // CORE SIMULATION
    // =================================================================

    /**
     * Advance exactly one tick: chunk passes, rect promotion, then contact
     * resolution against the registered actor hitboxes.
     */
    StepStats advance();
    void advance(uint32_t steps);

    uint32_t tick() const;

    // Drops every chunk and resets the tick. Stats and timers are kept.
    void reset();

    // =================================================================
    // CELL ACCESS
    // =================================================================

    Cell getCell(int x, int y) const;
    bool setCell(int x, int y, const Cell& cell);

    // Places `fill` of the named material; false if the name is unknown.
    bool setMaterial(int x, int y, const std::string& materialName, float fill = Cell::FULL);

    bool swapCells(Vector2i a, Vector2i b);
    void regionQuery(
        const DirtyRect& worldRect, const std::function<void(Vector2i, const Cell&)>& visit) const;
    void fillRect(const DirtyRect& worldRect, const Cell& cell);
    size_t carveCircle(Vector2i center, float radius);

    std::vector<DirtyRegion> dirtyRects() const;
    std::vector<DirtyRegion> takeDirtyRects();

    // =================================================================
    // ACTORS AND EVENTS
    // =================================================================

    void setActorHitboxes(std::vector<ActorHitbox> hitboxes);
    const std::vector<ActorHitbox>& getActorHitboxes() const;

    // Not owned. Pass nullptr to stop delivery.
    void setEventSink(WorldEventSink* sink);

    // Events produced by the most recent advance().
    const std::vector<WorldEvent>& lastEvents() const;

    // =================================================================
    // PERSISTENCE
    // =================================================================

    std::vector<std::byte> saveSnapshot() const;
    Result<std::monostate, std::string> loadSnapshot(const std::vector<std::byte>& data);

    // Binary snapshot, or JSON when the path ends in ".json".
    Result<std::monostate, std::string> saveToFile(const std::string& path) const;
    Result<std::monostate, std::string> loadFromFile(const std::string& path);

    // =================================================================
    // ACCESSORS
    // =================================================================

    Grid& getGrid();
    const Grid& getGrid() const;
    const MaterialRegistry& getRegistry() const;
    const SimulationSettings& getSettings() const;
    size_t getWorkerCount() const;

    const SimulationStats& getStats() const;
    const StepStats& lastStepStats() const;

    Timers& getTimers();
    const Timers& getTimers() const;
    void dumpTimerStats() const;

    // Summary for reports: tick, chunk counts and stats.
    nlohmann::json toJson() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace SandSim
