#pragma once

#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace SandSim {

/**
 * @brief What one call to World::advance() did.
 */
struct StepStats {
    uint32_t tick = 0;
    uint32_t activeChunks = 0;
    std::array<uint32_t, 4> passChunks = { 0, 0, 0, 0 };
    uint32_t cellsVisited = 0;
    uint32_t cellsChanged = 0;
    uint32_t moves = 0;
    uint32_t reactions = 0;
    uint32_t ignitions = 0;
    uint32_t burnouts = 0;
    uint32_t extinguished = 0;
    uint32_t dissipated = 0;
    uint32_t corrected = 0; ///< Cells reset by the movement rules' invariant check.
    uint32_t contactEvents = 0;
    uint32_t blasts = 0;
    double stepMs = 0.0;
};

/**
 * @brief Running totals over the life of a World.
 */
struct SimulationStats {
    uint32_t stepCount = 0;
    uint64_t cellsVisited = 0;
    uint64_t cellsChanged = 0;
    uint64_t moves = 0;
    uint64_t reactions = 0;
    uint64_t ignitions = 0;
    uint64_t burnouts = 0;
    uint64_t contactEvents = 0;
    uint64_t blasts = 0;
    uint32_t peakActiveChunks = 0;
    double avgStepTime = 0.0;  ///< ms.
    double lastStepTime = 0.0; ///< ms.
    StepStats lastStep;

    void accumulate(const StepStats& step)
    {
        stepCount++;
        cellsVisited += step.cellsVisited;
        cellsChanged += step.cellsChanged;
        moves += step.moves;
        reactions += step.reactions;
        ignitions += step.ignitions;
        burnouts += step.burnouts;
        contactEvents += step.contactEvents;
        blasts += step.blasts;
        if (step.activeChunks > peakActiveChunks) {
            peakActiveChunks = step.activeChunks;
        }
        lastStepTime = step.stepMs;
        avgStepTime += (step.stepMs - avgStepTime) / stepCount;
        lastStep = step;
    }
};

inline void to_json(nlohmann::json& j, const StepStats& s)
{
    j = nlohmann::json{ { "tick", s.tick },
                        { "active_chunks", s.activeChunks },
                        { "pass_chunks", s.passChunks },
                        { "cells_visited", s.cellsVisited },
                        { "cells_changed", s.cellsChanged },
                        { "moves", s.moves },
                        { "reactions", s.reactions },
                        { "ignitions", s.ignitions },
                        { "burnouts", s.burnouts },
                        { "extinguished", s.extinguished },
                        { "dissipated", s.dissipated },
                        { "corrected", s.corrected },
                        { "contact_events", s.contactEvents },
                        { "blasts", s.blasts },
                        { "step_ms", s.stepMs } };
}

inline void to_json(nlohmann::json& j, const SimulationStats& s)
{
    j = nlohmann::json{ { "step_count", s.stepCount },
                        { "cells_visited", s.cellsVisited },
                        { "cells_changed", s.cellsChanged },
                        { "moves", s.moves },
                        { "reactions", s.reactions },
                        { "ignitions", s.ignitions },
                        { "burnouts", s.burnouts },
                        { "contact_events", s.contactEvents },
                        { "blasts", s.blasts },
                        { "peak_active_chunks", s.peakActiveChunks },
                        { "avg_step_ms", s.avgStepTime },
                        { "last_step_ms", s.lastStepTime },
                        { "last_step", s.lastStep } };
}

} // namespace SandSim
