#pragma once

#include "CellRandom.h"
#include "SimulationStats.h"
#include "Vector2.h"

namespace SandSim {

class ChunkNeighborhood;
class Grid;
class Timers;
class WorkerPool;
struct SimulationSettings;

/**
 * @brief Advances the grid by one tick using checkerboard chunk passes.
 *
 * Active chunks are split into four passes by (x mod 2, y mod 2). Chunks in
 * one pass are two chunks apart, and each task only sees its chunk plus half
 * a chunk around it, so the tasks of a pass run in parallel without locks.
 * Each task collects its dirty and wake marks privately; the scheduler merges
 * them in a fixed order after the pass, which keeps results independent of
 * the worker count.
 */
class SimulationScheduler {
public:
    SimulationScheduler(
        Grid& grid, const SimulationSettings& settings, WorkerPool& pool, Timers& timers);

    StepStats step();

    static int passIndex(Vector2i chunk);

    /**
     * Visit the centre chunk's update rect bottom-up, alternating the row
     * direction with (tick + y), and run movement, fire and reactions.
     */
    static void processChunk(ChunkNeighborhood& hood);

private:
    Grid& grid_;
    const SimulationSettings& settings_;
    WorkerPool& pool_;
    Timers& timers_;
    CellRandom random_;
};

} // namespace SandSim
