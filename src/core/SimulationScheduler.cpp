#include "SimulationScheduler.h"
#include "Chunk.h"
#include "ChunkCoords.h"
#include "ChunkNeighborhood.h"
#include "Grid.h"
#include "LoggingChannels.h"
#include "MaterialRules.h"
#include "SimulationSettings.h"
#include "Timers.h"
#include "WorkerPool.h"
#include "WorldFireCalculator.h"
#include "WorldReactionCalculator.h"
#include <array>
#include <string>
#include <vector>

namespace SandSim {

namespace {

const std::array<std::string, 4> PASS_TIMER_NAMES = { "pass_0", "pass_1", "pass_2", "pass_3" };

void addCounters(StepStats& stats, const ChunkUpdateResult& result)
{
    stats.cellsVisited += result.cellsVisited;
    stats.cellsChanged += result.cellsChanged;
    stats.moves += result.moves;
    stats.reactions += result.reactions;
    stats.ignitions += result.ignitions;
    stats.burnouts += result.burnouts;
    stats.extinguished += result.extinguished;
    stats.dissipated += result.dissipated;
    stats.corrected += result.corrected;
}

} // namespace

SimulationScheduler::SimulationScheduler(
    Grid& grid, const SimulationSettings& settings, WorkerPool& pool, Timers& timers)
    : grid_(grid), settings_(settings), pool_(pool), timers_(timers), random_(settings.random_seed)
{}

int SimulationScheduler::passIndex(Vector2i chunk)
{
    return floorMod(chunk.y, 2) * 2 + floorMod(chunk.x, 2);
}

StepStats SimulationScheduler::step()
{
    StepStats stats;
    stats.tick = grid_.advanceTick();
    const uint32_t tick = stats.tick;

    std::array<std::vector<Chunk*>, 4> passes;
    {
        ScopeTimer timer(timers_, "collect_active");
        // activeChunks() is ordered by (y, x), so each pass is too.
        for (Chunk* chunk : grid_.activeChunks()) {
            passes[passIndex(chunk->coord())].push_back(chunk);
            stats.activeChunks++;
        }
    }

    for (size_t pass = 0; pass < passes.size(); ++pass) {
        const auto& chunks = passes[pass];
        stats.passChunks[pass] = static_cast<uint32_t>(chunks.size());
        if (chunks.empty()) {
            continue;
        }

        // Neighbourhoods are resolved up front so workers never touch the chunk index.
        std::vector<std::array<Chunk*, 9>> neighborhoods;
        neighborhoods.reserve(chunks.size());
        for (Chunk* chunk : chunks) {
            neighborhoods.push_back(grid_.neighborhoodChunks(chunk->coord()));
        }

        std::vector<ChunkUpdateResult> results(chunks.size());
        std::vector<WorkerPool::Job> jobs;
        jobs.reserve(chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            jobs.push_back([this, tick, &neighborhoods, &results, i] {
                ChunkNeighborhood hood(
                    neighborhoods[i],
                    tick,
                    grid_.registry(),
                    settings_,
                    random_,
                    results[i]);
                processChunk(hood);
            });
        }

        {
            ScopeTimer timer(timers_, PASS_TIMER_NAMES[pass]);
            pool_.runBatch(jobs);
        }

        ScopeTimer timer(timers_, "merge_results");
        for (size_t i = 0; i < chunks.size(); ++i) {
            const auto& result = results[i];
            for (size_t slot = 0; slot < neighborhoods[i].size(); ++slot) {
                Chunk* chunk = neighborhoods[i][slot];
                if (!chunk) {
                    continue;
                }
                chunk->renderRect().extend(result.renderRects[slot]);
                chunk->nextUpdateRect().extend(result.wakeRects[slot]);
            }
            addCounters(stats, result);
        }
    }

    {
        ScopeTimer timer(timers_, "promote_rects");
        grid_.promoteUpdateRects();
    }

    if (settings_.log_step_summary) {
        LoggingChannels::scheduler()->debug(
            "tick {}: {} active chunks ({}/{}/{}/{}), {} visited, {} changed, {} moves",
            tick,
            stats.activeChunks,
            stats.passChunks[0],
            stats.passChunks[1],
            stats.passChunks[2],
            stats.passChunks[3],
            stats.cellsVisited,
            stats.cellsChanged,
            stats.moves);
    }

    return stats;
}

void SimulationScheduler::processChunk(ChunkNeighborhood& hood)
{
    Chunk& chunk = hood.center();
    const DirtyRect rect = chunk.updateRect().clippedTo(Chunk::bounds());
    if (rect.isEmpty()) {
        return;
    }

    const Vector2i origin = hood.origin();
    const uint32_t tick = hood.tick();
    const SimulationSettings& settings = hood.settings();
    ChunkUpdateResult& result = hood.result();

    for (int ly = rect.maxY; ly >= rect.minY; --ly) {
        const int wy = origin.y + ly;
        const bool leftToRight = ((tick + static_cast<uint32_t>(wy)) & 1u) == 0;

        for (int step = 0; step < rect.width(); ++step) {
            const int lx = leftToRight ? rect.minX + step : rect.maxX - step;
            const Cell& cell = chunk.at(lx, ly);
            if (cell.isEmpty() || cell.last_tick == tick) {
                continue;
            }
            result.cellsVisited++;

            const Vector2i pos{ origin.x + lx, wy };
            const auto newPos = MaterialRules::applyMovement(hood, pos);
            if (!newPos) {
                continue;
            }

            if (settings.fire_enabled && WorldFireCalculator::update(hood, *newPos)) {
                continue;
            }

            if (settings.reactions_enabled) {
                WorldReactionCalculator::update(hood, *newPos);
            }
        }
    }
}

} // namespace SandSim
