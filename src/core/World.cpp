#include "World.h"
#include "GridSnapshot.h"
#include "LoggingChannels.h"
#include "MaterialRegistry.h"
#include "SimulationScheduler.h"
#include "Timers.h"
#include "WorkerPool.h"
#include "WorldContactCalculator.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

namespace SandSim {

namespace {

bool endsWith(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size()
        && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

struct World::Impl {
    const MaterialRegistry& registry_;
    SimulationSettings settings_;
    Grid grid_;
    WorkerPool pool_;
    mutable Timers timers_;
    SimulationScheduler scheduler_;

    std::vector<ActorHitbox> hitboxes_;
    WorldEventSink* eventSink_ = nullptr;
    std::vector<WorldEvent> lastEvents_;

    SimulationStats stats_;

    Impl(const MaterialRegistry& registry, const SimulationSettings& settings)
        : registry_(registry),
          settings_(settings),
          grid_(registry),
          pool_(resolveWorkerThreads(settings)),
          scheduler_(grid_, settings_, pool_, timers_)
    {}

    void resolveContacts(StepStats& step)
    {
        lastEvents_.clear();
        if (!settings_.contacts_enabled || hitboxes_.empty()) {
            return;
        }

        ScopeTimer timer(timers_, "contacts");
        lastEvents_ = WorldContactCalculator::resolve(grid_, hitboxes_, step.tick);

        for (const auto& event : lastEvents_) {
            if (std::holds_alternative<BlastEvent>(event)) {
                step.blasts++;
            }
            else {
                step.contactEvents++;
            }
            if (eventSink_) {
                eventSink_->queueEvent(event);
            }
        }
    }
};

World::World(const MaterialRegistry& registry, const SimulationSettings& settings)
    : pImpl(std::make_unique<Impl>(registry, settings))
{
    spdlog::info(
        "Creating World: {} materials, {} worker threads, seed {}",
        registry.size(),
        pImpl->pool_.threadCount(),
        settings.random_seed);
}

World::~World() = default;
World::World(World&&) noexcept = default;
World& World::operator=(World&&) noexcept = default;

// =================================================================
// CORE SIMULATION
// =================================================================

StepStats World::advance()
{
    ScopeTimer timer(pImpl->timers_, "advance");
    const auto start = std::chrono::steady_clock::now();

    StepStats step = pImpl->scheduler_.step();
    pImpl->resolveContacts(step);

    step.stepMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    pImpl->stats_.accumulate(step);
    return step;
}

void World::advance(uint32_t steps)
{
    for (uint32_t i = 0; i < steps; ++i) {
        advance();
    }
}

uint32_t World::tick() const
{
    return pImpl->grid_.tick();
}

void World::reset()
{
    pImpl->grid_.clear();
    pImpl->hitboxes_.clear();
    pImpl->lastEvents_.clear();
    LoggingChannels::grid()->info("World reset");
}

// =================================================================
// CELL ACCESS
// =================================================================

Cell World::getCell(int x, int y) const
{
    return pImpl->grid_.getCell(x, y);
}

bool World::setCell(int x, int y, const Cell& cell)
{
    return pImpl->grid_.setCell(x, y, cell);
}

bool World::setMaterial(int x, int y, const std::string& materialName, float fill)
{
    const auto id = pImpl->registry_.idOf(materialName);
    if (!id) {
        LoggingChannels::grid()->warn("setMaterial: unknown material '{}'", materialName);
        return false;
    }
    pImpl->grid_.setCell(x, y, Cell::of(*id, fill));
    return true;
}

bool World::swapCells(Vector2i a, Vector2i b)
{
    return pImpl->grid_.swapCells(a, b);
}

void World::regionQuery(
    const DirtyRect& worldRect, const std::function<void(Vector2i, const Cell&)>& visit) const
{
    pImpl->grid_.regionQuery(worldRect, visit);
}

void World::fillRect(const DirtyRect& worldRect, const Cell& cell)
{
    pImpl->grid_.fillRect(worldRect, cell);
}

size_t World::carveCircle(Vector2i center, float radius)
{
    return pImpl->grid_.carveCircle(center, radius);
}

std::vector<DirtyRegion> World::dirtyRects() const
{
    return pImpl->grid_.dirtyRects();
}

std::vector<DirtyRegion> World::takeDirtyRects()
{
    return pImpl->grid_.takeDirtyRects();
}

// =================================================================
// ACTORS AND EVENTS
// =================================================================

void World::setActorHitboxes(std::vector<ActorHitbox> hitboxes)
{
    pImpl->hitboxes_ = std::move(hitboxes);
}

const std::vector<ActorHitbox>& World::getActorHitboxes() const
{
    return pImpl->hitboxes_;
}

void World::setEventSink(WorldEventSink* sink)
{
    pImpl->eventSink_ = sink;
}

const std::vector<WorldEvent>& World::lastEvents() const
{
    return pImpl->lastEvents_;
}

// =================================================================
// PERSISTENCE
// =================================================================

std::vector<std::byte> World::saveSnapshot() const
{
    return GridSnapshot::capture(pImpl->grid_).toBytes();
}

Result<std::monostate, std::string> World::loadSnapshot(const std::vector<std::byte>& data)
{
    auto decoded = GridSnapshot::fromBytes(data);
    if (decoded.isError()) {
        LoggingChannels::persist()->error("{}", decoded.errorValue());
        return Result<std::monostate, std::string>::error(decoded.errorValue());
    }
    return decoded.value().restore(pImpl->grid_);
}

Result<std::monostate, std::string> World::saveToFile(const std::string& path) const
{
    using R = Result<std::monostate, std::string>;
    const GridSnapshot snapshot = GridSnapshot::capture(pImpl->grid_);

    if (endsWith(path, ".json")) {
        std::ofstream file(path);
        if (!file.is_open()) {
            return R::error("Cannot open " + path + " for writing");
        }
        file << snapshot.toJson().dump() << std::endl;
    }
    else {
        std::ofstream file(path, std::ios::binary);
        if (!file.is_open()) {
            return R::error("Cannot open " + path + " for writing");
        }
        const auto bytes = snapshot.toBytes();
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    LoggingChannels::persist()->info(
        "Saved {} chunks at tick {} to {}", snapshot.chunks.size(), snapshot.tick, path);
    return R::okay(std::monostate{});
}

Result<std::monostate, std::string> World::loadFromFile(const std::string& path)
{
    using R = Result<std::monostate, std::string>;

    if (endsWith(path, ".json")) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return R::error("Cannot open " + path);
        }
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(file);
        }
        catch (const nlohmann::json::exception& e) {
            return R::error("Failed to parse " + path + ": " + e.what());
        }
        auto snapshot = GridSnapshot::fromJson(json);
        if (snapshot.isError()) {
            return R::error(snapshot.errorValue());
        }
        return snapshot.value().restore(pImpl->grid_);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return R::error("Cannot open " + path);
    }
    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    std::vector<std::byte> bytes(raw.size());
    std::transform(raw.begin(), raw.end(), bytes.begin(), [](char c) { return std::byte(c); });
    return loadSnapshot(bytes);
}

// =================================================================
// ACCESSORS
// =================================================================

Grid& World::getGrid()
{
    return pImpl->grid_;
}

const Grid& World::getGrid() const
{
    return pImpl->grid_;
}

const MaterialRegistry& World::getRegistry() const
{
    return pImpl->registry_;
}

const SimulationSettings& World::getSettings() const
{
    return pImpl->settings_;
}

size_t World::getWorkerCount() const
{
    return pImpl->pool_.threadCount();
}

const SimulationStats& World::getStats() const
{
    return pImpl->stats_;
}

const StepStats& World::lastStepStats() const
{
    return pImpl->stats_.lastStep;
}

Timers& World::getTimers()
{
    return pImpl->timers_;
}

const Timers& World::getTimers() const
{
    return pImpl->timers_;
}

void World::dumpTimerStats() const
{
    pImpl->timers_.dumpTimerStats();
}

nlohmann::json World::toJson() const
{
    return nlohmann::json{ { "tick", tick() },
                           { "chunk_count", pImpl->grid_.chunkCount() },
                           { "active_chunks", pImpl->grid_.activeChunkCount() },
                           { "worker_threads", pImpl->pool_.threadCount() },
                           { "stats", pImpl->stats_ } };
}

} // namespace SandSim
