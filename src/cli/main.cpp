#include "Scenarios.h"
#include "core/GridDiagram.h"
#include "core/LoggingChannels.h"
#include "core/MaterialRegistry.h"
#include "core/SimulationSettings.h"
#include "core/Timers.h"
#include "core/World.h"
#include <algorithm>
#include <args.hxx>
#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>

using namespace SandSim;

// Returns an array of objects, sorted by total_ms descending, so the order
// survives JSON output.
nlohmann::json sortTimerStats(const nlohmann::json& timer_stats)
{
    if (timer_stats.empty()) {
        return nlohmann::json::array();
    }

    std::vector<std::pair<std::string, nlohmann::json>> timer_pairs;
    for (auto it = timer_stats.begin(); it != timer_stats.end(); ++it) {
        timer_pairs.push_back({ it.key(), it.value() });
    }

    std::sort(timer_pairs.begin(), timer_pairs.end(), [](const auto& a, const auto& b) {
        double a_total = a.second.value("total_ms", 0.0);
        double b_total = b.second.value("total_ms", 0.0);
        return a_total > b_total;
    });

    nlohmann::json sorted_timers = nlohmann::json::array();
    for (const auto& pair : timer_pairs) {
        nlohmann::json entry = pair.second;
        entry["name"] = pair.first;
        sorted_timers.push_back(entry);
    }

    return sorted_timers;
}

std::string getScenarioListHelp(const Cli::ScenarioRegistry& scenarios)
{
    std::string help = "Scenarios:\n";
    for (const auto& id : scenarios.getScenarioIds()) {
        help += "  " + id + " - " + scenarios.getMetadata(id)->description + "\n";
    }
    return help;
}

int main(int argc, char** argv)
{
    const auto scenarios = Cli::ScenarioRegistry::createDefault();

    args::ArgumentParser parser(
        "SandSim CLI",
        "Run a falling-sand simulation headless and print a JSON summary to stdout.\n\n"
            + getScenarioListHelp(scenarios));

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> materialsPath(
        parser,
        "path",
        "Material registry JSON (default: config/materials.json)",
        { "materials" },
        "config/materials.json");
    args::ValueFlag<std::string> scenarioName(
        parser, "name", "Scenario to build (default: sandpile)", { "scenario" }, "sandpile");
    args::ValueFlag<uint32_t> steps(
        parser, "steps", "Number of simulation steps (default: 100)", { "steps" }, 100);
    args::ValueFlag<uint32_t> threads(
        parser, "threads", "Worker threads, 0 for automatic (overrides settings)", { "threads" });
    args::ValueFlag<uint32_t> seed(
        parser, "seed", "Random seed (overrides settings)", { "seed" });
    args::ValueFlag<std::string> settingsPath(
        parser, "path", "Simulation settings JSON overlay", { "settings" });
    args::ValueFlag<std::string> loadPath(
        parser, "path", "Load a saved world instead of building a scenario", { "load" });
    args::ValueFlag<std::string> savePath(
        parser, "path", "Save the world after stepping (.json for JSON, otherwise binary)", { "save" });
    args::ValueFlag<std::string> logConfig(
        parser, "path", "Logging config JSON (creates a default file if missing)", { "log-config" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "spec",
        "Channel levels, e.g. \"rules:trace,scheduler:debug\" or \"*:off,fire:debug\"",
        { "log-channels" });
    args::Flag diagram(
        parser, "diagram", "Print an ASCII view of the final world to stderr", { "diagram" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Logs go to stderr; stdout is reserved for the JSON report.
    if (logConfig) {
        LoggingChannels::initializeFromConfig(args::get(logConfig));
    }
    else {
        LoggingChannels::initialize(
            verbose ? spdlog::level::debug : spdlog::level::warn, spdlog::level::debug, "");
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }
    auto log = LoggingChannels::cli();

    auto registryResult = MaterialRegistry::loadFromFile(args::get(materialsPath));
    if (registryResult.isError()) {
        log->error("Failed to load materials: {}", registryResult.errorValue().toString());
        return 1;
    }
    const MaterialRegistry registry = std::move(registryResult).value();

    SimulationSettings settings = getDefaultSimulationSettings();
    if (settingsPath) {
        auto loaded = loadSimulationSettings(args::get(settingsPath));
        if (loaded.isError()) {
            log->error("Failed to load settings: {}", loaded.errorValue().toString());
            return 1;
        }
        settings = loaded.value();
    }
    if (threads) {
        settings.worker_threads = args::get(threads);
    }
    if (seed) {
        settings.random_seed = args::get(seed);
    }

    World world(registry, settings);

    std::string source;
    if (loadPath) {
        source = args::get(loadPath);
        auto loaded = world.loadFromFile(source);
        if (loaded.isError()) {
            log->error("Failed to load world from {}: {}", source, loaded.errorValue());
            return 1;
        }
    }
    else {
        source = args::get(scenarioName);
        auto built = scenarios.setup(source, world);
        if (built.isError()) {
            log->error("{}", built.errorValue());
            std::cerr << getScenarioListHelp(scenarios);
            return 1;
        }
    }

    const uint32_t stepCount = args::get(steps);
    log->info("Running {} steps of '{}' on {} threads", stepCount, source, world.getWorkerCount());
    world.advance(stepCount);

    if (savePath) {
        auto saved = world.saveToFile(args::get(savePath));
        if (saved.isError()) {
            log->error("Failed to save world: {}", saved.errorValue());
            return 1;
        }
    }

    if (diagram) {
        std::cerr << GridDiagram::generate(world.getGrid());
        std::cerr << GridDiagram::legend(registry) << std::endl;
    }

    if (verbose) {
        world.dumpTimerStats();
    }

    nlohmann::json report;
    report["source"] = source;
    report["steps"] = stepCount;
    report["settings"] = world.getSettings();
    report["world"] = world.toJson();
    report["timer_stats"] = sortTimerStats(world.getTimers().exportAllTimersAsJson());
    std::cout << report.dump(2) << std::endl;

    spdlog::shutdown();
    return 0;
}
