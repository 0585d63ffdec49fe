#include "LoggingChannels.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace SandSim {

namespace {

constexpr const char* DEFAULT_PATTERN = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

const std::vector<std::string>& LoggingChannels::channelNames()
{
    static const std::vector<std::string> names = { "cli",      "contact", "fire",
                                                    "grid",     "persist", "reaction",
                                                    "registry", "rules",   "scheduler" };
    return names;
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& logFile)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    // Console goes to stderr so the CLI can keep stdout for its JSON report.
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(consoleLevel);
    sharedSinks_ = { console_sink };

    if (!logFile.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        file_sink->set_level(fileLevel);
        sharedSinks_.push_back(file_sink);
    }

    createChannels(spdlog::level::trace);

    auto default_logger =
        std::make_shared<spdlog::logger>("default", sharedSinks_.begin(), sharedSinks_.end());
    default_logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(default_logger);

    // Applies to every registered channel, so it must follow createChannels().
    spdlog::set_pattern(DEFAULT_PATTERN);
    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    spdlog::debug("LoggingChannels initialized");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(const std::string& channel)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);
        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        std::string channel = trim(item.substr(0, colonPos));
        auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            for (const auto& name : channelNames()) {
                setChannelLevel(name, level);
            }
            spdlog::default_logger()->set_level(level);
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (logger) {
        logger->set_level(level);
    }
    else {
        spdlog::warn("Channel '{}' not found, cannot set level", channel);
    }
}

void LoggingChannels::createChannels(spdlog::level::level_enum level)
{
    for (const auto& name : channelNames()) {
        if (spdlog::get(name)) {
            spdlog::drop(name);
        }
        auto logger = std::make_shared<spdlog::logger>(name, sharedSinks_.begin(), sharedSinks_.end());
        logger->set_level(level);
        spdlog::register_logger(logger);
    }
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;

    spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
    return spdlog::level::info;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    nlohmann::json channels = nlohmann::json::object();
    for (const auto& name : channelNames()) {
        channels[name] = "info";
    }

    return nlohmann::json{
        { "defaults", { { "pattern", DEFAULT_PATTERN }, { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", "sandsim.log" },
                { "truncate", true } } } } },
        { "channels", channels },
    };
}

bool LoggingChannels::createDefaultConfigFile(const std::string& path)
{
    std::ofstream configFile(path);
    if (!configFile.is_open()) {
        spdlog::error("Failed to create logging config file: {}", path);
        return false;
    }
    configFile << defaultConfig().dump(2) << std::endl;
    spdlog::info("Created default logging config file: {}", path);
    return true;
}

bool LoggingChannels::initializeFromConfig(const std::string& configPath)
{
    namespace fs = std::filesystem;

    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    const std::string localPath = configPath + ".local";
    std::string pathToUse;
    if (fs::exists(localPath)) {
        pathToUse = localPath;
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else if (createDefaultConfigFile(configPath)) {
        pathToUse = configPath;
    }

    nlohmann::json config = defaultConfig();
    bool loaded = false;
    if (!pathToUse.empty()) {
        try {
            std::ifstream configFile(pathToUse);
            if (!configFile.is_open()) {
                spdlog::error("Cannot open logging config file: {}", pathToUse);
            }
            else {
                config = nlohmann::json::parse(configFile);
                loaded = true;
            }
        }
        catch (const nlohmann::json::exception& e) {
            spdlog::error("Failed to parse logging config {}: {}", pathToUse, e.what());
        }
    }

    applyConfig(config);
    initialized_ = true;

    if (loaded) {
        spdlog::debug("Loaded logging config from {}", pathToUse);
    }
    return loaded;
}

void LoggingChannels::applyConfig(const nlohmann::json& config)
{
    std::string pattern = DEFAULT_PATTERN;
    int flushIntervalMs = 1000;
    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            pattern = defaults.value("pattern", pattern);
            flushIntervalMs = defaults.value("flush_interval_ms", flushIntervalMs);
        }

        if (config.contains("sinks")) {
            const auto& sinksConfig = config["sinks"];

            if (sinksConfig.contains("console")) {
                const auto& consoleCfg = sinksConfig["console"];
                if (consoleCfg.value("enabled", true)) {
                    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                    console_sink->set_level(parseLevelString(consoleCfg.value("level", "info")));
                    sinks.push_back(console_sink);
                }
            }

            if (sinksConfig.contains("file")) {
                const auto& fileCfg = sinksConfig["file"];
                if (fileCfg.value("enabled", true)) {
                    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                        fileCfg.value("path", "sandsim.log"), fileCfg.value("truncate", true));
                    file_sink->set_level(parseLevelString(fileCfg.value("level", "debug")));
                    sinks.push_back(file_sink);
                }
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from logging config: {}, using defaults", e.what());
        sinks = { std::make_shared<spdlog::sinks::stderr_color_sink_mt>() };
    }

    sharedSinks_ = sinks;
    createChannels(spdlog::level::trace);

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config["channels"].items()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    auto default_logger =
        std::make_shared<spdlog::logger>("default", sharedSinks_.begin(), sharedSinks_.end());
    default_logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(default_logger);

    spdlog::set_pattern(pattern);
    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
}

} // namespace SandSim
