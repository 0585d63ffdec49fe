#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace SandSim {

/**
 * @brief Named spdlog channels, one per engine subsystem.
 *
 * Channels share a console sink and a file sink so that, for example, the
 * rules channel can be raised to trace while everything else stays at warn.
 * Before initialization every accessor falls back to the default logger,
 * so library code can log unconditionally.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param logFile Path of the file sink, empty to disable file output
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& logFile = "sandsim.log");

    /**
     * @brief Initialize from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath>. A missing
     * file is created with defaults.
     * @return false if the file could not be read or parsed (defaults are used).
     */
    static bool initializeFromConfig(const std::string& configPath = "logging-config.json");

    /**
     * @brief Get a channel logger, or the default logger if it doesn't exist.
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all.
     * Examples:
     *   "rules:trace,scheduler:debug"
     *   "*:off,fire:trace"
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static bool isInitialized() { return initialized_; }

    static const std::vector<std::string>& channelNames();

    static std::shared_ptr<spdlog::logger> grid() { return get("grid"); }
    static std::shared_ptr<spdlog::logger> scheduler() { return get("scheduler"); }
    static std::shared_ptr<spdlog::logger> rules() { return get("rules"); }
    static std::shared_ptr<spdlog::logger> fire() { return get("fire"); }
    static std::shared_ptr<spdlog::logger> reaction() { return get("reaction"); }
    static std::shared_ptr<spdlog::logger> contact() { return get("contact"); }
    static std::shared_ptr<spdlog::logger> registry() { return get("registry"); }
    static std::shared_ptr<spdlog::logger> persist() { return get("persist"); }
    static std::shared_ptr<spdlog::logger> cli() { return get("cli"); }

private:
    static void createChannels(spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    static nlohmann::json defaultConfig();

    static bool createDefaultConfigFile(const std::string& path);

    static void applyConfig(const nlohmann::json& config);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

} // namespace SandSim
