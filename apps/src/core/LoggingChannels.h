#pragma once

// Compile in every level; channels filter at runtime (must precede spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <array>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace AntSim {

/**
 * Named log channels, one spdlog logger each.
 *
 * Brain carries per-ant decision traces and is the noisy one; Evolution carries
 * the per-generation summaries.
 */
enum class LogChannel { Brain, Colony, Evolution, Spawn, State, Terrain };

inline constexpr std::array<LogChannel, 6> ALL_LOG_CHANNELS = {
    LogChannel::Brain, LogChannel::Colony, LogChannel::Evolution,
    LogChannel::Spawn, LogChannel::State,  LogChannel::Terrain,
};

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Brain:
            return "brain";
        case LogChannel::Colony:
            return "colony";
        case LogChannel::Evolution:
            return "evolution";
        case LogChannel::Spawn:
            return "spawn";
        case LogChannel::State:
            return "state";
        case LogChannel::Terrain:
            return "terrain";
    }
    return "unknown";
}

std::optional<LogChannel> logChannelFromString(const std::string& name);

/**
 * Owns the shared sinks and the per-channel loggers.
 *
 * Configuration is a JSON document:
 *   {
 *     "defaults": { "console_level": "info", "file_level": "debug", "flush_interval_ms": 1000 },
 *     "sinks": {
 *       "console": { "enabled": true, "level": "info" },
 *       "file": { "enabled": true, "path": "antsim.log", "level": "debug", "truncate": true }
 *     },
 *     "channels": { "brain": "warn", "evolution": "info" }
 *   }
 * A file sink with "max_size_mb" rotates instead of truncating.
 *
 * The default spdlog logger (SLOG_* macros) shares the sink setup but prints no
 * channel name.
 */
class LoggingChannels {
public:
    // Console plus antsim.log, built-in channel levels.
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default");

    /**
     * Reads <configPath>.local, else <configPath>. A missing file is written out
     * with the built-in defaults so it can be edited. Returns false when already
     * initialized.
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    // Initializes with quiet defaults on first use, which is what tests rely on.
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * Applies "channel:level" pairs separated by commas; "*" addresses every
     * channel. Later pairs win: "*:off,evolution:info".
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    // Case-insensitive; unknown names fall back to info with a warning.
    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    static nlohmann::json defaultConfig();

private:
    static nlohmann::json loadConfigFile(const std::string& configPath);
    static void applyConfig(const nlohmann::json& config, const std::string& componentName);
    static std::string makePattern(const std::string& componentName, bool withChannel);

    static bool initialized_;
};

// clang-format off
#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::AntSim::LoggingChannels::get(::AntSim::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::AntSim::LoggingChannels::get(::AntSim::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::AntSim::LoggingChannels::get(::AntSim::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::AntSim::LoggingChannels::get(::AntSim::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::AntSim::LoggingChannels::get(::AntSim::LogChannel::channel), __VA_ARGS__)

// Default logger, no channel tag.
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)
// clang-format on

} // namespace AntSim
