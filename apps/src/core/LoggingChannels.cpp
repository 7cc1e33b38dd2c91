#include "LoggingChannels.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sstream>

namespace AntSim {

namespace {

constexpr const char* LOG_FILE = "antsim.log";

std::string trim(const std::string& s)
{
    const size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    return s.substr(first, s.find_last_not_of(" \t") - first + 1);
}

struct SinkSet {
    std::vector<spdlog::sink_ptr> channel; // Shared by every channel logger.
    std::vector<spdlog::sink_ptr> plain;   // Default logger only.
};

// Two sinks per output so the default logger can use a pattern without %n.
// The plain file sink appends to the file the channel sink just opened.
SinkSet buildSinks(const nlohmann::json& sinks)
{
    SinkSet set;

    const auto console = sinks.value("console", nlohmann::json::object());
    if (console.value("enabled", true)) {
        const auto level = LoggingChannels::parseLevelString(console.value("level", "info"));
        for (auto* target : { &set.channel, &set.plain }) {
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            sink->set_level(level);
            target->push_back(sink);
        }
    }

    const auto file = sinks.value("file", nlohmann::json::object());
    if (file.value("enabled", true)) {
        const std::string path = file.value("path", std::string(LOG_FILE));
        const auto level = LoggingChannels::parseLevelString(file.value("level", "debug"));

        spdlog::sink_ptr channelSink;
        if (file.contains("max_size_mb")) {
            const size_t maxBytes = file.value("max_size_mb", size_t{ 100 }) * 1024 * 1024;
            channelSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, maxBytes, file.value("max_files", size_t{ 3 }));
        }
        else {
            channelSink =
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, file.value("truncate", true));
        }
        channelSink->set_level(level);
        set.channel.push_back(channelSink);

        auto plainSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        plainSink->set_level(level);
        set.plain.push_back(plainSink);
    }

    return set;
}

} // namespace

bool LoggingChannels::initialized_ = false;

std::optional<LogChannel> logChannelFromString(const std::string& name)
{
    for (const LogChannel channel : ALL_LOG_CHANNELS) {
        if (name == toString(channel)) {
            return channel;
        }
    }
    return std::nullopt;
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    nlohmann::json config = defaultConfig();
    const std::string console(spdlog::level::to_string_view(consoleLevel).data());
    const std::string file(spdlog::level::to_string_view(fileLevel).data());
    config["defaults"]["console_level"] = console;
    config["defaults"]["file_level"] = file;
    config["sinks"]["console"]["level"] = console;
    config["sinks"]["file"]["level"] = file;

    applyConfig(config, componentName);
    initialized_ = true;
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    applyConfig(loadConfigFile(configPath), componentName);
    initialized_ = true;
    return true;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    if (!initialized_) {
        initialize(spdlog::level::warn, spdlog::level::debug);
    }

    auto logger = spdlog::get(toString(channel));
    if (!logger) {
        // Someone dropped the registry; fall back rather than crash a log call.
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }

        const size_t colon = item.find(':');
        if (colon == std::string::npos) {
            spdlog::warn("Invalid channel spec (expected channel:level): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colon));
        const auto level = parseLevelString(trim(item.substr(colon + 1)));

        if (channel == "*") {
            for (const LogChannel c : ALL_LOG_CHANNELS) {
                setChannelLevel(c, level);
            }
            continue;
        }
        setChannelLevel(channel, level);
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    get(channel)->set_level(level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    const auto parsed = logChannelFromString(channel);
    if (!parsed) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    setChannelLevel(*parsed, level);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    // from_str() maps anything it does not know to off.
    const auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
    return level;
}

std::string LoggingChannels::makePattern(const std::string& componentName, bool withChannel)
{
    std::string pattern = "[%H:%M:%S.%e] ";
    if (componentName != "default" && !componentName.empty()) {
        pattern += "[" + componentName + "] ";
    }
    if (withChannel) {
        pattern += "[%n] ";
    }
    return pattern + "[%^%l%$] %v";
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return nlohmann::json{
        { "defaults", { { "console_level", "info" }, { "file_level", "debug" }, { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", LOG_FILE },
                { "truncate", true } } } } },
        { "channels",
          { { "brain", "warn" },
            { "colony", "info" },
            { "evolution", "info" },
            { "spawn", "info" },
            { "state", "debug" },
            { "terrain", "info" } } }
    };
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    std::string path = configPath + ".local";
    if (!fs::exists(path)) {
        path = configPath;
    }

    if (!fs::exists(path)) {
        spdlog::info("Logging config not found, writing defaults to {}", configPath);
        std::ofstream out(configPath);
        if (out) {
            out << defaultConfig().dump(2) << std::endl;
        }
        else {
            spdlog::warn("Could not write {}, using built-in defaults", configPath);
        }
        return defaultConfig();
    }

    std::ifstream in(path);
    if (!in) {
        spdlog::error("Cannot open logging config {}, using built-in defaults", path);
        return defaultConfig();
    }
    try {
        return nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse logging config {}: {}", path, e.what());
        return defaultConfig();
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    const auto defaults = config.value("defaults", nlohmann::json::object());
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    int flushIntervalMs = 1000;
    SinkSet sinks;

    try {
        consoleLevel = parseLevelString(defaults.value("console_level", "info"));
        fileLevel = parseLevelString(defaults.value("file_level", "debug"));
        flushIntervalMs = defaults.value("flush_interval_ms", 1000);
        sinks = buildSinks(config.value("sinks", nlohmann::json::object()));
    }
    catch (const std::exception& e) {
        spdlog::error("Bad logging sink config ({}), falling back to console", e.what());
        sinks = SinkSet{};
        for (auto* target : { &sinks.channel, &sinks.plain }) {
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            sink->set_level(consoleLevel);
            target->push_back(sink);
        }
    }

    for (auto& sink : sinks.channel) {
        sink->set_pattern(makePattern(componentName, true));
    }
    for (auto& sink : sinks.plain) {
        sink->set_pattern(makePattern(componentName, false));
    }

    for (const LogChannel channel : ALL_LOG_CHANNELS) {
        const std::string name = toString(channel);
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.channel.begin(), sinks.channel.end());
        logger->set_level(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    if (config.contains("channels") && config["channels"].is_object()) {
        for (const auto& [name, level] : config["channels"].items()) {
            if (!level.is_string()) {
                spdlog::warn("Ignoring non-string level for channel '{}'", name);
                continue;
            }
            const auto channel = logChannelFromString(name);
            if (!channel) {
                spdlog::warn("Unknown log channel '{}' in config", name);
                continue;
            }
            spdlog::get(name)->set_level(parseLevelString(level.get<std::string>()));
        }
    }

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    auto defaultLogger = std::make_shared<spdlog::logger>(loggerName, sinks.plain.begin(), sinks.plain.end());
    defaultLogger->set_level(std::min(consoleLevel, fileLevel));
    spdlog::set_default_logger(defaultLogger);

    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
    SLOG_DEBUG("Logging ready: {} channels", ALL_LOG_CHANNELS.size());
}

} // namespace AntSim
