#pragma once

#include "ReflectSerializer.h"
#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace AntSim {

/**
 * @brief Loads configuration files with multi-path search and .local override support.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (if set via setConfigDir, e.g. --config-dir)
 * 2. $ANTSIM_CONFIG_DIR
 * 3. ./config/ (CWD - for development)
 * 4. ~/.config/antsim/ (user overrides)
 * 5. /etc/antsim/ (system defaults)
 *
 * At each location, checks for .local version first (e.g., colony.json.local),
 * then falls back to base file (e.g., colony.json). The .local file is a complete
 * replacement, not a merge.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // Like load(), but a missing file yields a default-constructed T.
    // Unreadable or malformed files are still reported as errors.
    template <typename T>
    static Result<T, std::string> loadOrDefault(const std::string& filename);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> loadJson(const std::string& filename);
    static Result<nlohmann::json, std::string> tryLoadJson(const std::filesystem::path& path);

    template <typename T>
    static Result<T, std::string> parse(const nlohmann::json& json, const std::string& filename);
};

template <typename T>
Result<T, std::string> ConfigLoader::parse(const nlohmann::json& json, const std::string& filename)
{
    for (const std::string& key : ReflectSerializer::unknownKeys<T>(json)) {
        spdlog::warn("ConfigLoader: {} has unknown key '{}' (ignored)", filename, key);
    }

    try {
        T config;
        from_json(json, config); // Found by ADL next to T.
        return Result<T, std::string>::okay(std::move(config));
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + filename + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto jsonResult = loadJson(filename);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }
    return parse<T>(jsonResult.value(), filename);
}

template <typename T>
Result<T, std::string> ConfigLoader::loadOrDefault(const std::string& filename)
{
    auto path = findConfigFile(filename);
    if (!path.has_value()) {
        spdlog::info("ConfigLoader: {} not found, using defaults", filename);
        return Result<T, std::string>::okay(T{});
    }

    auto jsonResult = tryLoadJson(path.value());
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }
    return parse<T>(jsonResult.value(), filename);
}

} // namespace AntSim
