#include "ConfigLoader.h"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace AntSim {

namespace fs = std::filesystem;

namespace {

using JsonResult = Result<nlohmann::json, std::string>;

JsonResult fail(const std::string& message, spdlog::level::level_enum level)
{
    spdlog::log(level, "ConfigLoader: {}", message);
    return JsonResult::error(message);
}

bool isFile(const fs::path& path)
{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

// <dir>/<name>.local wins over <dir>/<name>.
std::optional<fs::path> resolveInDir(const fs::path& dir, const std::string& filename)
{
    const fs::path local = dir / (filename + ".local");
    if (isFile(local)) {
        return local;
    }
    const fs::path base = dir / filename;
    if (isFile(base)) {
        return base;
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_.reset();
}

std::vector<fs::path> ConfigLoader::getSearchPaths()
{
    std::vector<fs::path> paths;
    if (explicitConfigDir_) {
        paths.emplace_back(*explicitConfigDir_);
    }
    if (const char* envDir = std::getenv("ANTSIM_CONFIG_DIR"); envDir && *envDir) {
        paths.emplace_back(envDir);
    }
    paths.push_back(fs::current_path() / "config");
    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "antsim");
    }
    paths.emplace_back("/etc/antsim");
    return paths;
}

std::optional<fs::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    for (const fs::path& dir : getSearchPaths()) {
        if (auto found = resolveInDir(dir, filename)) {
            return found;
        }
    }
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::tryLoadJson(const fs::path& path)
{
    const std::string where = path.string();

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return fail("Error reading " + where + ": " + ec.message(), spdlog::level::err);
    }
    if (size == 0) {
        return fail("Empty config file: " + where, spdlog::level::warn);
    }

    std::ifstream file(path);
    if (!file) {
        return fail("Cannot open config file: " + where, spdlog::level::warn);
    }

    try {
        nlohmann::json json = nlohmann::json::parse(file);
        spdlog::info("ConfigLoader: Loaded {}", where);
        return JsonResult::okay(std::move(json));
    }
    catch (const nlohmann::json::parse_error& e) {
        return fail("Parse error in " + where + ": " + e.what(), spdlog::level::err);
    }
}

Result<nlohmann::json, std::string> ConfigLoader::loadJson(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path) {
        return fail("Config file not found: " + filename, spdlog::level::debug);
    }
    return tryLoadJson(*path);
}

} // namespace AntSim
