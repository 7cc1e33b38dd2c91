#pragma once

#include <cstdlib>
#include <functional>
#include <nlohmann/json.hpp>
#include <ostream>
#include <spdlog/fmt/fmt.h>

namespace AntSim {

/**
 * Integer cell coordinate in the terrain grid. y is up.
 */
struct Vector3i {
    int x = 0;
    int y = 0;
    int z = 0;

    bool operator==(const Vector3i& other) const = default;

    Vector3i operator+(const Vector3i& other) const
    {
        return Vector3i{ x + other.x, y + other.y, z + other.z };
    }
};

// Manhattan distance across all three axes.
inline int manhattanDistance(const Vector3i& a, const Vector3i& b)
{
    return std::abs(a.x - b.x) + std::abs(a.y - b.y) + std::abs(a.z - b.z);
}

inline void to_json(nlohmann::json& j, const Vector3i& v)
{
    j = nlohmann::json{ { "x", v.x }, { "y", v.y }, { "z", v.z } };
}

inline void from_json(const nlohmann::json& j, Vector3i& v)
{
    v.x = j.at("x").get<int>();
    v.y = j.at("y").get<int>();
    v.z = j.at("z").get<int>();
}

inline std::ostream& operator<<(std::ostream& os, const Vector3i& v)
{
    return os << "(" << v.x << ", " << v.y << ", " << v.z << ")";
}

} // namespace AntSim

template <>
struct std::hash<AntSim::Vector3i> {
    std::size_t operator()(const AntSim::Vector3i& v) const noexcept
    {
        std::size_t h = std::hash<int>{}(v.x);
        h = h * 31 + std::hash<int>{}(v.y);
        h = h * 31 + std::hash<int>{}(v.z);
        return h;
    }
};

template <>
struct fmt::formatter<AntSim::Vector3i> : fmt::formatter<std::string_view> {
    auto format(const AntSim::Vector3i& v, fmt::format_context& ctx) const
    {
        return fmt::format_to(ctx.out(), "({}, {}, {})", v.x, v.y, v.z);
    }
};
