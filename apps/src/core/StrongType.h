#pragma once

#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <ostream>
#include <spdlog/fmt/fmt.h>

// Typed integer handle. Each Tag produces its own type, so ids of different kinds
// cannot be compared or assigned to each other. A default-constructed handle is
// invalid (-1); valid handles double as arena indices.
//
// Usage:
//   using AntId = StrongType<struct AntIdTag>;
//   AntId id = AntId::fromIndex(ants.size());
//   const Ant& ant = ants[id.index()];
template <typename Tag>
class StrongType {
public:
    constexpr StrongType() = default;
    constexpr explicit StrongType(int value) : m_value{ value } {}

    static constexpr StrongType fromIndex(std::size_t index)
    {
        return StrongType{ static_cast<int>(index) };
    }

    [[nodiscard]] constexpr int get() const { return m_value; }
    [[nodiscard]] constexpr std::size_t index() const { return static_cast<std::size_t>(m_value); }
    [[nodiscard]] constexpr bool isValid() const { return m_value >= 0; }

    constexpr bool operator==(const StrongType& other) const = default;
    constexpr bool operator<(const StrongType& other) const { return m_value < other.m_value; }

private:
    int m_value = -1;
};

template <typename Tag>
struct std::hash<StrongType<Tag>> {
    std::size_t operator()(const StrongType<Tag>& id) const noexcept
    {
        return std::hash<int>{}(id.get());
    }
};

template <typename Tag>
void to_json(nlohmann::json& j, const StrongType<Tag>& id)
{
    j = id.get();
}

template <typename Tag>
void from_json(const nlohmann::json& j, StrongType<Tag>& id)
{
    id = StrongType<Tag>{ j.get<int>() };
}

template <typename Tag>
struct fmt::formatter<StrongType<Tag>> : fmt::formatter<int> {
    auto format(const StrongType<Tag>& id, fmt::format_context& ctx) const
    {
        return fmt::formatter<int>::format(id.get(), ctx);
    }
};

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const StrongType<Tag>& id)
{
    return os << '#' << id.get();
}
