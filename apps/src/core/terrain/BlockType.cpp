#include "BlockType.h"

#include <array>
#include <utility>

namespace AntSim::Block {

namespace {
constexpr std::array<std::pair<EnumType, const char*>, 7> BLOCK_NAMES = { {
    { EnumType::Air, "Air" },
    { EnumType::Grass, "Grass" },
    { EnumType::Stone, "Stone" },
    { EnumType::Mulch, "Mulch" },
    { EnumType::Acidic, "Acidic" },
    { EnumType::Container, "Container" },
    { EnumType::Nest, "Nest" },
} };
} // namespace

std::string toString(EnumType type)
{
    for (const auto& [value, name] : BLOCK_NAMES) {
        if (value == type) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<EnumType> fromString(const std::string& str)
{
    for (const auto& [value, name] : BLOCK_NAMES) {
        if (str == name) {
            return value;
        }
    }
    return std::nullopt;
}

const std::vector<EnumType>& getAllTypes()
{
    static const std::vector<EnumType> types = [] {
        std::vector<EnumType> all;
        for (const auto& entry : BLOCK_NAMES) {
            all.push_back(entry.first);
        }
        return all;
    }();
    return types;
}

} // namespace AntSim::Block
