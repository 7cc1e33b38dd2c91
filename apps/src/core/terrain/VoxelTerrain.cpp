#include "VoxelTerrain.h"

#include "core/LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace AntSim {

namespace {

constexpr int HEIGHT_LATTICE_STEP = 8;

double smoothstep(double t)
{
    return t * t * (3.0 - 2.0 * t);
}

// Value noise over a coarse lattice, returns [0, 1].
class HeightField {
public:
    HeightField(int sizeX, int sizeZ, std::mt19937& rng)
        : cols_(sizeX / HEIGHT_LATTICE_STEP + 2), rows_(sizeZ / HEIGHT_LATTICE_STEP + 2)
    {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        lattice_.resize(static_cast<size_t>(cols_) * rows_);
        for (double& v : lattice_) {
            v = dist(rng);
        }
    }

    double sample(int x, int z) const
    {
        const int cx = x / HEIGHT_LATTICE_STEP;
        const int cz = z / HEIGHT_LATTICE_STEP;
        const double tx = smoothstep(static_cast<double>(x % HEIGHT_LATTICE_STEP) / HEIGHT_LATTICE_STEP);
        const double tz = smoothstep(static_cast<double>(z % HEIGHT_LATTICE_STEP) / HEIGHT_LATTICE_STEP);

        const double a = at(cx, cz);
        const double b = at(cx + 1, cz);
        const double c = at(cx, cz + 1);
        const double d = at(cx + 1, cz + 1);
        const double top = a + (b - a) * tx;
        const double bottom = c + (d - c) * tx;
        return top + (bottom - top) * tz;
    }

private:
    double at(int cx, int cz) const { return lattice_[static_cast<size_t>(cz) * cols_ + cx]; }

    int cols_;
    int rows_;
    std::vector<double> lattice_;
};

template <typename Fn>
void forEachInSphere(const VoxelTerrain& terrain, int cx, int cy, int cz, int radius, Fn&& fn)
{
    const int r2 = radius * radius;
    for (int x = std::max(0, cx - radius); x <= std::min(terrain.sizeX() - 1, cx + radius); x++) {
        for (int y = std::max(1, cy - radius); y <= std::min(terrain.sizeY() - 1, cy + radius);
             y++) {
            for (int z = std::max(0, cz - radius); z <= std::min(terrain.sizeZ() - 1, cz + radius);
                 z++) {
                const int dx = x - cx;
                const int dy = y - cy;
                const int dz = z - cz;
                if (dx * dx + dy * dy + dz * dz <= r2) {
                    fn(x, y, z);
                }
            }
        }
    }
}

} // namespace

VoxelTerrain::VoxelTerrain(int sizeX, int sizeY, int sizeZ, Block::EnumType fill)
    : sizeX_(std::max(1, sizeX)),
      sizeY_(std::max(1, sizeY)),
      sizeZ_(std::max(1, sizeZ)),
      cells_(static_cast<size_t>(sizeX_) * sizeY_ * sizeZ_, fill)
{
    nestCount_ = fill == Block::EnumType::Nest ? static_cast<int>(cells_.size()) : 0;
    captureInitialState();
}

VoxelTerrain VoxelTerrain::generate(const TerrainConfig& config)
{
    VoxelTerrain terrain(config.sizeX, config.sizeY, config.sizeZ);
    std::mt19937 rng(config.seed);
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    const int maxSurface = std::max(1, terrain.sizeY_ - 2);
    HeightField field(terrain.sizeX_, terrain.sizeZ_, rng);

    for (int x = 0; x < terrain.sizeX_; x++) {
        for (int z = 0; z < terrain.sizeZ_; z++) {
            terrain.setBlock(x, 0, z, Block::EnumType::Container);

            const double n = field.sample(x, z) * 2.0 - 1.0;
            const int height = std::clamp(
                config.baseHeight + static_cast<int>(std::lround(n * config.heightVariation)),
                1,
                maxSurface);

            terrain.fillColumn(x, z, height - 1, Block::EnumType::Stone);
            const bool mulch = coin(rng) < config.mulchChance;
            terrain.setBlock(x, height, z, mulch ? Block::EnumType::Mulch : Block::EnumType::Grass);
        }
    }

    std::uniform_int_distribution<int> pickX(0, terrain.sizeX_ - 1);
    std::uniform_int_distribution<int> pickZ(0, terrain.sizeZ_ - 1);

    for (int i = 0; i < config.acidicRegionCount; i++) {
        const int cx = pickX(rng);
        const int cz = pickZ(rng);
        const int cy = std::clamp(config.baseHeight, 1, maxSurface);
        forEachInSphere(terrain, cx, cy, cz, config.acidicRegionRadius, [&](int x, int y, int z) {
            const auto type = terrain.getBlock(x, y, z);
            if (Block::isSolid(type) && type != Block::EnumType::Container) {
                terrain.setBlock(x, y, z, Block::EnumType::Acidic);
            }
        });
    }

    for (int i = 0; i < config.containerSphereCount; i++) {
        const int cx = pickX(rng);
        const int cz = pickZ(rng);
        const int cy = std::clamp(config.baseHeight - config.containerSphereRadius / 2, 1, maxSurface);
        forEachInSphere(terrain, cx, cy, cz, config.containerSphereRadius, [&](int x, int y, int z) {
            if (Block::isSolid(terrain.getBlock(x, y, z))) {
                terrain.setBlock(x, y, z, Block::EnumType::Container);
            }
        });
    }

    terrain.captureInitialState();

    LOG_INFO(
        Terrain,
        "Generated {}x{}x{} terrain (seed {}): {} mulch, {} acidic, {} container",
        terrain.sizeX_,
        terrain.sizeY_,
        terrain.sizeZ_,
        config.seed,
        terrain.countBlocks(Block::EnumType::Mulch),
        terrain.countBlocks(Block::EnumType::Acidic),
        terrain.countBlocks(Block::EnumType::Container));

    return terrain;
}

size_t VoxelTerrain::index(int x, int y, int z) const
{
    return (static_cast<size_t>(x) * sizeZ_ + z) * sizeY_ + y;
}

Block::EnumType VoxelTerrain::getBlock(int x, int y, int z) const
{
    if (!inBounds(x, y, z)) {
        return Block::EnumType::Air;
    }
    return cells_[index(x, y, z)];
}

void VoxelTerrain::setBlock(int x, int y, int z, Block::EnumType type)
{
    if (!inBounds(x, y, z)) {
        return;
    }

    auto& cell = cells_[index(x, y, z)];
    if (cell == Block::EnumType::Nest) {
        nestCount_--;
    }
    if (type == Block::EnumType::Nest) {
        nestCount_++;
    }
    cell = type;
}

void VoxelTerrain::resetToInitialState()
{
    cells_ = initialCells_;
    nestCount_ = initialNestCount_;
    LOG_DEBUG(Terrain, "Terrain reset to initial state");
}

void VoxelTerrain::captureInitialState()
{
    initialCells_ = cells_;
    initialNestCount_ = nestCount_;
}

void VoxelTerrain::fillColumn(int x, int z, int topY, Block::EnumType type)
{
    for (int y = 1; y <= std::min(topY, sizeY_ - 1); y++) {
        setBlock(x, y, z, type);
    }
}

int VoxelTerrain::countBlocks(Block::EnumType type) const
{
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), type));
}

} // namespace AntSim
