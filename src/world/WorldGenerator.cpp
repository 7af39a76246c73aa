#include "world/WorldGenerator.h"

#include <algorithm>
#include <cmath>

#include "world/SeededRandom.h"

namespace world
{

namespace
{

constexpr double kWaterClusterChance = 0.05;
constexpr double kParkChance = 0.15;
constexpr double kShopThreshold = 0.9;
constexpr double kCafeThreshold = 0.8;
constexpr double kTreeThreshold = 0.3;

void layLatticeAndClusters(WorldGrid &grid, SeededRandom &rng)
{
    const int blockSize = grid.blockSize();
    for (int row = 0; row < grid.height(); ++row)
    {
        for (int col = 0; col < grid.width(); ++col)
        {
            if (row % blockSize == 0 || col % blockSize == 0)
            {
                grid.setTile(row, col, TileKind::Road);
                continue;
            }

            const double roll = rng.random();
            if (roll < kWaterClusterChance)
            {
                for (int r = row - 1; r <= row + 1; ++r)
                {
                    for (int c = col - 1; c <= col + 1; ++c)
                    {
                        if (grid.inBounds(r, c) && grid.tile(r, c) != TileKind::Road)
                        {
                            grid.setTile(r, c, TileKind::Water);
                        }
                    }
                }
            }
            else if (roll < kParkChance)
            {
                grid.setTile(row, col, TileKind::Park);
            }
        }
    }
}

void decorate(WorldGrid &grid, SeededRandom &rng)
{
    const float tile = static_cast<float>(grid.tileSize());
    for (int row = 0; row < grid.height(); ++row)
    {
        for (int col = 0; col < grid.width(); ++col)
        {
            if (row == 0 || col == 0 || row == grid.height() - 1 || col == grid.width() - 1)
            {
                grid.setTile(row, col, TileKind::Lava);
                continue;
            }

            const TileKind kind = grid.tile(row, col);
            if (kind == TileKind::Building)
            {
                Building building;
                building.cell = {row, col};
                const double variant = rng.random();
                building.height = static_cast<float>(40.0 + rng.random() * 60.0);
                if (variant > kShopThreshold)
                {
                    building.kind = BuildingKind::Shop;
                    building.height = static_cast<float>(30.0 + rng.random() * 20.0);
                }
                else if (variant > kCafeThreshold)
                {
                    building.kind = BuildingKind::Cafe;
                    building.height = static_cast<float>(25.0 + rng.random() * 15.0);
                }
                grid.buildings().push_back(building);
            }
            else if (kind == TileKind::Park)
            {
                if (rng.random() > kTreeThreshold)
                {
                    Tree tree;
                    tree.pos.x = static_cast<float>(col * tile + tile / 2.0f + (rng.random() * 20.0 - 10.0));
                    tree.pos.y = static_cast<float>(row * tile + tile / 2.0f + (rng.random() * 20.0 - 10.0));
                    tree.radius = static_cast<float>(10.0 + rng.random() * 10.0);
                    grid.trees().push_back(tree);
                }
            }
        }
    }
}

void placePortals(WorldGrid &grid, SeededRandom &rng, int portalCount)
{
    // Needs at least one interior road cell or the retry loop never ends.
    bool anyRoad = false;
    for (int row = 1; row < grid.height() - 1 && !anyRoad; ++row)
    {
        for (int col = 1; col < grid.width() - 1; ++col)
        {
            if (grid.isRoad(row, col))
            {
                anyRoad = true;
                break;
            }
        }
    }
    if (!anyRoad)
    {
        return;
    }

    int placed = 0;
    while (placed < portalCount)
    {
        const int col = static_cast<int>(std::floor(rng.random() * (grid.width() - 2))) + 1;
        const int row = static_cast<int>(std::floor(rng.random() * (grid.height() - 2))) + 1;
        if (grid.isRoad(row, col))
        {
            PortalAnchor anchor;
            anchor.cell = {row, col};
            anchor.hue = placed * 90;
            grid.portals().push_back(anchor);
            ++placed;
        }
    }
}

} // namespace

WorldGenerator::WorldGenerator(WorldGenParams params) : m_params(params)
{
    m_params.width = std::max(3, m_params.width);
    m_params.height = std::max(3, m_params.height);
    m_params.blockSize = std::max(1, m_params.blockSize);
    m_params.tileSize = std::max(1, m_params.tileSize);
    m_params.portalCount = std::max(0, m_params.portalCount);
}

WorldGrid WorldGenerator::generate(const std::string &seed) const
{
    WorldGrid grid(m_params.width, m_params.height, m_params.tileSize, m_params.blockSize);
    SeededRandom rng(seed);
    layLatticeAndClusters(grid, rng);
    decorate(grid, rng);
    placePortals(grid, rng, m_params.portalCount);
    return grid;
}

} // namespace world
