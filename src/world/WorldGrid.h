#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/Vec2.h"

namespace world
{

enum class TileKind : std::uint8_t
{
    Road = 0,
    Building = 1,
    Park = 2,
    Water = 3,
    Lava = 4
};

const char *tileKindToString(TileKind kind);

enum class BuildingKind : std::uint8_t
{
    Residential = 0,
    Shop = 1,
    Cafe = 2
};

struct GridCell
{
    int row = 0;
    int col = 0;
};

inline bool operator==(const GridCell &lhs, const GridCell &rhs)
{
    return lhs.row == rhs.row && lhs.col == rhs.col;
}

inline bool operator!=(const GridCell &lhs, const GridCell &rhs)
{
    return !(lhs == rhs);
}

struct Building
{
    GridCell cell;
    BuildingKind kind = BuildingKind::Residential;
    float height = 0.0f;
};

struct Tree
{
    Vec2 pos;
    float radius = 0.0f;
};

struct PortalAnchor
{
    GridCell cell;
    int hue = 0;
};

/// Who is asking whether a tile blocks movement. Lava only stops the local mover when configured as a wall.
enum class MoverKind : std::uint8_t
{
    Local,
    LocalHazardSolid,
    Remote
};

class WorldGrid
{
  public:
    WorldGrid() = default;
    WorldGrid(int width, int height, int tileSize, int blockSize);

    [[nodiscard]] int width() const noexcept { return m_width; }
    [[nodiscard]] int height() const noexcept { return m_height; }
    [[nodiscard]] int tileSize() const noexcept { return m_tileSize; }
    [[nodiscard]] int blockSize() const noexcept { return m_blockSize; }
    [[nodiscard]] bool empty() const noexcept { return m_tiles.empty(); }

    bool inBounds(int row, int col) const;
    TileKind tile(int row, int col) const;
    void setTile(int row, int col, TileKind kind);

    bool isRoad(int row, int col) const;
    bool isSolid(int row, int col, MoverKind mover) const;

    /// Row-major tile codes; identical seeds give byte-identical vectors.
    const std::vector<std::uint8_t> &tiles() const { return m_tiles; }

    std::vector<Building> &buildings() { return m_buildings; }
    const std::vector<Building> &buildings() const { return m_buildings; }
    std::vector<Tree> &trees() { return m_trees; }
    const std::vector<Tree> &trees() const { return m_trees; }
    std::vector<PortalAnchor> &portals() { return m_portals; }
    const std::vector<PortalAnchor> &portals() const { return m_portals; }

    std::size_t countTiles(TileKind kind) const;

  private:
    std::size_t indexOf(int row, int col) const;

    int m_width = 0;
    int m_height = 0;
    int m_tileSize = 64;
    int m_blockSize = 4;
    std::vector<std::uint8_t> m_tiles;
    std::vector<Building> m_buildings;
    std::vector<Tree> m_trees;
    std::vector<PortalAnchor> m_portals;
};

} // namespace world
