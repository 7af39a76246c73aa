#include "world/WorldGrid.h"

#include <algorithm>

namespace world
{

const char *tileKindToString(TileKind kind)
{
    switch (kind)
    {
    case TileKind::Road:
        return "road";
    case TileKind::Building:
        return "building";
    case TileKind::Park:
        return "park";
    case TileKind::Water:
        return "water";
    case TileKind::Lava:
        return "lava";
    }
    return "road";
}

WorldGrid::WorldGrid(int width, int height, int tileSize, int blockSize)
    : m_width(std::max(0, width)),
      m_height(std::max(0, height)),
      m_tileSize(std::max(1, tileSize)),
      m_blockSize(std::max(1, blockSize)),
      m_tiles(static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height),
              static_cast<std::uint8_t>(TileKind::Building))
{
}

bool WorldGrid::inBounds(int row, int col) const
{
    return row >= 0 && row < m_height && col >= 0 && col < m_width;
}

TileKind WorldGrid::tile(int row, int col) const
{
    if (!inBounds(row, col))
    {
        return TileKind::Lava;
    }
    return static_cast<TileKind>(m_tiles[indexOf(row, col)]);
}

void WorldGrid::setTile(int row, int col, TileKind kind)
{
    if (inBounds(row, col))
    {
        m_tiles[indexOf(row, col)] = static_cast<std::uint8_t>(kind);
    }
}

bool WorldGrid::isRoad(int row, int col) const
{
    return inBounds(row, col) && tile(row, col) == TileKind::Road;
}

bool WorldGrid::isSolid(int row, int col, MoverKind mover) const
{
    if (!inBounds(row, col))
    {
        return false;
    }
    switch (tile(row, col))
    {
    case TileKind::Building:
    case TileKind::Water:
        return true;
    case TileKind::Lava:
        return mover != MoverKind::Local;
    case TileKind::Road:
    case TileKind::Park:
        return false;
    }
    return false;
}

std::size_t WorldGrid::countTiles(TileKind kind) const
{
    const auto code = static_cast<std::uint8_t>(kind);
    return static_cast<std::size_t>(std::count(m_tiles.begin(), m_tiles.end(), code));
}

std::size_t WorldGrid::indexOf(int row, int col) const
{
    return static_cast<std::size_t>(row) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(col);
}

} // namespace world
