#include "world/GridMapper.h"

#include <algorithm>
#include <cmath>

namespace world
{

namespace
{

int snapAxis(int value, int blockSize, int dimension)
{
    const int lower = blockSize;
    const int upper = std::max(lower, dimension - 1 - blockSize);
    int snapped = static_cast<int>(std::lround(static_cast<double>(value) / blockSize)) * blockSize;
    snapped = std::clamp(snapped, lower, upper);
    snapped -= snapped % blockSize;
    return snapped;
}

} // namespace

Vec2 GridMapper::toPixel(int row, int col) const
{
    const float half = static_cast<float>(m_tileSize) / 2.0f;
    return {static_cast<float>(col * m_tileSize) + half, static_cast<float>(row * m_tileSize) + half};
}

GridCell GridMapper::toGrid(float x, float y) const
{
    const float size = static_cast<float>(m_tileSize);
    return {static_cast<int>(std::floor(y / size)), static_cast<int>(std::floor(x / size))};
}

GridCell sanitizeSpawnCell(const WorldGrid &grid, const GridCell &cell)
{
    if (grid.isRoad(cell.row, cell.col))
    {
        return cell;
    }
    const int blockSize = grid.blockSize();
    return {snapAxis(cell.row, blockSize, grid.height()), snapAxis(cell.col, blockSize, grid.width())};
}

Vec2 sanitizeSpawnPosition(const WorldGrid &grid, const Vec2 &pos)
{
    const GridMapper mapper(grid.tileSize());
    const GridCell cell = mapper.toGrid(pos);
    const GridCell sanitized = sanitizeSpawnCell(grid, cell);
    if (sanitized == cell)
    {
        return pos;
    }
    return mapper.toPixel(sanitized);
}

} // namespace world
