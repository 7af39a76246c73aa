#pragma once

#include "core/Vec2.h"
#include "world/WorldGrid.h"

namespace world
{

class GridMapper
{
  public:
    explicit GridMapper(int tileSize = 64) : m_tileSize(tileSize > 0 ? tileSize : 64) {}

    [[nodiscard]] int tileSize() const noexcept { return m_tileSize; }

    /// Tile centre in world pixels.
    Vec2 toPixel(int row, int col) const;
    Vec2 toPixel(const GridCell &cell) const { return toPixel(cell.row, cell.col); }

    GridCell toGrid(float x, float y) const;
    GridCell toGrid(const Vec2 &pos) const { return toGrid(pos.x, pos.y); }

  private:
    int m_tileSize;
};

/// Snaps an off-road cell to the nearest lattice intersection inside the border band.
/// Road cells are returned unchanged.
GridCell sanitizeSpawnCell(const WorldGrid &grid, const GridCell &cell);

/// Pixel variant of sanitizeSpawnCell. Positions already on road keep their exact pixels.
Vec2 sanitizeSpawnPosition(const WorldGrid &grid, const Vec2 &pos);

} // namespace world
