#include "world/GridMapper.h"
#include "world/WorldGenerator.h"

#include <cmath>
#include <iostream>

namespace
{

bool assertTrue(bool condition, const char *message)
{
    if (!condition)
    {
        std::cerr << message << '\n';
        return false;
    }
    return true;
}

bool near(const Vec2 &lhs, const Vec2 &rhs, float epsilon = 1e-3f)
{
    return std::fabs(lhs.x - rhs.x) <= epsilon && std::fabs(lhs.y - rhs.y) <= epsilon;
}

bool testPixelMapping()
{
    const world::GridMapper mapper(64);
    bool success = true;
    success &= assertTrue(near(mapper.toPixel(0, 0), Vec2{32.0f, 32.0f}), "Cell (0,0) centre should be (32,32)");
    success &= assertTrue(near(mapper.toPixel(2, 5), Vec2{352.0f, 160.0f}), "Pixel x follows col, y follows row");
    success &= assertTrue(mapper.toGrid(352.0f, 160.0f) == world::GridCell{2, 5}, "toGrid should invert toPixel");
    success &= assertTrue(mapper.toGrid(63.9f, 64.0f) == world::GridCell{1, 0}, "toGrid floors per axis");
    success &= assertTrue(mapper.toGrid(-1.0f, -1.0f) == world::GridCell{-1, -1}, "Negative pixels floor downward");

    const world::GridMapper fallback(0);
    success &= assertTrue(fallback.tileSize() == 64, "Non-positive tile size falls back to 64");
    return success;
}

bool testSanitizeCell()
{
    const world::WorldGrid grid = world::WorldGenerator().generate("ABC123");
    bool success = true;
    success &= assertTrue(world::sanitizeSpawnCell(grid, {4, 7}) == world::GridCell{4, 7}, "Road cell is kept");
    success &= assertTrue(world::sanitizeSpawnCell(grid, {1, 1}) == world::GridCell{4, 4},
                          "Cell near the border snaps into the band");
    success &= assertTrue(world::sanitizeSpawnCell(grid, {0, 0}) == world::GridCell{4, 4}, "Lava corner snaps inward");
    success &= assertTrue(world::sanitizeSpawnCell(grid, {10, 10}) == world::GridCell{12, 12},
                          "Interior cell rounds to the nearest intersection");
    success &= assertTrue(world::sanitizeSpawnCell(grid, {47, 47}) == world::GridCell{44, 44},
                          "Far corner clamps below the upper band");
    success &= assertTrue(world::sanitizeSpawnCell(grid, {-6, 80}) == world::GridCell{4, 44},
                          "Out-of-bounds cell clamps to the band");
    return success;
}

bool testSanitizePosition()
{
    const world::WorldGrid grid = world::WorldGenerator().generate("ABC123");
    bool success = true;
    const Vec2 onRoad{266.0f, 453.0f};
    success &= assertTrue(near(world::sanitizeSpawnPosition(grid, onRoad), onRoad),
                          "Position on road keeps exact pixels");
    success &= assertTrue(near(world::sanitizeSpawnPosition(grid, Vec2{96.5f, 96.5f}), Vec2{288.0f, 288.0f}),
                          "Off-road position moves to the intersection centre");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testPixelMapping();
    success &= testSanitizeCell();
    success &= testSanitizePosition();
    return success ? 0 : 1;
}
