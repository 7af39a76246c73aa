#include "motion/Collision.h"

#include <cmath>

bool boxHitsSolid(const world::WorldGrid &grid, const Vec2 &centre, float boxSize, world::MoverKind mover)
{
    const float tile = static_cast<float>(grid.tileSize());
    const float half = boxSize * 0.5f;
    const float left = centre.x - half;
    const float right = centre.x + half;
    const float top = centre.y - half;
    const float bottom = centre.y + half;

    const int row = static_cast<int>(std::floor(centre.y / tile));
    const int col = static_cast<int>(std::floor(centre.x / tile));
    for (int r = row - 1; r <= row + 1; ++r)
    {
        for (int c = col - 1; c <= col + 1; ++c)
        {
            if (!grid.isSolid(r, c, mover))
            {
                continue;
            }
            const float tileLeft = static_cast<float>(c) * tile;
            const float tileTop = static_cast<float>(r) * tile;
            if (left < tileLeft + tile && right > tileLeft && top < tileTop + tile && bottom > tileTop)
            {
                return true;
            }
        }
    }
    return false;
}
