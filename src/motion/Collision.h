#pragma once

#include "core/Vec2.h"
#include "world/WorldGrid.h"

/// True when an axis-aligned square of side boxSize centred on centre overlaps a tile that blocks mover.
/// Only the 3x3 tiles around the centre cell are tested; the box must be smaller than one tile.
bool boxHitsSolid(const world::WorldGrid &grid, const Vec2 &centre, float boxSize, world::MoverKind mover);
