#pragma once

#include <string>

#include "world/WorldGrid.h"

namespace world
{

struct WorldGenParams
{
    int width = 50;
    int height = 50;
    int blockSize = 4;
    int tileSize = 64;
    int portalCount = 4;
};

/// Builds the city grid for a room. The draw order below is part of the wire contract:
/// every client regenerates the map locally, so reordering a loop or adding a draw desyncs them.
class WorldGenerator
{
  public:
    explicit WorldGenerator(WorldGenParams params = {});

    const WorldGenParams &params() const { return m_params; }

    WorldGrid generate(const std::string &seed) const;

  private:
    WorldGenParams m_params;
};

inline WorldGrid generateWorld(const std::string &seed, int width, int height)
{
    WorldGenParams params;
    params.width = width;
    params.height = height;
    return WorldGenerator(params).generate(seed);
}

} // namespace world
