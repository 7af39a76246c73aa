#pragma once

#include <SDL.h>

#include <cmath>
#include <cstdint>

#include "core/Vec2.h"

struct RenderStats
{
    int drawCalls = 0;
};

/// World-to-screen offset that keeps the followed point at the centre of the window.
struct Camera
{
    Vec2 position;
    int screenWidth = 0;
    int screenHeight = 0;

    Vec2 toScreen(const Vec2 &world) const
    {
        return {world.x - position.x + screenWidth * 0.5f, world.y - position.y + screenHeight * 0.5f};
    }
};

inline void setDrawColor(SDL_Renderer *renderer, std::uint32_t rgb, Uint8 alpha = 255)
{
    SDL_SetRenderDrawColor(renderer, static_cast<Uint8>((rgb >> 16) & 0xff), static_cast<Uint8>((rgb >> 8) & 0xff),
                           static_cast<Uint8>(rgb & 0xff), alpha);
}

/// Fully saturated colour for a hue in degrees.
inline std::uint32_t hueToRgb(int hue)
{
    const float h = static_cast<float>(((hue % 360) + 360) % 360) / 60.0f;
    const float x = 1.0f - std::fabs(std::fmod(h, 2.0f) - 1.0f);
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    switch (static_cast<int>(h))
    {
    case 0:
        r = 1.0f;
        g = x;
        break;
    case 1:
        r = x;
        g = 1.0f;
        break;
    case 2:
        g = 1.0f;
        b = x;
        break;
    case 3:
        g = x;
        b = 1.0f;
        break;
    case 4:
        r = x;
        b = 1.0f;
        break;
    default:
        r = 1.0f;
        b = x;
        break;
    }
    auto channel = [](float v) { return static_cast<std::uint32_t>(std::lround(v * 255.0f)); };
    return (channel(r) << 16) | (channel(g) << 8) | channel(b);
}

inline void countedRenderClear(SDL_Renderer *renderer, RenderStats &stats)
{
    ++stats.drawCalls;
    SDL_RenderClear(renderer);
}

inline void countedRenderCopy(SDL_Renderer *renderer, SDL_Texture *texture, const SDL_Rect *src, const SDL_Rect *dst,
                              RenderStats &stats)
{
    ++stats.drawCalls;
    SDL_RenderCopy(renderer, texture, src, dst);
}

inline void countedRenderFillRectF(SDL_Renderer *renderer, const SDL_FRect *rect, RenderStats &stats)
{
    ++stats.drawCalls;
    SDL_RenderFillRectF(renderer, rect);
}

inline void countedRenderDrawRectF(SDL_Renderer *renderer, const SDL_FRect *rect, RenderStats &stats)
{
    ++stats.drawCalls;
    SDL_RenderDrawRectF(renderer, rect);
}

/// Square of the given half extent centred on pos.
inline void fillCentredSquare(SDL_Renderer *renderer, const Vec2 &pos, float halfExtent, RenderStats &stats)
{
    const SDL_FRect rect{pos.x - halfExtent, pos.y - halfExtent, halfExtent * 2.0f, halfExtent * 2.0f};
    countedRenderFillRectF(renderer, &rect, stats);
}
