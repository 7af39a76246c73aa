#include "app/TextRenderer.h"

#include <cstdio>
#include <utility>

#include "app/RenderUtils.h"

namespace
{

std::string cacheKey(const std::string &text, SDL_Color color)
{
    char rgba[10];
    std::snprintf(rgba, sizeof(rgba), "%02x%02x%02x%02x", color.r, color.g, color.b, color.a);
    return std::string(rgba, 8) + text;
}

} // namespace

TextRenderer::~TextRenderer()
{
    unload();
}

bool TextRenderer::load(const std::string &path, int pointSize)
{
    unload();
    m_font.reset(TTF_OpenFont(path.c_str(), pointSize));
    if (!m_font)
    {
        return false;
    }
    m_pointSize = pointSize;
    m_lineHeight = TTF_FontLineSkip(m_font.get());
    if (m_lineHeight <= 0)
    {
        m_lineHeight = TTF_FontHeight(m_font.get());
    }
    return true;
}

void TextRenderer::unload()
{
    // Textures belong to the renderer, so they go before the font and before the renderer is destroyed.
    m_cache.clear();
    m_cacheOwner = nullptr;
    m_font.reset();
    m_pointSize = 0;
    m_lineHeight = 0;
}

int TextRenderer::getLineHeight() const
{
    if (m_lineHeight > 0)
    {
        return m_lineHeight;
    }
    return m_pointSize > 0 ? m_pointSize : 0;
}

int TextRenderer::measureText(const std::string &text) const
{
    if (!isLoaded() || text.empty())
    {
        return 0;
    }
    int width = 0;
    int height = 0;
    if (TTF_SizeUTF8(m_font.get(), text.c_str(), &width, &height) != 0)
    {
        return 0;
    }
    return width;
}

void TextRenderer::drawText(SDL_Renderer *renderer, const std::string &text, int x, int y, RenderStats *stats,
                            SDL_Color color) const
{
    if (!renderer || !isLoaded() || text.empty())
    {
        return;
    }
    const CachedLine *line = lookup(renderer, text, color);
    if (!line)
    {
        return;
    }
    const SDL_Rect dest{x, y, line->width, line->height};
    if (stats)
    {
        countedRenderCopy(renderer, line->texture.get(), nullptr, &dest, *stats);
    }
    else
    {
        SDL_RenderCopy(renderer, line->texture.get(), nullptr, &dest);
    }
}

void TextRenderer::endFrame() const
{
    for (auto it = m_cache.begin(); it != m_cache.end();)
    {
        if (!it->second.drawnThisFrame)
        {
            it = m_cache.erase(it);
            continue;
        }
        it->second.drawnThisFrame = false;
        ++it;
    }
}

const TextRenderer::CachedLine *TextRenderer::lookup(SDL_Renderer *renderer, const std::string &text,
                                                     SDL_Color color) const
{
    if (renderer != m_cacheOwner)
    {
        m_cache.clear();
        m_cacheOwner = renderer;
    }

    const std::string key = cacheKey(text, color);
    const auto found = m_cache.find(key);
    if (found != m_cache.end())
    {
        found->second.drawnThisFrame = true;
        return &found->second;
    }

    SDL_Surface *surface = TTF_RenderUTF8_Blended(m_font.get(), text.c_str(), color);
    if (!surface)
    {
        return nullptr;
    }
    CachedLine line;
    line.texture.reset(SDL_CreateTextureFromSurface(renderer, surface));
    line.width = surface->w;
    line.height = surface->h;
    line.drawnThisFrame = true;
    SDL_FreeSurface(surface);
    if (!line.texture)
    {
        return nullptr;
    }
    return &m_cache.emplace(key, std::move(line)).first->second;
}
