#pragma once

#include <SDL.h>
#include <SDL_ttf.h>

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

struct RenderStats;

/// HUD text through SDL_ttf. Rendering without a loaded font is a no-op.
/// Rendered lines are cached as textures; a line not drawn during a frame is released by endFrame().
class TextRenderer
{
  public:
    TextRenderer() = default;
    ~TextRenderer();

    TextRenderer(const TextRenderer &) = delete;
    TextRenderer &operator=(const TextRenderer &) = delete;

    bool load(const std::string &path, int pointSize);
    void unload();

    bool isLoaded() const { return static_cast<bool>(m_font); }
    int getLineHeight() const;
    int measureText(const std::string &text) const;

    void drawText(SDL_Renderer *renderer, const std::string &text, int x, int y, RenderStats *stats,
                  SDL_Color color = SDL_Color{255, 255, 255, 255}) const;

    void endFrame() const;
    std::size_t cachedLines() const { return m_cache.size(); }

  private:
    struct FontDeleter
    {
        void operator()(TTF_Font *font) const { TTF_CloseFont(font); }
    };

    struct TextureDeleter
    {
        void operator()(SDL_Texture *texture) const { SDL_DestroyTexture(texture); }
    };

    struct CachedLine
    {
        std::unique_ptr<SDL_Texture, TextureDeleter> texture;
        int width = 0;
        int height = 0;
        bool drawnThisFrame = false;
    };

    const CachedLine *lookup(SDL_Renderer *renderer, const std::string &text, SDL_Color color) const;

    std::unique_ptr<TTF_Font, FontDeleter> m_font;
    int m_pointSize = 0;
    int m_lineHeight = 0;
    mutable SDL_Renderer *m_cacheOwner = nullptr;
    mutable std::unordered_map<std::string, CachedLine> m_cache;
};
