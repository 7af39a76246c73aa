#pragma once

#include "app/HudPresenter.h"

struct SDL_Renderer;

class TextRenderer;
struct FramePerf;
struct RenderStats;

class HudView
{
  public:
    struct Dependencies
    {
        SDL_Renderer *renderer = nullptr;
        const TextRenderer *hudFont = nullptr;
        int screenWidth = 0;
        int screenHeight = 0;
    };

    struct DrawContext
    {
        const HudModel *model = nullptr;
        const FramePerf *framePerf = nullptr;
        RenderStats *renderStats = nullptr;
        bool showDebugHud = false;
    };

    HudView() = default;
    explicit HudView(const Dependencies &dependencies);

    void setDependencies(const Dependencies &dependencies);
    const Dependencies &dependencies() const noexcept { return m_dependencies; }

    void render(const DrawContext &context) const;

  private:
    void renderDebugPanel(const FramePerf &perf, RenderStats &stats, int x, int y, int lineHeight) const;
    static std::string formatMilliseconds(double ms, int precision = 2);

    Dependencies m_dependencies{};
};
