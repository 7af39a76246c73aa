#include "app/HudView.h"

#include "app/FramePerf.h"
#include "app/RenderUtils.h"
#include "app/TextRenderer.h"

#include <SDL.h>

#include <cmath>
#include <iomanip>
#include <sstream>

HudView::HudView(const Dependencies &dependencies) : m_dependencies(dependencies) {}

void HudView::setDependencies(const Dependencies &dependencies)
{
    m_dependencies = dependencies;
}

void HudView::render(const DrawContext &context) const
{
    SDL_Renderer *renderer = m_dependencies.renderer;
    const TextRenderer *font = m_dependencies.hudFont;
    if (!renderer || !font || !font->isLoaded() || !context.model || !context.renderStats)
    {
        return;
    }

    const HudModel &model = *context.model;
    RenderStats &stats = *context.renderStats;
    const int lineHeight = font->getLineHeight();
    const int width = m_dependencies.screenWidth;
    const int height = m_dependencies.screenHeight;

    int cursorY = 12;
    font->drawText(renderer, model.phaseLine, 16, cursorY, &stats, SDL_Color{255, 255, 255, 255});
    cursorY += lineHeight + 2;
    font->drawText(renderer, model.roleLine, 16, cursorY, &stats, SDL_Color{255, 220, 120, 255});
    cursorY += lineHeight + 2;
    font->drawText(renderer, model.inventoryLine, 16, cursorY, &stats, SDL_Color{180, 220, 255, 255});
    if (!model.staminaLine.empty())
    {
        cursorY += lineHeight + 2;
        font->drawText(renderer, model.staminaLine, 16, cursorY, &stats, SDL_Color{160, 255, 160, 255});
    }

    int scoreY = 12;
    for (const std::string &line : model.scoreLines)
    {
        const int lineWidth = font->measureText(line);
        font->drawText(renderer, line, width - lineWidth - 16, scoreY, &stats, SDL_Color{230, 230, 230, 255});
        scoreY += lineHeight + 2;
    }

    if (!model.announcement.empty())
    {
        const int textWidth = font->measureText(model.announcement);
        font->drawText(renderer, model.announcement, (width - textWidth) / 2, height / 4, &stats,
                       SDL_Color{255, 240, 80, 255});
    }

    if (!model.banner.empty())
    {
        const int textWidth = font->measureText(model.banner);
        const SDL_FRect backdrop{static_cast<float>((width - textWidth) / 2 - 12), static_cast<float>(height / 2 - 8),
                                 static_cast<float>(textWidth + 24), static_cast<float>(lineHeight + 16)};
        SDL_SetRenderDrawColor(renderer, 20, 20, 30, 200);
        countedRenderFillRectF(renderer, &backdrop, stats);
        font->drawText(renderer, model.banner, (width - textWidth) / 2, height / 2, &stats,
                       SDL_Color{255, 120, 120, 255});
    }

    if (!model.quizLines.empty())
    {
        int quizY = height - static_cast<int>(model.quizLines.size()) * (lineHeight + 4) - 16;
        for (const std::string &line : model.quizLines)
        {
            font->drawText(renderer, line, 32, quizY, &stats, SDL_Color{255, 255, 255, 255});
            quizY += lineHeight + 4;
        }
    }

    if (!model.toast.empty())
    {
        const int textWidth = font->measureText(model.toast);
        font->drawText(renderer, model.toast, (width - textWidth) / 2, height / 4 + lineHeight + 8, &stats,
                       SDL_Color{200, 255, 200, 255});
    }

    if (!model.warning.empty())
    {
        font->drawText(renderer, model.warning, 16, height - lineHeight - 12, &stats, SDL_Color{255, 160, 60, 255});
    }

    if (context.showDebugHud && context.framePerf)
    {
        renderDebugPanel(*context.framePerf, stats, 16, cursorY + (lineHeight + 2) * 2, lineHeight);
    }
}

void HudView::renderDebugPanel(const FramePerf &perf, RenderStats &stats, int x, int y, int lineHeight) const
{
    SDL_Renderer *renderer = m_dependencies.renderer;
    const TextRenderer &font = *m_dependencies.hudFont;
    const int step = lineHeight + 2;

    const std::string timing = "FPS " + std::to_string(static_cast<int>(std::round(perf.fps))) + "  Pump " +
                               formatMilliseconds(perf.msPump) + "ms  Sim " + formatMilliseconds(perf.msSimulate) +
                               "ms  Render " + formatMilliseconds(perf.msRender) + "ms";
    font.drawText(renderer, timing, x, y, &stats, SDL_Color{180, 200, 255, 255});

    const std::string world = "Remotes " + std::to_string(perf.remotes) + "  Items " +
                              std::to_string(perf.collectibles) + "  Draws " + std::to_string(perf.drawCalls);
    font.drawText(renderer, world, x, y + step, &stats, SDL_Color{160, 180, 230, 255});

    const std::string session = "Link " + perf.connection + "  Timers " + std::to_string(perf.pendingTimers) +
                                "  Lost " + std::to_string(perf.lostEvents);
    font.drawText(renderer, session, x, y + step * 2, &stats, SDL_Color{160, 200, 200, 255});

    if (perf.budgetExceeded)
    {
        font.drawText(renderer, "Over budget: " + perf.budgetStage, x, y + step * 3, &stats,
                      SDL_Color{255, 140, 90, 255});
    }
}

std::string HudView::formatMilliseconds(double ms, int precision)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << ms;
    return oss.str();
}
