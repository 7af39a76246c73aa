#include "scenes/LobbyScene.h"

#include <cstdio>
#include <memory>
#include <utility>

#include "app/GameApplication.h"
#include "app/RenderUtils.h"
#include "app/TextRenderer.h"
#include "persist/ClientStore.h"
#include "scenes/MatchScene.h"
#include "scenes/SceneStack.h"
#include "services/ServiceLocator.h"

LobbyScene::LobbyScene(std::string reason) : m_reason(std::move(reason)) {}

std::string LobbyScene::describeReason(const std::string &reason)
{
    if (reason == "room_closed")
    {
        return "The room closed after the game.";
    }
    if (reason == "join_failed")
    {
        return "Could not join the room.";
    }
    if (reason.empty())
    {
        return "Left the room.";
    }
    return "Left the room (" + reason + ").";
}

void LobbyScene::onEnter(GameApplication &app, SceneStack &)
{
    const LaunchOptions &options = app.launchOptions();
    m_prompt = "Enter: join " + options.roomCode + " as " + options.playerName + "   Esc: quit";
    m_leaderboardLines.clear();

    ServiceLocator &services = ServiceLocator::instance();
    if (const ClientStore *store = services.clientStore())
    {
        int rank = 1;
        for (const LeaderboardEntry &entry : store->data().leaderboard)
        {
            char seconds[32];
            std::snprintf(seconds, sizeof(seconds), "%.1fs", entry.timeSurvived);
            m_leaderboardLines.push_back(std::to_string(rank++) + ". " + entry.name + "  " + seconds + "  " +
                                         entry.date);
        }
    }
    recordTelemetry(services.telemetrySink(), "lobby.shown",
                    {{"reason", m_reason}, {"entries", std::to_string(m_leaderboardLines.size())}});
}

void LobbyScene::handleEvent(const SDL_Event &event, GameApplication &, SceneStack &)
{
    if (event.type != SDL_KEYDOWN || event.key.repeat != 0)
    {
        return;
    }
    const SDL_Scancode code = event.key.keysym.scancode;
    if (code == SDL_SCANCODE_RETURN || code == SDL_SCANCODE_KP_ENTER)
    {
        m_joinRequested = true;
    }
}

void LobbyScene::update(double deltaSeconds, GameApplication &app, SceneStack &stack)
{
    m_clockMs += deltaSeconds * 1000.0;
    app.inputMapper().sampleFrame(false, m_clockMs, ++m_frameSequence, m_actions);

    if (m_actions.pressedThisFrame(ActionId::Quit))
    {
        stack.pop();
        app.requestQuit();
        return;
    }
    if (m_joinRequested)
    {
        m_joinRequested = false;
        stack.replace(std::make_unique<MatchScene>());
    }
}

void LobbyScene::render(SDL_Renderer *renderer, GameApplication &app)
{
    if (!renderer)
    {
        return;
    }
    RenderStats stats;
    SDL_SetRenderDrawColor(renderer, 18, 18, 28, 255);
    countedRenderClear(renderer, stats);

    const TextRenderer &font = app.hudText();
    const int lineHeight = font.getLineHeight() + 4;
    int y = app.windowHeight() / 6;
    const int x = 64;

    font.drawText(renderer, "Qbit City", x, y, &stats, SDL_Color{255, 220, 120, 255});
    y += lineHeight * 2;
    font.drawText(renderer, describeReason(m_reason), x, y, &stats, SDL_Color{230, 230, 230, 255});
    y += lineHeight * 2;

    font.drawText(renderer, "Best runs", x, y, &stats, SDL_Color{180, 220, 255, 255});
    y += lineHeight;
    if (m_leaderboardLines.empty())
    {
        font.drawText(renderer, "No games recorded yet.", x, y, &stats, SDL_Color{160, 160, 160, 255});
        y += lineHeight;
    }
    for (const std::string &line : m_leaderboardLines)
    {
        font.drawText(renderer, line, x, y, &stats, SDL_Color{230, 230, 230, 255});
        y += lineHeight;
    }

    font.drawText(renderer, m_prompt, x, app.windowHeight() - lineHeight * 2, &stats,
                  SDL_Color{160, 255, 160, 255});
}
