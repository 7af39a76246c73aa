#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "input/ActionBuffer.h"
#include "scenes/Scene.h"

/// Shown after a match routes back to the lobby. Lists the local leaderboard and offers to join again.
class LobbyScene : public Scene
{
  public:
    explicit LobbyScene(std::string reason);

    const char *name() const override { return "LobbyScene"; }

    void onEnter(GameApplication &app, SceneStack &stack) override;
    void handleEvent(const SDL_Event &event, GameApplication &app, SceneStack &stack) override;
    void update(double deltaSeconds, GameApplication &app, SceneStack &stack) override;
    void render(SDL_Renderer *renderer, GameApplication &app) override;

    static std::string describeReason(const std::string &reason);

  private:
    std::string m_reason;
    std::vector<std::string> m_leaderboardLines;
    std::string m_prompt;
    ActionBuffer m_actions;
    double m_clockMs = 0.0;
    std::uint64_t m_frameSequence = 0;
    bool m_joinRequested = false;
};
