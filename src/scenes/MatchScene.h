#pragma once

#include <cstdint>
#include <memory>

#include "app/FramePerf.h"
#include "app/HudPresenter.h"
#include "app/HudView.h"
#include "app/RenderUtils.h"
#include "input/ActionBuffer.h"
#include "net/ReplayChannel.h"
#include "scenes/Scene.h"
#include "session/MatchSession.h"
#include "telemetry/PerformanceBudgetMonitor.h"

/// Plays one match against the replay channel and draws it.
class MatchScene : public Scene
{
  public:
    /// With resume set, rejoins the room stored by an earlier run instead of joining the launch room.
    explicit MatchScene(bool resume = false);
    ~MatchScene() override;

    const char *name() const override { return "MatchScene"; }

    void onEnter(GameApplication &app, SceneStack &stack) override;
    void onExit(GameApplication &app, SceneStack &stack) override;
    void handleEvent(const SDL_Event &event, GameApplication &app, SceneStack &stack) override;
    void update(double deltaSeconds, GameApplication &app, SceneStack &stack) override;
    void render(SDL_Renderer *renderer, GameApplication &app) override;

  private:
    void answer(int optionIndex);
    void collectFramePerf(double deltaSeconds);
    void renderWorld(SDL_Renderer *renderer, const Camera &camera, RenderStats &stats) const;
    void renderCollectibles(SDL_Renderer *renderer, const Camera &camera, RenderStats &stats) const;
    void renderEntities(SDL_Renderer *renderer, const Camera &camera, RenderStats &stats) const;
    void renderCues(SDL_Renderer *renderer, const Camera &camera, RenderStats &stats) const;
    void renderFlash(SDL_Renderer *renderer, int width, int height, RenderStats &stats) const;

    std::shared_ptr<TelemetrySink> m_telemetry;
    std::unique_ptr<net::ReplayChannel> m_channel;
    std::unique_ptr<MatchSession> m_session;
    std::unique_ptr<HudPresenter> m_presenter;
    telemetry::PerformanceBudgetMonitor m_perfMonitor;
    HudView m_hudView;
    ActionBuffer m_actions;
    MatchFrame m_frame;
    FramePerf m_framePerf;
    float m_collectibleHalfExtent = 8.0f;
    float m_entityHalfExtent = 12.0f;
    double m_frequency = 1.0;
    double m_clockMs = 0.0;
    std::uint64_t m_frameSequence = 0;
    int m_penaltyQuestion = 0;
    bool m_resume = false;
    bool m_showDebugHud = false;
};
