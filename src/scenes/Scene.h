#pragma once

#include <SDL.h>

class GameApplication;
class SceneStack;

/// One screen of the debug client. Only the top scene sees input and updates; all scenes render, bottom first.
class Scene
{
  public:
    virtual ~Scene() = default;

    /// Stable name for telemetry.
    virtual const char *name() const = 0;

    virtual void onEnter(GameApplication &, SceneStack &) {}
    virtual void onExit(GameApplication &, SceneStack &) {}
    virtual void handleEvent(const SDL_Event &event, GameApplication &app, SceneStack &stack) = 0;
    virtual void update(double deltaSeconds, GameApplication &app, SceneStack &stack) = 0;
    virtual void render(SDL_Renderer *renderer, GameApplication &app) = 0;
};
