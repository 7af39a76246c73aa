#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <SDL.h>

class GameApplication;
class Scene;

/// Lobby and match screens. Push, pop and replace are queued and applied between passes, once the
/// renderer exists, so a scene can swap itself out from inside its own update.
class SceneStack
{
  public:
    explicit SceneStack(GameApplication &app);
    ~SceneStack();

    void push(std::unique_ptr<Scene> scene);
    void pop();
    /// Exits the top scene and enters the given one in the same transition.
    void replace(std::unique_ptr<Scene> scene);
    /// Exits every scene top first and drops queued requests.
    void clear();

    void handleEvent(const SDL_Event &event);
    void update(double deltaSeconds);
    void render(SDL_Renderer *renderer);

    /// True when no scene is active and none is waiting to enter.
    bool empty() const;
    std::size_t size() const { return m_scenes.size(); }
    Scene *top() const;

    void onRendererReady();

  private:
    enum class RequestKind
    {
        Push,
        Pop,
        Replace
    };

    struct Request
    {
        RequestKind kind = RequestKind::Push;
        std::unique_ptr<Scene> scene;
    };

    void request(RequestKind kind, std::unique_ptr<Scene> scene);
    void applyRequests();
    void enter(std::unique_ptr<Scene> scene);
    void exitTop();

    GameApplication &m_app;
    std::vector<std::unique_ptr<Scene>> m_scenes;
    std::vector<Request> m_requests;
    bool m_running = false;
};
