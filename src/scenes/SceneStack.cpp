#include "scenes/SceneStack.h"

#include <utility>

#include "app/GameApplication.h"
#include "scenes/Scene.h"
#include "services/ServiceLocator.h"

SceneStack::SceneStack(GameApplication &app) : m_app(app) {}

SceneStack::~SceneStack()
{
    clear();
}

void SceneStack::push(std::unique_ptr<Scene> scene)
{
    if (scene)
    {
        request(RequestKind::Push, std::move(scene));
    }
}

void SceneStack::pop()
{
    request(RequestKind::Pop, nullptr);
}

void SceneStack::replace(std::unique_ptr<Scene> scene)
{
    if (scene)
    {
        request(RequestKind::Replace, std::move(scene));
    }
}

void SceneStack::clear()
{
    m_requests.clear();
    while (!m_scenes.empty())
    {
        exitTop();
    }
}

void SceneStack::handleEvent(const SDL_Event &event)
{
    applyRequests();
    if (m_scenes.empty())
    {
        return;
    }
    m_running = true;
    m_scenes.back()->handleEvent(event, m_app, *this);
    m_running = false;
    applyRequests();
}

void SceneStack::update(double deltaSeconds)
{
    applyRequests();
    if (m_scenes.empty())
    {
        return;
    }
    m_running = true;
    m_scenes.back()->update(deltaSeconds, m_app, *this);
    m_running = false;
    applyRequests();
}

void SceneStack::render(SDL_Renderer *renderer)
{
    applyRequests();
    m_running = true;
    for (const auto &scene : m_scenes)
    {
        scene->render(renderer, m_app);
    }
    m_running = false;
    applyRequests();
}

bool SceneStack::empty() const
{
    if (!m_scenes.empty())
    {
        return false;
    }
    for (const Request &pending : m_requests)
    {
        if (pending.kind != RequestKind::Pop)
        {
            return false;
        }
    }
    return true;
}

Scene *SceneStack::top() const
{
    return m_scenes.empty() ? nullptr : m_scenes.back().get();
}

void SceneStack::onRendererReady()
{
    applyRequests();
}

void SceneStack::request(RequestKind kind, std::unique_ptr<Scene> scene)
{
    m_requests.push_back(Request{kind, std::move(scene)});
    applyRequests();
}

void SceneStack::applyRequests()
{
    if (m_running || !m_app.isRendererReady())
    {
        return;
    }
    // Entering a scene may queue further requests, so the list is drained rather than iterated.
    while (!m_requests.empty())
    {
        Request next = std::move(m_requests.front());
        m_requests.erase(m_requests.begin());
        switch (next.kind)
        {
        case RequestKind::Push:
            enter(std::move(next.scene));
            break;
        case RequestKind::Pop:
            exitTop();
            break;
        case RequestKind::Replace:
            exitTop();
            enter(std::move(next.scene));
            break;
        }
    }
}

void SceneStack::enter(std::unique_ptr<Scene> scene)
{
    recordTelemetry(ServiceLocator::instance().telemetrySink(), "scene.entered", {{"scene", scene->name()}});
    m_scenes.push_back(std::move(scene));
    m_running = true;
    m_scenes.back()->onEnter(m_app, *this);
    m_running = false;
}

void SceneStack::exitTop()
{
    if (m_scenes.empty())
    {
        return;
    }
    std::unique_ptr<Scene> scene = std::move(m_scenes.back());
    m_scenes.pop_back();
    m_running = true;
    scene->onExit(m_app, *this);
    m_running = false;
    recordTelemetry(ServiceLocator::instance().telemetrySink(), "scene.exited", {{"scene", scene->name()}});
}
