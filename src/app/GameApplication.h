#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <SDL.h>

#include "app/TextRenderer.h"
#include "config/ClientConfigLoader.h"
#include "input/InputMapper.h"
#include "scenes/SceneStack.h"

class ClientStore;
class EventBus;
class TelemetrySink;

struct LaunchOptions
{
    std::filesystem::path configRoot{"config"};
    std::filesystem::path replayPath{std::filesystem::path("config") / "replay" / "demo.jsonl"};
    std::string roomCode = "ABC123";
    std::string playerName = "Player";
    std::optional<std::filesystem::path> telemetryDir;
    /// Rejoin the room saved in the client store instead of joining roomCode.
    bool resume = false;
};

class GameApplication
{
  public:
    explicit GameApplication(LaunchOptions options);
    ~GameApplication();

    int run();

    SceneStack &sceneStack();

    const LaunchOptions &launchOptions() const { return m_options; }
    const ClientConfig &clientConfig() const;
    const ClientConfigLoadResult &clientConfigResult() const;

    InputMapper &inputMapper() { return m_inputMapper; }
    const InputMapper &inputMapper() const { return m_inputMapper; }
    const TextRenderer &hudText() const { return m_hudText; }

    SDL_Window *window() const;
    SDL_Renderer *renderer() const;

    int windowWidth() const;
    int windowHeight() const;

    bool isRendererReady() const;

    void requestQuit();

  private:
    bool initialize();
    void shutdown();
    void loadConfig();
    void applyTelemetrySettings();
    void registerCoreServices();
    void unregisterCoreServices();
    void loadStore();

    SDL_Window *m_window = nullptr;
    SDL_Renderer *m_renderer = nullptr;

    bool m_running = false;
    bool m_quitRequested = false;
    bool m_initialized = false;

    int m_windowWidth = 1280;
    int m_windowHeight = 720;
    std::string m_windowTitle = "Qbit City";

    LaunchOptions m_options;
    SceneStack m_sceneStack;
    ClientConfigLoadResult m_configResult;
    std::shared_ptr<TelemetrySink> m_telemetrySink;
    std::shared_ptr<EventBus> m_eventBus;
    std::unique_ptr<ClientStore> m_store;
    InputMapper m_inputMapper;
    TextRenderer m_hudText;
};
