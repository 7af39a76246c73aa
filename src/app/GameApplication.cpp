#include "app/GameApplication.h"

#include <SDL_ttf.h>

#include <iostream>
#include <utility>

#include "events/EventBus.h"
#include "persist/ClientStore.h"
#include "services/ServiceLocator.h"
#include "telemetry/ConsoleTelemetrySink.h"
#include "telemetry/FileTelemetrySink.h"
#include "telemetry/TelemetrySink.h"

GameApplication::GameApplication(LaunchOptions options) : m_options(std::move(options)), m_sceneStack(*this) {}

GameApplication::~GameApplication()
{
    shutdown();
}

SceneStack &GameApplication::sceneStack()
{
    return m_sceneStack;
}

const ClientConfig &GameApplication::clientConfig() const
{
    return m_configResult.config;
}

const ClientConfigLoadResult &GameApplication::clientConfigResult() const
{
    return m_configResult;
}

SDL_Window *GameApplication::window() const
{
    return m_window;
}

SDL_Renderer *GameApplication::renderer() const
{
    return m_renderer;
}

int GameApplication::windowWidth() const
{
    return m_windowWidth;
}

int GameApplication::windowHeight() const
{
    return m_windowHeight;
}

bool GameApplication::isRendererReady() const
{
    return m_renderer != nullptr;
}

void GameApplication::requestQuit()
{
    m_quitRequested = true;
}

int GameApplication::run()
{
    if (!initialize())
    {
        m_sceneStack.clear();
        return 1;
    }

    const double frequency = static_cast<double>(SDL_GetPerformanceFrequency());
    Uint64 prevCounter = SDL_GetPerformanceCounter();

    while (m_running && !m_quitRequested)
    {
        m_inputMapper.beginEventPump();
        SDL_Event event;
        while (SDL_PollEvent(&event))
        {
            if (event.type == SDL_QUIT)
            {
                m_quitRequested = true;
            }
            m_inputMapper.handleEvent(event);
            m_sceneStack.handleEvent(event);
        }

        if (m_quitRequested)
        {
            break;
        }

        const Uint64 nowCounter = SDL_GetPerformanceCounter();
        const double deltaSeconds = (nowCounter - prevCounter) / frequency;
        prevCounter = nowCounter;

        m_sceneStack.update(deltaSeconds);

        if (m_quitRequested)
        {
            break;
        }

        m_sceneStack.render(m_renderer);
        SDL_RenderPresent(m_renderer);
        m_hudText.endFrame();

        if (m_sceneStack.empty())
        {
            m_quitRequested = true;
        }
    }

    shutdown();
    return 0;
}

bool GameApplication::initialize()
{
    if (m_initialized)
    {
        return true;
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
    {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << '\n';
        return false;
    }

    if (TTF_Init() != 0)
    {
        std::cerr << "TTF_Init failed: " << TTF_GetError() << '\n';
        SDL_Quit();
        return false;
    }

    loadConfig();
    applyTelemetrySettings();
    registerCoreServices();

    m_window = SDL_CreateWindow(m_windowTitle.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, m_windowWidth,
                                m_windowHeight, SDL_WINDOW_SHOWN);
    if (!m_window)
    {
        std::cerr << "Failed to create window: " << SDL_GetError() << '\n';
        unregisterCoreServices();
        TTF_Quit();
        SDL_Quit();
        return false;
    }

    m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!m_renderer)
    {
        std::cerr << "Failed to create renderer: " << SDL_GetError() << '\n';
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
        unregisterCoreServices();
        TTF_Quit();
        SDL_Quit();
        return false;
    }
    SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_BLEND);

    const ClientConfig &config = m_configResult.config;
    const std::filesystem::path fontPath = m_options.configRoot.parent_path() / config.hud.fontPath;
    if (!m_hudText.load(fontPath.string(), config.hud.pointSize))
    {
        std::cerr << "Failed to load HUD font: " << fontPath.string() << " -> " << TTF_GetError() << '\n';
        recordTelemetry(m_telemetrySink, "app.hud_font_missing", {{"path", fontPath.string()}});
    }

    m_inputMapper.configure(config.input);
    loadStore();

    m_running = true;
    m_quitRequested = false;
    m_initialized = true;

    m_sceneStack.onRendererReady();

    return true;
}

void GameApplication::shutdown()
{
    if (!m_initialized)
    {
        return;
    }

    m_sceneStack.clear();
    m_hudText.unload();

    if (m_renderer)
    {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window)
    {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }

    ServiceLocator::instance().setClientStore(nullptr);
    m_store.reset();
    if (m_telemetrySink)
    {
        m_telemetrySink->flush();
    }
    unregisterCoreServices();

    TTF_Quit();
    SDL_Quit();

    m_running = false;
    m_quitRequested = false;
    m_initialized = false;
}

void GameApplication::loadConfig()
{
    ClientConfigLoader loader(m_options.configRoot);
    loader.setKeyValidator(&InputMapper::isValidKeyBinding);
    m_configResult = loader.load();
    for (const auto &error : m_configResult.errors)
    {
        std::cerr << "[config] " << error.file << ": " << error.message << '\n';
    }
}

void GameApplication::applyTelemetrySettings()
{
    const TelemetryOptions &options = m_configResult.config.telemetry;
    if (options.sink == "null")
    {
        m_telemetrySink = std::make_shared<NullTelemetrySink>();
    }
    else if (options.sink == "file")
    {
        auto console = std::make_shared<ConsoleTelemetrySink>();
        console->setMutedPrefixes(options.consoleMuted);
        auto fileSink = std::make_shared<FileTelemetrySink>(std::move(console));
        fileSink->setOutputDirectory(m_options.telemetryDir ? *m_options.telemetryDir
                                                            : std::filesystem::path(options.outputDirectory));
        fileSink->setRotationThresholdBytes(options.rotationBytes);
        fileSink->setMaxRetentionFiles(options.maxFiles);
        m_telemetrySink = std::move(fileSink);
    }
    else
    {
        auto console = std::make_shared<ConsoleTelemetrySink>();
        console->setMutedPrefixes(options.consoleMuted);
        m_telemetrySink = std::move(console);
    }

    if (!m_configResult.success)
    {
        recordTelemetry(m_telemetrySink, "config.load_failed",
                        {{"errors", std::to_string(m_configResult.errors.size())}});
    }
}

void GameApplication::registerCoreServices()
{
    m_eventBus = std::make_shared<BasicEventBus>(m_telemetrySink);
    ServiceLocator &locator = ServiceLocator::instance();
    locator.setTelemetrySink(m_telemetrySink);
    locator.setEventBus(m_eventBus);
}

void GameApplication::unregisterCoreServices()
{
    ServiceLocator::instance().clear();
    m_eventBus.reset();
}

void GameApplication::loadStore()
{
    const StoreConfig &storeConfig = m_configResult.config.store;
    m_store = std::make_unique<ClientStore>(storeConfig.path, storeConfig.leaderboardCapacity, m_telemetrySink);
    const ClientStoreLoadResult loaded = m_store->load();
    for (const auto &error : loaded.errors)
    {
        std::cerr << "[store] " << error << '\n';
    }
    if (!m_options.playerName.empty())
    {
        m_store->setPlayerName(m_options.playerName);
    }
    ServiceLocator::instance().setClientStore(m_store.get());
}
