#include "scenes/MatchScene.h"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "app/GameApplication.h"
#include "app/TextRenderer.h"
#include "scenes/LobbyScene.h"
#include "scenes/SceneStack.h"
#include "services/ServiceLocator.h"

namespace
{

std::uint32_t tileColor(world::TileKind kind)
{
    switch (kind)
    {
    case world::TileKind::Road:
        return 0x3a3a44;
    case world::TileKind::Building:
        return 0x6b5f57;
    case world::TileKind::Park:
        return 0x3f8f3f;
    case world::TileKind::Water:
        return 0x2f5fbf;
    case world::TileKind::Lava:
        return 0xd2461e;
    }
    return 0x000000;
}

std::uint32_t buildingColor(world::BuildingKind kind)
{
    switch (kind)
    {
    case world::BuildingKind::Shop:
        return 0x9c7bb8;
    case world::BuildingKind::Cafe:
        return 0xc49a6c;
    case world::BuildingKind::Residential:
        break;
    }
    return 0x7d7068;
}

double elapsedMs(Uint64 start, Uint64 end, double frequency)
{
    return static_cast<double>(end - start) * 1000.0 / frequency;
}

} // namespace

MatchScene::MatchScene(bool resume) : m_resume(resume) {}

MatchScene::~MatchScene() = default;

void MatchScene::onEnter(GameApplication &app, SceneStack &)
{
    const ClientConfig &config = app.clientConfig();
    const LaunchOptions &options = app.launchOptions();
    ServiceLocator &services = ServiceLocator::instance();
    m_telemetry = services.telemetrySink();
    const std::shared_ptr<EventBus> bus = services.eventBus();
    m_frequency = static_cast<double>(SDL_GetPerformanceFrequency());

    net::ReplayLoadResult replay = net::loadReplayScript(options.replayPath);
    for (const auto &error : replay.errors)
    {
        std::cerr << "[replay] " << error << '\n';
    }
    if (!replay.success)
    {
        recordTelemetry(m_telemetry, "scene.warning",
                        {{"scene", "MatchScene"}, {"reason", "replay_errors"},
                         {"detail", std::to_string(replay.errors.size())}});
    }

    m_channel = std::make_unique<net::ReplayChannel>(std::move(replay.records), m_telemetry);
    m_session = std::make_unique<MatchSession>(config, *m_channel, bus, m_telemetry, services.clientStore());
    m_presenter = std::make_unique<HudPresenter>(config.collectibles, config.capabilities);
    m_presenter->setTelemetrySink(m_telemetry);
    m_presenter->setEventBus(bus);
    m_perfMonitor = telemetry::PerformanceBudgetMonitor(config.performance, m_telemetry);
    m_actions.setCapacity(static_cast<std::size_t>(std::max(1, config.input.bufferFrames)));
    m_collectibleHalfExtent = config.world.tileSize * 0.15f;
    m_entityHalfExtent = config.movement.hitboxSize * 0.5f;

    m_hudView.setDependencies(
        HudView::Dependencies{app.renderer(), &app.hudText(), app.windowWidth(), app.windowHeight()});

    if (m_resume && m_session->rejoinStored())
    {
        return;
    }
    m_session->join(options.roomCode, options.playerName);
}

void MatchScene::onExit(GameApplication &, SceneStack &)
{
    if (m_session)
    {
        m_session->leave();
        m_session->teardown();
    }
    m_presenter.reset();
    m_session.reset();
    m_channel.reset();
}

void MatchScene::handleEvent(const SDL_Event &event, GameApplication &, SceneStack &)
{
    if (event.type != SDL_KEYDOWN || event.key.repeat != 0)
    {
        return;
    }
    switch (event.key.keysym.scancode)
    {
    case SDL_SCANCODE_1:
        answer(0);
        break;
    case SDL_SCANCODE_2:
        answer(1);
        break;
    case SDL_SCANCODE_3:
        answer(2);
        break;
    case SDL_SCANCODE_4:
        answer(3);
        break;
    default:
        break;
    }
}

void MatchScene::answer(int optionIndex)
{
    if (!m_session)
    {
        return;
    }
    if (m_frame.phase == GamePhase::Quiz)
    {
        m_session->answerQuiz(optionIndex);
    }
    else if (m_frame.phase == GamePhase::FrozenLocal && !m_frame.penaltyQuizLoading)
    {
        if (m_session->answerPenalty(m_penaltyQuestion, optionIndex))
        {
            ++m_penaltyQuestion;
        }
    }
}

void MatchScene::update(double deltaSeconds, GameApplication &app, SceneStack &stack)
{
    if (!m_session)
    {
        return;
    }

    const double dtMs = deltaSeconds * 1000.0;
    m_clockMs += dtMs;

    InputMapper &input = app.inputMapper();
    const bool movementEnabled = m_frame.phase == GamePhase::Hunt;
    input.sampleFrame(movementEnabled, m_clockMs, ++m_frameSequence, m_actions);
    m_actions.expireOlderThan(m_clockMs - input.bufferExpiryMs());

    if (m_actions.pressedThisFrame(ActionId::Quit))
    {
        stack.pop();
        app.requestQuit();
        return;
    }
    if (m_actions.pressedThisFrame(ActionId::ToggleDebugHud))
    {
        m_showDebugHud = !m_showDebugHud;
    }
    if (m_actions.pressedThisFrame(ActionId::DeployTrap))
    {
        m_session->deployTrap();
    }

    const Uint64 pumpStart = SDL_GetPerformanceCounter();
    m_session->pump(dtMs);
    const Uint64 simulateStart = SDL_GetPerformanceCounter();
    m_frame = m_session->simulate(m_actions.moveIntent(), dtMs);
    const Uint64 simulateEnd = SDL_GetPerformanceCounter();

    if (m_frame.phase != GamePhase::FrozenLocal || m_frame.penaltyQuizLoading)
    {
        m_penaltyQuestion = 0;
    }

    m_framePerf.msPump = static_cast<float>(elapsedMs(pumpStart, simulateStart, m_frequency));
    m_framePerf.msSimulate = static_cast<float>(elapsedMs(simulateStart, simulateEnd, m_frequency));
    collectFramePerf(deltaSeconds);

    if (m_session->routedToLobby())
    {
        stack.replace(std::make_unique<LobbyScene>(m_session->lobbyReason()));
    }
}

void MatchScene::collectFramePerf(double deltaSeconds)
{
    m_framePerf.fps = deltaSeconds > 0.0 ? static_cast<float>(1.0 / deltaSeconds) : 0.0f;
    m_framePerf.remotes = m_frame.remotes.size();
    m_framePerf.collectibles = m_frame.coins.size() + m_frame.trapPickups.size() + m_frame.deployedTraps.size() +
                               m_frame.portals.size();
    m_framePerf.pendingTimers = m_session->timers().pendingCount();
    m_framePerf.lostEvents = ServiceLocator::instance().eventBus()->unconsumedCount();
    m_framePerf.connection = reconnectionStatusToString(m_session->reconnection().status());
}

void MatchScene::render(SDL_Renderer *renderer, GameApplication &app)
{
    if (!m_session || !renderer)
    {
        return;
    }

    const Uint64 renderStart = SDL_GetPerformanceCounter();
    RenderStats stats;
    SDL_SetRenderDrawColor(renderer, 12, 12, 18, 255);
    countedRenderClear(renderer, stats);

    Camera camera{m_frame.local.position, app.windowWidth(), app.windowHeight()};
    renderWorld(renderer, camera, stats);
    renderCollectibles(renderer, camera, stats);
    renderEntities(renderer, camera, stats);
    renderCues(renderer, camera, stats);
    renderFlash(renderer, app.windowWidth(), app.windowHeight(), stats);

    const HudModel model = m_presenter->present(m_frame);
    m_hudView.render(HudView::DrawContext{&model, &m_framePerf, &stats, m_showDebugHud});

    m_framePerf.msRender = static_cast<float>(elapsedMs(renderStart, SDL_GetPerformanceCounter(), m_frequency));
    m_framePerf.drawCalls = stats.drawCalls;

    const auto violation =
        m_perfMonitor.report(telemetry::StageTimingSample{m_framePerf.msPump, m_framePerf.msSimulate,
                                                          m_framePerf.msRender});
    m_framePerf.budgetExceeded = violation.has_value();
    m_framePerf.budgetStage = violation ? violation->stage : std::string();
}

void MatchScene::renderWorld(SDL_Renderer *renderer, const Camera &camera, RenderStats &stats) const
{
    if (!m_frame.grid)
    {
        return;
    }
    const world::WorldGrid &grid = *m_frame.grid;
    const float tile = static_cast<float>(grid.tileSize());

    const Vec2 topLeft = camera.position - Vec2{camera.screenWidth * 0.5f, camera.screenHeight * 0.5f};
    const int firstCol = std::max(0, static_cast<int>(std::floor(topLeft.x / tile)));
    const int firstRow = std::max(0, static_cast<int>(std::floor(topLeft.y / tile)));
    const int lastCol = std::min(grid.width() - 1, static_cast<int>((topLeft.x + camera.screenWidth) / tile));
    const int lastRow = std::min(grid.height() - 1, static_cast<int>((topLeft.y + camera.screenHeight) / tile));

    for (int row = firstRow; row <= lastRow; ++row)
    {
        for (int col = firstCol; col <= lastCol; ++col)
        {
            const Vec2 screen = camera.toScreen(Vec2{col * tile, row * tile});
            const SDL_FRect rect{screen.x, screen.y, tile, tile};
            setDrawColor(renderer, tileColor(grid.tile(row, col)));
            countedRenderFillRectF(renderer, &rect, stats);
        }
    }

    for (const auto &building : grid.buildings())
    {
        const int row = building.cell.row;
        const int col = building.cell.col;
        if (row < firstRow || row > lastRow || col < firstCol || col > lastCol)
        {
            continue;
        }
        const float inset = tile * (0.3f - 0.2f * std::clamp(building.height / 100.0f, 0.0f, 1.0f));
        const Vec2 screen = camera.toScreen(Vec2{col * tile + inset, row * tile + inset});
        const SDL_FRect rect{screen.x, screen.y, tile - inset * 2.0f, tile - inset * 2.0f};
        setDrawColor(renderer, buildingColor(building.kind));
        countedRenderFillRectF(renderer, &rect, stats);
    }

    setDrawColor(renderer, 0x2d6b2d);
    for (const auto &tree : grid.trees())
    {
        fillCentredSquare(renderer, camera.toScreen(tree.pos), tree.radius, stats);
    }
}

void MatchScene::renderCollectibles(SDL_Renderer *renderer, const Camera &camera, RenderStats &stats) const
{
    setDrawColor(renderer, 0xffd700);
    for (const auto &coin : m_frame.coins)
    {
        fillCentredSquare(renderer, camera.toScreen(coin.position), m_collectibleHalfExtent, stats);
    }
    setDrawColor(renderer, 0x8a2be2);
    for (const auto &trap : m_frame.trapPickups)
    {
        fillCentredSquare(renderer, camera.toScreen(trap.position), m_collectibleHalfExtent, stats);
    }
    setDrawColor(renderer, 0x202020);
    for (const auto &trap : m_frame.deployedTraps)
    {
        fillCentredSquare(renderer, camera.toScreen(trap.position), m_collectibleHalfExtent * 1.5f, stats);
    }
    for (const auto &portal : m_frame.portals)
    {
        setDrawColor(renderer, hueToRgb(portal.hue));
        const Vec2 centre = camera.toScreen(portal.position);
        const float extent = m_collectibleHalfExtent * 2.0f;
        const SDL_FRect rect{centre.x - extent, centre.y - extent, extent * 2.0f, extent * 2.0f};
        countedRenderDrawRectF(renderer, &rect, stats);
    }
}

void MatchScene::renderEntities(SDL_Renderer *renderer, const Camera &camera, RenderStats &stats) const
{
    for (const auto &remote : m_frame.remotes)
    {
        if (remote.eliminated)
        {
            continue;
        }
        std::uint32_t color = remote.chaser ? 0xff3030 : 0x30a0ff;
        if (remote.frozen)
        {
            color = 0xa0e0ff;
        }
        const Uint8 alpha = (remote.disconnected || remote.invulnerableAt(m_frame.nowMs)) ? 120 : 255;
        setDrawColor(renderer, color, alpha);
        fillCentredSquare(renderer, camera.toScreen(remote.position), m_entityHalfExtent, stats);
    }

    if (m_frame.localId.empty())
    {
        return;
    }
    setDrawColor(renderer, 0xffffff, 60);
    for (const Vec2 &point : m_frame.local.trail)
    {
        fillCentredSquare(renderer, camera.toScreen(point), 2.0f, stats);
    }
    setDrawColor(renderer, m_frame.localChaser ? 0xff8040 : 0x40ff80, m_frame.invulnerable ? 140 : 255);
    fillCentredSquare(renderer, camera.toScreen(m_frame.local.position), m_entityHalfExtent, stats);
}

void MatchScene::renderCues(SDL_Renderer *renderer, const Camera &camera, RenderStats &stats) const
{
    for (const auto &cue : m_frame.cues)
    {
        switch (cue.kind)
        {
        case VisualCueKind::TeleportOut:
            setDrawColor(renderer, 0x00ffff, 160);
            break;
        case VisualCueKind::TeleportIn:
            setDrawColor(renderer, 0x00ffff, 220);
            break;
        case VisualCueKind::Respawn:
            setDrawColor(renderer, 0xffffff, 200);
            break;
        }
        fillCentredSquare(renderer, camera.toScreen(cue.position), m_entityHalfExtent * 2.0f, stats);
    }
}

void MatchScene::renderFlash(SDL_Renderer *renderer, int width, int height, RenderStats &stats) const
{
    if (!m_frame.flash)
    {
        return;
    }
    const float opacity = std::clamp(m_frame.flash->opacity, 0.0f, 1.0f);
    setDrawColor(renderer, m_frame.flash->rgb, static_cast<Uint8>(std::lround(opacity * 255.0f)));
    const SDL_FRect rect{0.0f, 0.0f, static_cast<float>(width), static_cast<float>(height)};
    countedRenderFillRectF(renderer, &rect, stats);
}
