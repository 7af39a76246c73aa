#include "session/MatchSession.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include "net/WireCodec.h"
#include "net/WireProtocol.h"
#include "persist/ClientStore.h"
#include "world/WorldGenerator.h"

namespace
{

constexpr std::uint32_t kTaggedFlash = 0xff3b30;
constexpr std::uint32_t kTeleportFlash = 0x00ffff;
constexpr std::uint32_t kRespawnFlash = 0xffffff;
constexpr double kAnnounceWindowMs = 1000.0;

int portalHue(std::size_t index)
{
    return static_cast<int>((index * 90) % 360);
}

std::string todayString()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm localTime{};
#if defined(_WIN32)
    localtime_s(&localTime, &time);
#else
    localtime_r(&time, &localTime);
#endif
    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d");
    return oss.str();
}

bool isSpectatorState(const std::string &state)
{
    return state == "eliminated" || state == "spectating";
}

} // namespace

MatchSession::MatchSession(ClientConfig config, net::Channel &channel, std::shared_ptr<EventBus> bus,
                           std::shared_ptr<TelemetrySink> telemetry, ClientStore *store)
    : m_config(std::move(config)),
      m_channel(channel),
      m_bus(std::move(bus)),
      m_telemetry(std::move(telemetry)),
      m_store(store),
      m_mapper(m_config.world.tileSize),
      m_predictor(m_config.movement, m_config.capabilities, m_config.network.positionIntervalMs),
      m_interpolator(m_config.network.interpolationSpeed, m_config.network.snapEpsilonPx),
      m_collectibles(m_config.world.tileSize, m_telemetry),
      m_phase(m_timers, m_channel, m_config.timers, m_config.capabilities, m_telemetry),
      m_reconnection(m_channel, m_telemetry, store)
{
    if (!m_bus)
    {
        m_bus = std::make_shared<NullEventBus>();
    }

    PhaseStateMachine::Hooks hooks;
    hooks.phaseChanged = [this](GamePhase previous, GamePhase current) {
        if (current != GamePhase::Quiz)
        {
            m_quiz.reset();
        }
        m_bus->dispatch(PhaseChangedEventName,
                        EventContext{PhaseChangedEvent{previous, current, m_phase.roundContext().currentRound}});
    };
    hooks.rolesChanged = [this](bool localChaser) {
        m_predictor.setChaser(localChaser);
        m_interpolator.setChaserIds(m_phase.roundContext().chaserIds);
    };
    hooks.penaltyResolved = [this]() { m_predictor.clearHazardReport(); };
    hooks.displayName = [this](const std::string &playerId) { return displayName(playerId); };
    m_phase.setHooks(std::move(hooks));

    subscribe();
}

MatchSession::~MatchSession()
{
    teardown();
}

void MatchSession::subscribe()
{
    m_inboundToken = m_bus->subscribe(InboundMessageEventName, [this](const EventContext &ctx) {
        if (const auto *message = eventPayload<InboundMessageEvent>(ctx))
        {
            handleInbound(*message);
        }
    });
    m_connectionToken = m_bus->subscribe(ConnectionChangedEventName, [this](const EventContext &ctx) {
        if (const auto *change = eventPayload<ConnectionChangedEvent>(ctx))
        {
            handleConnection(change->connected);
        }
    });

    m_channel.setMessageHandler([this](const std::string &event, const json::JsonValue &payload) {
        m_bus->dispatch(InboundMessageEventName, EventContext{InboundMessageEvent{event, payload}});
    });
    m_channel.setConnectionHandler([this](bool connected) {
        m_bus->dispatch(ConnectionChangedEventName, EventContext{ConnectionChangedEvent{connected}});
    });
}

void MatchSession::join(const std::string &roomCode, const std::string &playerName)
{
    m_roomCode = roomCode;
    m_playerName = playerName;
    m_routedToLobby = false;
    m_lobbyReason.clear();

    RoomIdentity identity{roomCode, playerName, {}};
    if (m_store && m_store->data().roomCode == roomCode)
    {
        identity.playerId = m_store->data().playerId;
    }
    recordTelemetry(m_telemetry, "session.join", {{"room", roomCode}, {"name", playerName}});
    m_reconnection.beginJoin(identity);
}

bool MatchSession::rejoinStored()
{
    if (!m_reconnection.restoreIdentity())
    {
        return false;
    }
    const RoomIdentity identity = *m_reconnection.identity();
    m_roomCode = identity.roomCode;
    m_playerName = identity.playerName;
    m_routedToLobby = false;
    m_lobbyReason.clear();
    m_reconnection.beginJoin(identity);
    return true;
}

void MatchSession::leave()
{
    if (m_tornDown)
    {
        return;
    }
    m_reconnection.leave();
    teardown();
}

void MatchSession::teardown()
{
    if (m_tornDown)
    {
        return;
    }
    m_tornDown = true;
    m_timers.cancelAll();
    m_flashTimer = 0;
    m_lobbyTimer = 0;
    m_inboundToken.reset();
    m_connectionToken.reset();
    m_channel.setMessageHandler(nullptr);
    m_channel.setConnectionHandler(nullptr);
    m_bus->clearPending();
    m_matchActive = false;
    recordTelemetry(m_telemetry, "session.teardown", {{"room", m_roomCode}});
}

MatchFrame MatchSession::tick(const MoveIntent &intent, double dtMs)
{
    pump(dtMs);
    return simulate(intent, dtMs);
}

void MatchSession::pump(double dtMs)
{
    m_timers.advance(std::max(0.0, dtMs));
    if (m_tornDown)
    {
        return;
    }
    m_channel.poll(m_timers.nowMs());
    m_bus->pump();
    m_bus->advanceFrame();
}

MatchFrame MatchSession::simulate(const MoveIntent &intent, double dtMs)
{
    const float dt = static_cast<float>(std::max(0.0, dtMs) / 1000.0);
    const bool broadcast = broadcastAllowed();
    if (m_matchActive && m_phase.globalPhase() == GamePhase::Hunt)
    {
        runPredictor(intent, dt, broadcast);
        detectPickups(broadcast);
    }

    m_interpolator.tick(dt);
    m_collectibles.prune();
    return buildFrame();
}

bool MatchSession::deployTrap()
{
    if (!m_phase.movementAllowed() || !broadcastAllowed())
    {
        return false;
    }
    if (!m_collectibles.consumeTrapOptimistic())
    {
        return false;
    }
    const world::GridCell cell = m_mapper.toGrid(m_predictor.entity().position);
    send(net::wire::DeploySinkTrap, net::encodeDeployTrap(cell));
    recordTelemetry(m_telemetry, "session.trap_deployed",
                    {{"row", std::to_string(cell.row)}, {"col", std::to_string(cell.col)}});
    return true;
}

bool MatchSession::answerQuiz(int answerIndex)
{
    if (!m_quiz || answerIndex < 0 || answerIndex >= static_cast<int>(m_quiz->options.size()))
    {
        return false;
    }
    return m_phase.submitQuizAnswer(answerIndex);
}

bool MatchSession::answerPenalty(int questionIndex, int answerIndex)
{
    return m_phase.submitPenaltyAnswer(questionIndex, answerIndex);
}

void MatchSession::handleInbound(const InboundMessageEvent &message)
{
    namespace wire = net::wire;
    const std::string &name = message.name;
    const json::JsonValue &payload = message.payload;
    std::string error;

    if (name == wire::RoomJoined)
    {
        if (auto event = net::decodeRoomJoined(payload, error))
        {
            onRoomJoined(*event);
        }
    }
    else if (name == wire::JoinError)
    {
        if (auto event = net::decodeJoinError(payload, error))
        {
            onJoinError(*event);
        }
    }
    else if (name == wire::RoomLeft)
    {
        if (auto event = net::decodeRoomLeft(payload, error))
        {
            onRoomLeft(*event);
        }
    }
    else if (name == wire::PlayerJoined)
    {
        if (auto event = net::decodePlayerJoined(payload, error))
        {
            onPlayerJoined(*event);
        }
    }
    else if (name == wire::PlayerLeft)
    {
        if (auto event = net::decodePlayerLeft(payload, error))
        {
            onPlayerLeft(*event);
        }
    }
    else if (name == wire::GameStarted)
    {
        if (auto event = net::decodeGameStarted(payload, error))
        {
            onGameStarted(*event);
        }
    }
    else if (name == wire::PlayerPositionUpdate)
    {
        if (auto event = net::decodePositionUpdate(payload, error))
        {
            onPositionUpdate(*event);
        }
    }
    else if (name == wire::PhaseChange)
    {
        if (auto event = net::decodePhaseChange(payload, error))
        {
            m_phase.onPhaseChange(*event);
        }
    }
    else if (name == wire::BlitzStart)
    {
        if (auto event = net::decodeQuizStart(payload, error))
        {
            onQuizStart(*event);
        }
    }
    else if (name == wire::UnicornTransferred)
    {
        if (auto event = net::decodeRoleTransfer(payload, error))
        {
            m_phase.applyRoles(event->chaserIds);
        }
    }
    else if (name == wire::HuntStart)
    {
        if (auto event = net::decodeHuntStart(payload, error))
        {
            onHuntStart(*event);
        }
    }
    else if (name == wire::HuntEnd)
    {
        if (auto event = net::decodeHuntEnd(payload, error))
        {
            m_phase.onHuntEnded(*event);
        }
    }
    else if (name == wire::PlayerTagged)
    {
        if (auto event = net::decodePlayerTagged(payload, error))
        {
            onPlayerTagged(*event);
        }
    }
    else if (name == wire::PlayerStateChange)
    {
        if (auto event = net::decodePlayerStateChange(payload, error))
        {
            onPlayerStateChange(*event);
        }
    }
    else if (name == wire::PlayerRespawn)
    {
        if (auto event = net::decodePlayerRespawn(payload, error))
        {
            onPlayerRespawn(*event);
        }
    }
    else if (name == wire::CoinSpawned)
    {
        if (auto event = net::decodeItemsSpawned(payload, "coins", "coinId", error))
        {
            onItemsSpawned(CollectibleKind::Coin, *event);
        }
    }
    else if (name == wire::CoinCollected)
    {
        if (auto event = net::decodeCoinCollected(payload, error))
        {
            onCoinCollected(*event);
        }
    }
    else if (name == wire::SinkTrapSpawned)
    {
        if (auto event = net::decodeItemsSpawned(payload, "sinkTraps", "trapId", error))
        {
            onItemsSpawned(CollectibleKind::TrapPickup, *event);
        }
    }
    else if (name == wire::SinkTrapCollected)
    {
        if (auto event = net::decodeTrapCollected(payload, error))
        {
            onTrapCollected(*event);
        }
    }
    else if (name == wire::SinkTrapDeployed)
    {
        if (auto event = net::decodeTrapDeployed(payload, error))
        {
            onTrapDeployed(*event);
        }
    }
    else if (name == wire::SinkTrapTriggered)
    {
        if (auto event = net::decodeTrapTriggered(payload, error))
        {
            onTrapTriggered(*event);
        }
    }
    else if (name == wire::SinkholeSpawned)
    {
        if (auto event = net::decodeItemsSpawned(payload, "sinkholes", "sinkholeId", error))
        {
            onItemsSpawned(CollectibleKind::Portal, *event);
        }
    }
    else if (name == wire::PlayerTeleported)
    {
        if (auto event = net::decodePlayerTeleported(payload, error))
        {
            onPlayerTeleported(*event);
        }
    }
    else if (name == wire::UnfreezeQuizStart)
    {
        if (auto event = net::decodePenaltyQuizStart(payload, error))
        {
            m_phase.onPenaltyQuizContent(*event);
        }
    }
    else if (name == wire::UnfreezeQuizComplete)
    {
        if (auto event = net::decodePenaltyQuizComplete(payload, error))
        {
            m_phase.onPenaltyQuizComplete(*event);
        }
    }
    else if (name == wire::UnfreezeQuizCancelled)
    {
        if (auto event = net::decodePenaltyQuizCancelled(payload, error))
        {
            m_phase.onPenaltyQuizCancelled(*event);
        }
    }
    else if (name == wire::GameEnd)
    {
        if (auto event = net::decodeGameEnd(payload, error))
        {
            onGameEnd(*event);
        }
    }
    else if (name == wire::GameStateSync)
    {
        if (auto event = net::decodeGameStateSync(payload, error))
        {
            onGameStateSync(*event);
        }
    }
    else if (name == wire::PlayerDisconnected || name == wire::PlayerReconnected)
    {
        if (auto event = net::decodePlayerPresence(payload, error))
        {
            onPresence(event->playerId, name == wire::PlayerReconnected);
        }
    }
    else if (name == wire::BlitzResult)
    {
        // Roles and scores arrive through unicorn_transferred and the leaderboard events.
    }
    else
    {
        recordTelemetry(m_telemetry, "net.unknown_event", {{"event", name}});
    }

    if (!error.empty())
    {
        recordTelemetry(m_telemetry, "net.decode_failed", {{"event", name}, {"reason", error}});
    }
}

void MatchSession::handleConnection(bool connected)
{
    recordTelemetry(m_telemetry, "session.connection", {{"connected", connected ? "true" : "false"}});
    if (connected)
    {
        m_reconnection.onConnectionRestored();
    }
    else
    {
        m_reconnection.onConnectionLost();
    }
}

void MatchSession::onRoomJoined(const net::RoomJoined &joined)
{
    if (!joined.playerId.empty())
    {
        m_localId = joined.playerId;
    }
    else if (m_reconnection.identity() && !m_reconnection.identity()->playerId.empty())
    {
        m_localId = m_reconnection.identity()->playerId;
    }
    m_phase.setLocalId(m_localId);
    m_interpolator.setLocalId(m_localId);
    m_interpolator.remove(m_localId);
    if (!m_localId.empty())
    {
        m_names[m_localId] = m_playerName;
    }

    for (const net::PlayerInfo &player : joined.players)
    {
        if (player.id == m_localId)
        {
            continue;
        }
        m_names[player.id] = player.name;
        m_interpolator.upsert(player.id, player.name);
    }
    m_reconnection.onJoinSucceeded(m_localId);
    recordTelemetry(m_telemetry, "session.room_joined", {{"room", joined.roomCode}, {"player_id", m_localId}});
}

void MatchSession::onJoinError(const net::JoinError &error)
{
    if (m_reconnection.onJoinFailed(error.message))
    {
        routeToLobby("join_failed");
    }
}

void MatchSession::onRoomLeft(const net::RoomLeft &left)
{
    m_reconnection.forgetRoom();
    if (left.reason != "game_ended")
    {
        routeToLobby(left.reason.empty() ? "room_left" : left.reason);
        return;
    }
    if (m_lobbyTimer != 0)
    {
        return;
    }
    m_lobbyTimer = m_timers.schedule(m_config.timers.roomClosedReturnMs, [this]() {
        m_lobbyTimer = 0;
        routeToLobby("room_closed");
    });
}

void MatchSession::onPlayerJoined(const net::PlayerJoined &joined)
{
    const net::PlayerInfo &player = joined.player;
    if (player.id.empty() || player.id == m_localId)
    {
        return;
    }
    m_names[player.id] = player.name;
    m_interpolator.upsert(player.id, player.name);
}

void MatchSession::onPlayerLeft(const net::PlayerLeft &left)
{
    m_interpolator.remove(left.playerId);
    m_scores.erase(left.playerId);
}

void MatchSession::onGameStarted(const net::GameStarted &started)
{
    const std::string seed = started.roomCode.empty() ? m_roomCode : started.roomCode;
    if (!started.roomCode.empty())
    {
        m_roomCode = started.roomCode;
    }
    regenerateWorld(seed, started.mapConfig);

    m_collectibles = CollectibleStore(m_grid.tileSize(), m_telemetry);
    for (std::size_t i = 0; i < m_grid.portals().size(); ++i)
    {
        const world::PortalAnchor &anchor = m_grid.portals()[i];
        m_collectibles.spawn(CollectibleKind::Portal, "portal_" + std::to_string(i), anchor.cell, std::nullopt,
                             anchor.hue);
    }

    m_interpolator.clear();
    m_scores.clear();
    m_quiz.reset();
    m_cues.clear();
    m_predictor.resetThrottle();
    m_predictor.clearHazardReport();

    m_phase.setLocalId(m_localId);
    m_interpolator.setLocalId(m_localId);
    m_phase.startMatch(started.totalRounds, started.chaserIds);
    m_predictor.setChaser(m_phase.localChaser());

    bool localPlaced = false;
    for (std::size_t i = 0; i < started.players.size(); ++i)
    {
        net::PlayerInfo player = started.players[i];
        if (!player.position.pixel && !player.position.cell && i < started.mapConfig.spawnSlots.size())
        {
            player.position.cell = started.mapConfig.spawnSlots[i];
        }
        applyPlayer(player);
        localPlaced = localPlaced || player.id == m_localId;
    }
    if (!localPlaced)
    {
        const world::GridCell centre{m_grid.height() / 2, m_grid.width() / 2};
        m_predictor.snapTo(m_mapper.toPixel(world::sanitizeSpawnCell(m_grid, centre)));
    }
    m_interpolator.setChaserIds(m_phase.roundContext().chaserIds);

    m_matchStartedAtMs = m_timers.nowMs();
    m_matchActive = true;
    recordTelemetry(m_telemetry, "session.match_started",
                    {{"room", m_roomCode},
                     {"width", std::to_string(m_grid.width())},
                     {"height", std::to_string(m_grid.height())},
                     {"players", std::to_string(started.players.size())}});
}

void MatchSession::regenerateWorld(const std::string &seed, const net::MapConfig &mapConfig)
{
    world::WorldGenParams params;
    params.width = mapConfig.width > 0 ? mapConfig.width : m_config.world.width;
    params.height = mapConfig.height > 0 ? mapConfig.height : m_config.world.height;
    params.blockSize = mapConfig.blockSize > 0 ? mapConfig.blockSize : m_config.world.blockSize;
    params.tileSize = mapConfig.tileSize > 0 ? mapConfig.tileSize : m_config.world.tileSize;
    params.portalCount = m_config.world.portalCount;
    m_grid = world::WorldGenerator(params).generate(seed);
    m_mapper = world::GridMapper(params.tileSize);
}

void MatchSession::onPositionUpdate(const net::PositionUpdate &update)
{
    if (update.playerId == m_localId)
    {
        return;
    }
    if (const auto position = resolvePosition(update.position))
    {
        m_interpolator.applyPosition(update.playerId, *position);
    }
}

void MatchSession::onQuizStart(const net::QuizStart &quiz)
{
    if (!m_phase.onQuizStarted(quiz))
    {
        // A phase_change may have opened this quiz before its question arrived.
        const int sequence = quiz.seq.value_or(m_phase.roundCursor());
        const bool sameInstance = m_phase.globalPhase() == GamePhase::Quiz &&
                                  sequence == m_phase.lastAppliedSequence(PhaseSlot::Quiz);
        if (!sameInstance || m_quiz)
        {
            return;
        }
    }
    m_quiz = QuizPrompt{quiz.questionId, quiz.question, quiz.options, quiz.timeLimitMs};
}

void MatchSession::onHuntStart(const net::HuntStart &hunt)
{
    if (!m_phase.onHuntStarted(hunt))
    {
        return;
    }
    m_collectibles.clearKind(CollectibleKind::Portal);
    m_predictor.resetThrottle();
}

void MatchSession::onPlayerTagged(const net::PlayerTagged &tagged)
{
    if (!tagged.chaserId.empty() && tagged.coinsGained != 0)
    {
        m_scores[tagged.chaserId] += tagged.coinsGained;
    }
    if (tagged.caughtId == m_localId)
    {
        flashScreen(kTaggedFlash, 0.4f);
    }
    else if (RemoteEntity *remote = m_interpolator.find(tagged.caughtId))
    {
        remote->frozen = true;
    }
    recordTelemetry(m_telemetry, "session.player_tagged",
                    {{"chaser", tagged.chaserId}, {"caught", tagged.caughtId}});
}

void MatchSession::onPlayerStateChange(const net::PlayerStateChange &change)
{
    if (change.playerId == m_localId)
    {
        m_phase.onLocalStateChanged(change.state, change.invulnerable);
        return;
    }
    RemoteEntity *remote = m_interpolator.find(change.playerId);
    if (!remote)
    {
        return;
    }
    remote->frozen = change.state == "frozen";
    remote->eliminated = isSpectatorState(change.state);
    if (change.invulnerable)
    {
        remote->invulnerableUntilMs = *change.invulnerable ? m_timers.nowMs() + m_config.timers.invulnerabilityMs : 0.0;
    }
}

void MatchSession::onPlayerRespawn(const net::PlayerRespawn &respawn)
{
    const auto position = resolveSpawnPosition(respawn.position);
    if (respawn.playerId == m_localId)
    {
        if (position)
        {
            m_predictor.snapTo(*position);
            m_cues.push_back({VisualCueKind::Respawn, *position, respawn.playerId});
        }
        m_predictor.clearHazardReport();
        m_phase.onLocalRespawn(respawn.invulnerable);
        flashScreen(kRespawnFlash, 0.3f);
        return;
    }
    RemoteEntity *remote = m_interpolator.upsert(respawn.playerId);
    if (!remote)
    {
        return;
    }
    remote->frozen = false;
    remote->eliminated = false;
    remote->invulnerableUntilMs = respawn.invulnerable ? m_timers.nowMs() + m_config.timers.invulnerabilityMs : 0.0;
    if (position)
    {
        m_interpolator.snapTo(respawn.playerId, *position);
        m_cues.push_back({VisualCueKind::Respawn, *position, respawn.playerId});
    }
}

void MatchSession::onItemsSpawned(CollectibleKind kind, const net::ItemsSpawned &spawned)
{
    std::size_t hueIndex = m_collectibles.activeCount(kind);
    for (const net::ItemSpawn &item : spawned.items)
    {
        const int hue = kind == CollectibleKind::Portal ? portalHue(hueIndex++) : 0;
        m_collectibles.spawn(kind, item.id, item.cell, item.pixel, hue);
    }
}

void MatchSession::onCoinCollected(const net::CoinCollected &collected)
{
    m_collectibles.confirm(CollectibleKind::Coin, {collected.coinId, collected.cell});
    if (!collected.playerId.empty() && collected.newScore)
    {
        m_scores[collected.playerId] = *collected.newScore;
    }
    applyLeaderboard(collected.leaderboard);
}

void MatchSession::onTrapCollected(const net::TrapCollected &collected)
{
    m_collectibles.confirm(CollectibleKind::TrapPickup, {collected.trapId, collected.cell});
    if (collected.playerId == m_localId && collected.newInventoryCount)
    {
        m_collectibles.setTrapInventory(*collected.newInventoryCount);
    }
}

void MatchSession::onTrapDeployed(const net::TrapDeployed &deployed)
{
    const auto position = resolvePosition(deployed.position);
    if (position)
    {
        const world::GridCell cell = deployed.position.cell.value_or(m_mapper.toGrid(*position));
        m_collectibles.spawn(CollectibleKind::DeployedTrap, deployed.trapId, cell, position);
    }
    if (deployed.playerId == m_localId && deployed.newInventoryCount)
    {
        m_collectibles.setTrapInventory(*deployed.newInventoryCount);
    }
}

void MatchSession::onTrapTriggered(const net::TrapTriggered &triggered)
{
    const auto from = resolvePosition(triggered.from);
    const auto to = resolvePosition(triggered.to);
    if (from)
    {
        if (!m_collectibles.triggerTrapNear(*from, m_config.collectibles.trapMatchRadius))
        {
            recordTelemetry(m_telemetry, "session.trap_trigger_unmatched", {{"chaser", triggered.chaserId}});
        }
    }
    if (from && to)
    {
        relocate(triggered.chaserId, *from, *to);
    }
}

void MatchSession::onPlayerTeleported(const net::PlayerTeleported &teleported)
{
    const auto to = resolvePosition(teleported.to);
    if (!to)
    {
        return;
    }
    Vec2 from = *to;
    if (const auto resolved = resolvePosition(teleported.from))
    {
        from = *resolved;
    }
    relocate(teleported.playerId, from, *to);
}

void MatchSession::relocate(const std::string &playerId, const Vec2 &from, const Vec2 &to)
{
    m_cues.push_back({VisualCueKind::TeleportOut, from, playerId});
    m_cues.push_back({VisualCueKind::TeleportIn, to, playerId});
    if (playerId == m_localId)
    {
        m_predictor.snapTo(to);
        flashScreen(kTeleportFlash, 0.3f);
        return;
    }
    if (!m_interpolator.snapTo(playerId, to))
    {
        m_interpolator.upsert(playerId);
        m_interpolator.snapTo(playerId, to);
    }
}

void MatchSession::onGameEnd(const net::GameEnd &end)
{
    // phase_change game_end opens the phase first, the standings follow unnumbered.
    const bool entered = m_phase.onGameEnded(end);
    if (!entered && (m_phase.globalPhase() != GamePhase::GameEnd || !m_matchActive))
    {
        return;
    }
    applyLeaderboard(end.leaderboard);
    recordLeaderboardEntry();
    m_matchActive = false;
}

void MatchSession::recordLeaderboardEntry()
{
    if (!m_store)
    {
        return;
    }
    LeaderboardEntry entry;
    entry.name = m_playerName;
    entry.timeSurvived = std::max(0.0, m_timers.nowMs() - m_matchStartedAtMs) / 1000.0;
    entry.date = todayString();
    m_store->addLeaderboardEntry(std::move(entry));
    if (!m_store->save())
    {
        recordTelemetry(m_telemetry, "session.leaderboard_save_failed", {{"room", m_roomCode}});
    }
}

void MatchSession::onGameStateSync(const net::GameStateSync &sync)
{
    if (!sync.snapshot)
    {
        recordTelemetry(m_telemetry, "session.snapshot_empty", {{"room", m_roomCode}});
    }
    else if (m_grid.empty())
    {
        // Without a generated grid nothing in the snapshot can be placed.
        recordTelemetry(m_telemetry, "session.snapshot_ignored", {{"reason", "no_world"}});
    }
    else
    {
        applySnapshot(*sync.snapshot);
    }
    m_reconnection.onSnapshotReceived();
}

void MatchSession::applySnapshot(const net::Snapshot &snapshot)
{
    m_phase.mergeSnapshot(snapshot);

    std::vector<std::string> present;
    for (const net::PlayerInfo &player : snapshot.players)
    {
        applyPlayer(player);
        present.push_back(player.id);
    }
    std::vector<std::string> gone;
    for (const auto &entry : m_interpolator.entities())
    {
        if (std::find(present.begin(), present.end(), entry.first) == present.end())
        {
            gone.push_back(entry.first);
        }
    }
    for (const std::string &id : gone)
    {
        m_interpolator.remove(id);
    }
    m_interpolator.setChaserIds(m_phase.roundContext().chaserIds);

    m_collectibles.replaceAll(CollectibleKind::Coin, toCollectibles(CollectibleKind::Coin, snapshot.coins));
    m_collectibles.replaceAll(CollectibleKind::Portal, toCollectibles(CollectibleKind::Portal, snapshot.portals));
    m_collectibles.replaceAll(CollectibleKind::TrapPickup,
                              toCollectibles(CollectibleKind::TrapPickup, snapshot.trapPickups));
    m_collectibles.replaceAll(CollectibleKind::DeployedTrap,
                              toCollectibles(CollectibleKind::DeployedTrap, snapshot.deployedTraps));
    applyLeaderboard(snapshot.leaderboard);
    m_matchActive = m_phase.globalPhase() != GamePhase::GameEnd;

    recordTelemetry(m_telemetry, "session.snapshot_applied",
                    {{"players", std::to_string(snapshot.players.size())},
                     {"coins", std::to_string(snapshot.coins.size())},
                     {"phase", gamePhaseToString(m_phase.globalPhase())}});
}

void MatchSession::applyPlayer(const net::PlayerInfo &player)
{
    if (player.id.empty())
    {
        return;
    }
    if (!player.name.empty())
    {
        m_names[player.id] = player.name;
    }
    m_scores[player.id] = player.coins;
    const auto position = resolveSpawnPosition(player.position);

    if (player.id == m_localId)
    {
        if (position)
        {
            m_predictor.snapTo(*position);
        }
        m_collectibles.setTrapInventory(player.trapInventory);
        return;
    }

    RemoteEntity *remote = m_interpolator.upsert(player.id, player.name);
    if (!remote)
    {
        return;
    }
    remote->chaser = player.chaser;
    remote->frozen = player.state == "frozen";
    remote->eliminated = isSpectatorState(player.state);
    if (position)
    {
        m_interpolator.snapTo(player.id, *position);
    }
}

void MatchSession::applyLeaderboard(const std::vector<net::ScoreEntry> &leaderboard)
{
    for (const net::ScoreEntry &entry : leaderboard)
    {
        if (entry.id.empty())
        {
            continue;
        }
        m_scores[entry.id] = entry.coins;
        if (!entry.name.empty())
        {
            m_names[entry.id] = entry.name;
        }
    }
}

std::vector<Collectible> MatchSession::toCollectibles(CollectibleKind kind,
                                                      const std::vector<net::ItemSpawn> &items) const
{
    std::vector<Collectible> out;
    out.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        const net::ItemSpawn &item = items[i];
        Collectible collectible;
        collectible.kind = kind;
        collectible.cell = item.cell;
        collectible.id = item.id ? *item.id : CollectibleStore::synthesizeId(kind, item.cell);
        collectible.position = item.pixel ? *item.pixel : m_mapper.toPixel(item.cell);
        collectible.hue = kind == CollectibleKind::Portal ? portalHue(i) : 0;
        out.push_back(std::move(collectible));
    }
    return out;
}

std::optional<Vec2> MatchSession::resolvePosition(const net::WirePosition &position) const
{
    if (position.pixel)
    {
        return position.pixel;
    }
    if (position.cell)
    {
        return m_mapper.toPixel(*position.cell);
    }
    return std::nullopt;
}

std::optional<Vec2> MatchSession::resolveSpawnPosition(const net::WirePosition &position) const
{
    const auto resolved = resolvePosition(position);
    if (!resolved || m_grid.empty())
    {
        return resolved;
    }
    const Vec2 sanitized = world::sanitizeSpawnPosition(m_grid, *resolved);
    if (sanitized != *resolved)
    {
        recordTelemetry(m_telemetry, "session.spawn_sanitized",
                        {{"x", std::to_string(resolved->x)}, {"y", std::to_string(resolved->y)}});
    }
    return sanitized;
}

void MatchSession::flashScreen(std::uint32_t rgb, float opacity)
{
    m_flash = ScreenFlash{rgb, opacity};
    const std::uint64_t generation = ++m_flashGeneration;
    if (m_flashTimer != 0)
    {
        m_timers.cancel(m_flashTimer);
    }
    m_flashTimer = m_timers.schedule(m_config.timers.screenFlashMs, [this, generation]() {
        if (generation != m_flashGeneration)
        {
            return;
        }
        m_flashTimer = 0;
        m_flash.reset();
    });
}

void MatchSession::routeToLobby(const std::string &reason)
{
    if (m_routedToLobby)
    {
        return;
    }
    m_routedToLobby = true;
    m_lobbyReason = reason;
    m_matchActive = false;
    m_phase.resetToLobby();
    recordTelemetry(m_telemetry, "session.route_to_lobby", {{"reason", reason}});
    m_bus->dispatch(RouteToLobbyEventName, EventContext{RouteToLobbyEvent{reason}});
}

void MatchSession::onPresence(const std::string &playerId, bool connected)
{
    if (RemoteEntity *remote = m_interpolator.find(playerId))
    {
        remote->disconnected = !connected;
    }
}

bool MatchSession::broadcastAllowed() const
{
    return !m_tornDown && m_phase.movementAllowed() && m_reconnection.broadcastAllowed() && m_channel.isConnected();
}

void MatchSession::runPredictor(const MoveIntent &intent, float dt, bool broadcast)
{
    const double huntElapsed = m_phase.huntElapsedMs();
    PredictorInput input;
    input.intent = m_phase.movementAllowed() ? intent : MoveIntent{};
    input.dt = dt;
    input.nowMs = m_timers.nowMs();
    input.elapsedSeconds = huntElapsed / 1000.0;
    input.frozen = m_phase.localState() != LocalState::Active;
    input.broadcastAllowed = broadcast;
    input.forceAnnounce = huntElapsed < kAnnounceWindowMs;

    const PredictorTickResult result = m_predictor.tick(m_grid, input);
    if (result.hazardEntered && !(m_channel.isConnected() && m_reconnection.broadcastAllowed()))
    {
        // Unsent reports stay armed until the room is recovered.
        m_predictor.clearHazardReport();
    }
    else if (result.hazardEntered)
    {
        const Vec2 &position = m_predictor.entity().position;
        send(net::wire::LavaDeath, net::encodeEmpty());
        recordTelemetry(m_telemetry, "predictor.hazard_reported",
                        {{"x", std::to_string(position.x)}, {"y", std::to_string(position.y)}});
    }
    if (result.report)
    {
        send(net::wire::UpdatePosition, net::encodePositionReport(*result.report));
    }
}

void MatchSession::detectPickups(bool broadcast)
{
    if (!broadcast)
    {
        return;
    }
    const Vec2 position = m_predictor.entity().position;
    const CollectibleConfig &radii = m_config.collectibles;

    if (!m_phase.localChaser())
    {
        if (const Collectible *coin = m_collectibles.findWithin(CollectibleKind::Coin, position,
                                                                radii.currencyPickupRadius))
        {
            const std::string id = coin->id;
            m_collectibles.markCollected(CollectibleKind::Coin, id);
            send(net::wire::CollectCoin, net::encodeCollectCoin(id));
        }
    }

    if (m_collectibles.trapInventory() < radii.trapInventoryMax)
    {
        if (const Collectible *trap = m_collectibles.findWithin(CollectibleKind::TrapPickup, position,
                                                                radii.trapPickupRadius))
        {
            const std::string id = trap->id;
            m_collectibles.markCollected(CollectibleKind::TrapPickup, id);
            send(net::wire::CollectSinkTrap, net::encodeCollectTrap(id));
        }
    }

    if (const Collectible *portal = m_collectibles.findWithin(CollectibleKind::Portal, position, radii.portalRadius))
    {
        const std::string id = portal->id;
        if (m_predictor.tryUsePortal())
        {
            send(net::wire::EnterSinkhole, net::encodeEnterSinkhole(id));
            recordTelemetry(m_telemetry, "session.portal_entered", {{"id", id}});
        }
    }
}

MatchFrame MatchSession::buildFrame()
{
    MatchFrame frame;
    frame.grid = m_grid.empty() ? nullptr : &m_grid;
    frame.localId = m_localId;
    frame.local = m_predictor.entity();
    for (const auto &entry : m_interpolator.entities())
    {
        frame.remotes.push_back(entry.second);
    }
    frame.coins = m_collectibles.active(CollectibleKind::Coin);
    frame.trapPickups = m_collectibles.active(CollectibleKind::TrapPickup);
    frame.deployedTraps = m_collectibles.active(CollectibleKind::DeployedTrap);
    frame.portals = m_collectibles.active(CollectibleKind::Portal);
    frame.cues = std::move(m_cues);
    m_cues.clear();
    frame.flash = m_flash;
    frame.phase = m_phase.effectivePhase();
    frame.round = m_phase.roundContext();
    if (m_phase.announcementVisible())
    {
        frame.announcement = m_phase.announcementText();
    }
    frame.quiz = m_quiz;
    frame.connectionLost = m_reconnection.connectionLost();
    frame.penaltyQuizLoading = m_phase.penaltyQuizLoading();
    frame.invulnerable = m_phase.invulnerable();
    frame.localChaser = m_phase.localChaser();
    frame.trapInventory = m_collectibles.trapInventory();
    frame.scores = m_scores;
    frame.stamina = m_predictor.entity().stamina;
    frame.nowMs = m_timers.nowMs();
    return frame;
}

void MatchSession::send(const char *event, const json::JsonValue &payload)
{
    m_channel.send(event, payload);
}

std::string MatchSession::displayName(const std::string &playerId) const
{
    const auto it = m_names.find(playerId);
    if (it == m_names.end() || it->second.empty())
    {
        return playerId;
    }
    return it->second;
}
