#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/ClientConfig.h"
#include "events/EventBus.h"
#include "events/MatchEvents.h"
#include "match/CollectibleStore.h"
#include "match/GamePhase.h"
#include "match/PhaseStateMachine.h"
#include "match/TimerScheduler.h"
#include "motion/LocalPredictor.h"
#include "motion/RemoteInterpolator.h"
#include "net/Channel.h"
#include "net/ServerEvents.h"
#include "session/ReconnectionController.h"
#include "telemetry/TelemetrySink.h"
#include "world/GridMapper.h"
#include "world/WorldGrid.h"

class ClientStore;

enum class VisualCueKind
{
    TeleportOut,
    TeleportIn,
    Respawn
};

struct VisualCue
{
    VisualCueKind kind = VisualCueKind::Respawn;
    Vec2 position;
    std::string playerId;
};

struct ScreenFlash
{
    std::uint32_t rgb = 0xffffff;
    float opacity = 0.0f;
};

struct QuizPrompt
{
    std::string questionId;
    std::string question;
    std::vector<std::string> options;
    double timeLimitMs = 0.0;
};

/// Everything the renderer needs for one frame. Cues are drained into exactly one frame.
struct MatchFrame
{
    const world::WorldGrid *grid = nullptr;
    std::string localId;
    LocalEntity local;
    std::vector<RemoteEntity> remotes;
    std::vector<Collectible> coins;
    std::vector<Collectible> trapPickups;
    std::vector<Collectible> deployedTraps;
    std::vector<Collectible> portals;
    std::vector<VisualCue> cues;
    std::optional<ScreenFlash> flash;
    GamePhase phase = GamePhase::Lobby;
    RoundContext round;
    std::string announcement;
    std::optional<QuizPrompt> quiz;
    bool connectionLost = false;
    bool penaltyQuizLoading = false;
    bool invulnerable = false;
    bool localChaser = false;
    int trapInventory = 0;
    std::map<std::string, int> scores;
    float stamina = 0.0f;
    double nowMs = 0.0;
};

/// Per-room context. Owns the grid, the motion and match components and every subscription and timer
/// they use. Inbound messages are queued on the event bus by the channel and applied during tick().
class MatchSession
{
  public:
    MatchSession(ClientConfig config, net::Channel &channel, std::shared_ptr<EventBus> bus,
                 std::shared_ptr<TelemetrySink> telemetry = nullptr, ClientStore *store = nullptr);
    ~MatchSession();

    MatchSession(const MatchSession &) = delete;
    MatchSession &operator=(const MatchSession &) = delete;

    void join(const std::string &roomCode, const std::string &playerName);
    /// Rejoins the room persisted by an earlier run. Returns false when nothing was stored.
    bool rejoinStored();
    void leave();
    /// Cancels timers, drops subscriptions and discards inbound events that were never pumped.
    void teardown();

    /// pump() then simulate().
    MatchFrame tick(const MoveIntent &intent, double dtMs);
    /// Advances the timer clock, polls the channel and applies queued inbound events.
    void pump(double dtMs);
    /// Prediction, pickups, interpolation and pruning. Builds the frame.
    MatchFrame simulate(const MoveIntent &intent, double dtMs);

    bool deployTrap();
    bool answerQuiz(int answerIndex);
    bool answerPenalty(int questionIndex, int answerIndex);

    [[nodiscard]] bool matchActive() const noexcept { return m_matchActive; }
    [[nodiscard]] bool routedToLobby() const noexcept { return m_routedToLobby; }
    /// Why the session routed to the lobby. Empty until it has.
    const std::string &lobbyReason() const { return m_lobbyReason; }
    [[nodiscard]] bool tornDown() const noexcept { return m_tornDown; }
    const std::string &localId() const { return m_localId; }
    const std::string &roomCode() const { return m_roomCode; }

    const world::WorldGrid &grid() const { return m_grid; }
    const LocalPredictor &predictor() const { return m_predictor; }
    const RemoteInterpolator &remotes() const { return m_interpolator; }
    const CollectibleStore &collectibles() const { return m_collectibles; }
    const PhaseStateMachine &phase() const { return m_phase; }
    const ReconnectionController &reconnection() const { return m_reconnection; }
    const TimerScheduler &timers() const { return m_timers; }
    const std::map<std::string, int> &scores() const { return m_scores; }

  private:
    void subscribe();
    void handleInbound(const InboundMessageEvent &message);
    void handleConnection(bool connected);

    void onRoomJoined(const net::RoomJoined &joined);
    void onJoinError(const net::JoinError &error);
    void onRoomLeft(const net::RoomLeft &left);
    void onPlayerJoined(const net::PlayerJoined &joined);
    void onPlayerLeft(const net::PlayerLeft &left);
    void onGameStarted(const net::GameStarted &started);
    void onPositionUpdate(const net::PositionUpdate &update);
    void onQuizStart(const net::QuizStart &quiz);
    void onHuntStart(const net::HuntStart &hunt);
    void onPlayerTagged(const net::PlayerTagged &tagged);
    void onPlayerStateChange(const net::PlayerStateChange &change);
    void onPlayerRespawn(const net::PlayerRespawn &respawn);
    void onItemsSpawned(CollectibleKind kind, const net::ItemsSpawned &spawned);
    void onCoinCollected(const net::CoinCollected &collected);
    void onTrapCollected(const net::TrapCollected &collected);
    void onTrapDeployed(const net::TrapDeployed &deployed);
    void onTrapTriggered(const net::TrapTriggered &triggered);
    void onPlayerTeleported(const net::PlayerTeleported &teleported);
    void onGameEnd(const net::GameEnd &end);
    void onGameStateSync(const net::GameStateSync &sync);
    void onPresence(const std::string &playerId, bool connected);

    void applySnapshot(const net::Snapshot &snapshot);
    void applyPlayer(const net::PlayerInfo &player);
    void applyLeaderboard(const std::vector<net::ScoreEntry> &leaderboard);
    std::vector<Collectible> toCollectibles(CollectibleKind kind, const std::vector<net::ItemSpawn> &items) const;
    void regenerateWorld(const std::string &seed, const net::MapConfig &mapConfig);

    std::optional<Vec2> resolvePosition(const net::WirePosition &position) const;
    std::optional<Vec2> resolveSpawnPosition(const net::WirePosition &position) const;
    void relocate(const std::string &playerId, const Vec2 &from, const Vec2 &to);
    void flashScreen(std::uint32_t rgb, float opacity);
    void routeToLobby(const std::string &reason);
    void recordLeaderboardEntry();

    void runPredictor(const MoveIntent &intent, float dt, bool broadcast);
    void detectPickups(bool broadcast);
    bool broadcastAllowed() const;
    MatchFrame buildFrame();
    void send(const char *event, const json::JsonValue &payload);
    std::string displayName(const std::string &playerId) const;

    ClientConfig m_config;
    net::Channel &m_channel;
    std::shared_ptr<EventBus> m_bus;
    std::shared_ptr<TelemetrySink> m_telemetry;
    ClientStore *m_store = nullptr;

    TimerScheduler m_timers;
    world::WorldGrid m_grid;
    world::GridMapper m_mapper;
    LocalPredictor m_predictor;
    RemoteInterpolator m_interpolator;
    CollectibleStore m_collectibles;
    PhaseStateMachine m_phase;
    ReconnectionController m_reconnection;

    EventBus::SubscriptionToken m_inboundToken;
    EventBus::SubscriptionToken m_connectionToken;

    std::string m_roomCode;
    std::string m_playerName;
    std::string m_localId;
    std::string m_lobbyReason;
    std::map<std::string, std::string> m_names;
    std::map<std::string, int> m_scores;
    std::optional<QuizPrompt> m_quiz;
    std::vector<VisualCue> m_cues;
    std::optional<ScreenFlash> m_flash;
    std::uint64_t m_flashGeneration = 0;
    TimerScheduler::TimerId m_flashTimer = 0;
    TimerScheduler::TimerId m_lobbyTimer = 0;
    double m_matchStartedAtMs = 0.0;
    bool m_matchActive = false;
    bool m_routedToLobby = false;
    bool m_tornDown = false;
};
