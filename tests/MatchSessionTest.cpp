#include "session/MatchSession.h"

#include "net/WireProtocol.h"
#include "persist/ClientStore.h"
#include "world/GridMapper.h"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace
{

/// Channel whose inbound side is driven by the test.
class ScriptedChannel : public net::Channel
{
  public:
    void send(const std::string &event, const json::JsonValue &payload) override
    {
        sent.emplace_back(event, payload);
    }

    bool isConnected() const override { return connected; }

    void push(const std::string &event, const std::string &payloadText)
    {
        deliver(event, json::parseJson(payloadText).value_or(json::makeObject()));
    }

    void setConnected(bool value)
    {
        connected = value;
        notifyConnection(value);
    }

    std::size_t count(const std::string &event) const
    {
        std::size_t total = 0;
        for (const auto &entry : sent)
        {
            if (entry.first == event)
            {
                ++total;
            }
        }
        return total;
    }

    const json::JsonValue *last(const std::string &event) const
    {
        for (auto it = sent.rbegin(); it != sent.rend(); ++it)
        {
            if (it->first == event)
            {
                return &it->second;
            }
        }
        return nullptr;
    }

    bool connected = true;
    std::vector<std::pair<std::string, json::JsonValue>> sent;
};

bool assertTrue(bool condition, const char *message)
{
    if (!condition)
    {
        std::cerr << message << '\n';
        return false;
    }
    return true;
}

const char *kGameStarted =
    R"({"room": {"code": "ABC123", "totalRounds": 2, "mapConfig": {"width": 50, "height": 50, "blockSize": 4,
        "tileSize": 64, "spawnPositions": [{"row": 24, "col": 24}, {"row": 28, "col": 28}]}},
        "gameState": {"unicornIds": ["p2"], "players": [{"id": "p1", "name": "Ann", "coins": 0},
        {"id": "p2", "name": "Bot", "isUnicorn": true, "coins": 0}]}})";

MatchFrame idle(MatchSession &session, double dtMs = 16.0)
{
    return session.tick(MoveIntent{}, dtMs);
}

void joinRoom(MatchSession &session, ScriptedChannel &channel)
{
    session.join("ABC123", "Ann");
    channel.push(net::wire::RoomJoined,
                 R"({"roomCode": "ABC123", "playerId": "p1",
                     "room": {"players": [{"id": "p1", "name": "Ann"}, {"id": "p2", "name": "Bot"}]}})");
    idle(session);
}

void startHunt(MatchSession &session, ScriptedChannel &channel)
{
    joinRoom(session, channel);
    channel.push(net::wire::GameStarted, kGameStarted);
    idle(session);
    channel.push(net::wire::PhaseChange, R"({"phase": "blitz_quiz", "roundInfo": {"currentRound": 1, "totalRounds": 2}})");
    idle(session);
    channel.push(net::wire::HuntStart, R"({"seq": 1, "duration": 30000, "unicornIds": ["p2"],
                                            "roundInfo": {"currentRound": 1, "totalRounds": 2}})");
    idle(session);
}

std::filesystem::path scratchPath(const char *name)
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "qbit_city_session_test";
    std::filesystem::create_directories(dir);
    const std::filesystem::path path = dir / name;
    std::filesystem::remove(path);
    return path;
}

bool testJoinBuildsWorld()
{
    ScriptedChannel channel;
    auto bus = std::make_shared<BasicEventBus>();
    MatchSession session(ClientConfig{}, channel, bus);

    bool success = true;
    session.join("ABC123", "Ann");
    success &= assertTrue(channel.count(net::wire::JoinRoom) == 1, "join should send join_room");
    const json::JsonValue *request = channel.last(net::wire::JoinRoom);
    success &= assertTrue(request && json::getString(*request, "roomCode", "") == "ABC123",
                          "join_room should carry the room code");

    channel.push(net::wire::RoomJoined,
                 R"({"roomCode": "ABC123", "playerId": "p1",
                     "room": {"players": [{"id": "p1", "name": "Ann"}, {"id": "p2", "name": "Bot"}]}})");
    success &= assertTrue(session.localId().empty(), "Inbound messages wait for the next pump");
    idle(session);
    success &= assertTrue(session.localId() == "p1", "room_joined should assign the local id");
    success &= assertTrue(session.reconnection().status() == ReconnectionController::Status::Connected,
                          "A first join should connect directly");
    success &= assertTrue(session.remotes().find("p2") != nullptr, "Room members should become remotes");
    success &= assertTrue(session.remotes().find("p1") == nullptr, "The local player is never a remote");

    channel.push(net::wire::GameStarted, kGameStarted);
    const MatchFrame frame = idle(session);
    success &= assertTrue(session.matchActive(), "game_started should activate the match");
    success &= assertTrue(frame.grid != nullptr && frame.grid->width() == 50 && frame.grid->height() == 50,
                          "The world should be generated from the map config");
    success &= assertTrue(!session.grid().portals().empty(), "Generated world should carry portals");
    success &= assertTrue(session.collectibles().activeCount(CollectibleKind::Portal) ==
                              session.grid().portals().size(),
                          "Every generated portal should be spawned as a collectible");
    success &= assertTrue(frame.phase == GamePhase::Lobby, "The match waits for the first phase change");
    success &= assertTrue(frame.round.totalRounds == 2, "Round count should come from the room");

    const world::GridMapper mapper(64);
    const Vec2 expected = mapper.toPixel(world::sanitizeSpawnCell(session.grid(), {24, 24}));
    success &= assertTrue(session.predictor().entity().position == expected,
                          "Local player should start on its spawn slot");
    const RemoteEntity *bot = session.remotes().find("p2");
    success &= assertTrue(bot != nullptr && bot->chaser, "The chaser flag should be applied to remotes");
    return success;
}

bool testQuizPromptAfterPhaseChange()
{
    ScriptedChannel channel;
    auto bus = std::make_shared<BasicEventBus>();
    MatchSession session(ClientConfig{}, channel, bus);
    joinRoom(session, channel);
    channel.push(net::wire::GameStarted, kGameStarted);
    idle(session);

    std::vector<GamePhase> phases;
    auto token = bus->subscribe(PhaseChangedEventName, [&](const EventContext &ctx) {
        if (const auto *change = eventPayload<PhaseChangedEvent>(ctx))
        {
            phases.push_back(change->current);
        }
    });

    channel.push(net::wire::PhaseChange, R"({"phase": "blitz_quiz", "roundInfo": {"currentRound": 1, "totalRounds": 2}})");
    channel.push(net::wire::BlitzStart, R"({"seq": 1, "timeLimit": 5000, "question": {"id": "q1",
                                             "question": "What is 7 x 8?", "options": ["54", "56", "58", "64"]}})");
    idle(session);
    MatchFrame frame = idle(session);

    bool success = true;
    success &= assertTrue(frame.phase == GamePhase::Quiz, "Phase change should open the quiz");
    success &= assertTrue(phases.size() == 1 && phases[0] == GamePhase::Quiz, "Quiz should be announced once");
    success &= assertTrue(frame.quiz && frame.quiz->question == "What is 7 x 8?" && frame.quiz->options.size() == 4,
                          "The question should attach to the quiz the phase change opened");
    success &= assertTrue(!session.answerQuiz(4), "Out of range answers are rejected");
    success &= assertTrue(session.answerQuiz(1), "A valid answer should be sent");
    success &= assertTrue(!session.answerQuiz(1), "Only one answer per quiz");
    success &= assertTrue(channel.count(net::wire::BlitzAnswer) == 1, "Exactly one blitz_answer");

    channel.push(net::wire::HuntStart, R"({"seq": 1, "duration": 30000, "unicornIds": ["p2"]})");
    frame = idle(session);
    success &= assertTrue(frame.phase == GamePhase::Hunt, "hunt_start should open the hunt");
    success &= assertTrue(!frame.quiz, "Leaving the quiz clears the prompt");
    success &= assertTrue(session.collectibles().activeCount(CollectibleKind::Portal) == 0,
                          "Portals close when the hunt starts");
    success &= assertTrue(frame.announcement == "Chaser: Bot", "Hunt start should name the chaser");
    return success;
}

bool testHuntPickupsAndPenalty()
{
    ScriptedChannel channel;
    auto bus = std::make_shared<BasicEventBus>();
    MatchSession session(ClientConfig{}, channel, bus);
    startHunt(session, channel);

    bool success = true;
    success &= assertTrue(session.phase().globalPhase() == GamePhase::Hunt, "Match should be in the hunt");

    const world::GridMapper mapper(64);
    const world::GridCell cell = mapper.toGrid(session.predictor().entity().position);
    const std::string coins = "{\"coins\": [{\"coinId\": \"c1\", \"row\": " + std::to_string(cell.row) +
                              ", \"col\": " + std::to_string(cell.col) + "}]}";
    channel.push(net::wire::CoinSpawned, coins);
    idle(session);

    const json::JsonValue *collect = channel.last(net::wire::CollectCoin);
    success &= assertTrue(collect && json::getString(*collect, "coinId", "") == "c1",
                          "Standing on a coin should request collect_coin");
    success &= assertTrue(session.collectibles().activeCount(CollectibleKind::Coin) == 0,
                          "Collection is applied optimistically");
    idle(session);
    success &= assertTrue(channel.count(net::wire::CollectCoin) == 1, "A coin is requested once");

    channel.push(net::wire::CoinCollected, R"({"coinId": "c1", "playerId": "p1", "newScore": 1})");
    idle(session);
    success &= assertTrue(session.scores().at("p1") == 1, "Confirmed collection should update the score");

    channel.push(net::wire::PlayerTagged, R"({"unicornId": "p2", "caughtId": "p1", "coinsGained": 1})");
    MatchFrame frame = idle(session);
    success &= assertTrue(frame.flash && frame.flash->rgb == 0xff3b30, "Being tagged should flash red");
    success &= assertTrue(session.scores().at("p2") == 1, "The chaser gains the coins");
    frame = idle(session, 300.0);
    success &= assertTrue(!frame.flash, "Flash should clear after its duration");

    channel.push(net::wire::PlayerStateChange, R"({"playerId": "p1", "state": "frozen"})");
    frame = idle(session);
    success &= assertTrue(frame.phase == GamePhase::FrozenLocal, "Local freeze should override the hunt");
    success &= assertTrue(frame.penaltyQuizLoading, "Penalty quiz is loading while frozen");
    success &= assertTrue(!session.deployTrap(), "Frozen players cannot deploy traps");
    idle(session, 3000.0);
    success &= assertTrue(channel.count(net::wire::RequestUnfreezeQuiz) == 1,
                          "Missing quiz content should be requested after the fallback delay");

    channel.push(net::wire::UnfreezeQuizStart,
                 R"({"questions": [{"question": "2 + 2?", "options": ["3", "4", "5", "6"]}],
                     "totalQuestions": 1, "passThreshold": 1})");
    idle(session);
    success &= assertTrue(session.answerPenalty(0, 1), "Penalty answers are accepted once content arrived");
    channel.push(net::wire::UnfreezeQuizComplete, R"({"passed": true})");
    frame = idle(session);
    success &= assertTrue(frame.phase == GamePhase::Hunt, "Passing the penalty quiz thaws the player");
    success &= assertTrue(frame.invulnerable, "A pass grants invulnerability");
    return success;
}

bool testReconnectRejoinsAndSyncs()
{
    ScriptedChannel channel;
    auto bus = std::make_shared<BasicEventBus>();
    MatchSession session(ClientConfig{}, channel, bus);
    startHunt(session, channel);

    bool success = true;
    channel.setConnected(false);
    MatchFrame frame = idle(session);
    success &= assertTrue(frame.connectionLost, "Losing the channel should be surfaced");
    success &= assertTrue(session.reconnection().status() == ReconnectionController::Status::Lost,
                          "Controller should be in the lost state");

    channel.setConnected(true);
    idle(session);
    success &= assertTrue(channel.count(net::wire::JoinRoom) == 2, "Restored channel should rejoin the room");
    const json::JsonValue *rejoin = channel.last(net::wire::JoinRoom);
    success &= assertTrue(rejoin && json::getString(*rejoin, "playerId", "") == "p1",
                          "Rejoin should reuse the assigned player id");
    success &= assertTrue(!session.deployTrap(), "No broadcasts while rejoining");

    channel.push(net::wire::RoomJoined, R"({"roomCode": "ABC123", "playerId": "p1"})");
    idle(session);
    success &= assertTrue(channel.count(net::wire::GetGameState) == 1, "Rejoin should request a snapshot");
    success &= assertTrue(session.reconnection().status() == ReconnectionController::Status::Syncing,
                          "Controller should wait for the snapshot");

    channel.push(net::wire::GameStateSync,
                 R"({"gameState": {"seq": 1, "phase": "hunt", "currentRound": 1, "totalRounds": 2,
                     "unicornIds": ["p2"],
                     "players": [{"id": "p1", "name": "Ann", "coins": 1},
                                 {"id": "p2", "name": "Bot", "isUnicorn": true, "coins": 3,
                                  "position": {"row": 20, "col": 24}}],
                     "coins": [{"coinId": "c2", "row": 20, "col": 24}, {"coinId": "c3", "row": 28, "col": 20}],
                     "sinkholes": [], "sinkTraps": [], "deployedSinkTraps": []}})");
    frame = idle(session);
    success &= assertTrue(session.reconnection().status() == ReconnectionController::Status::Connected,
                          "Snapshot should complete the recovery");
    success &= assertTrue(!frame.connectionLost, "Banner should clear after recovery");
    success &= assertTrue(frame.phase == GamePhase::Hunt, "Snapshot keeps the running hunt");
    success &= assertTrue(session.collectibles().activeCount(CollectibleKind::Coin) == 2,
                          "Snapshot should replace the coin set");
    success &= assertTrue(session.scores().at("p2") == 3, "Snapshot should replace the scores");
    return success;
}

bool testGameEndRecordsAndReturnsToLobby()
{
    ScriptedChannel channel;
    auto bus = std::make_shared<BasicEventBus>();
    ClientStore store(scratchPath("store.json"), 5);
    MatchSession session(ClientConfig{}, channel, bus, nullptr, &store);

    std::vector<std::string> reasons;
    auto token = bus->subscribe(RouteToLobbyEventName, [&](const EventContext &ctx) {
        if (const auto *route = eventPayload<RouteToLobbyEvent>(ctx))
        {
            reasons.push_back(route->reason);
        }
    });

    joinRoom(session, channel);
    channel.push(net::wire::GameStarted, kGameStarted);
    idle(session);
    const double startedAt = session.timers().nowMs();
    channel.push(net::wire::HuntStart, R"({"seq": 1, "duration": 30000, "unicornIds": ["p2"]})");
    idle(session, 1000.0);
    idle(session, 1000.0);
    channel.push(net::wire::HuntEnd, R"({"seq": 1, "reason": "timeout"})");
    channel.push(net::wire::GameEnd, R"({"seq": 1, "totalRounds": 2, "leaderboard": [
                                          {"playerId": "p2", "name": "Bot", "coins": 2},
                                          {"playerId": "p1", "name": "Ann", "coins": 1}]})");
    MatchFrame frame = idle(session);
    const double endedAt = session.timers().nowMs();

    bool success = true;
    success &= assertTrue(frame.phase == GamePhase::GameEnd, "game_end should end the match");
    success &= assertTrue(!session.matchActive(), "Match should no longer be active");
    success &= assertTrue(session.scores().at("p2") == 2, "Final leaderboard should be applied");
    const auto &board = store.data().leaderboard;
    success &= assertTrue(board.size() == 1 && board[0].name == "Ann", "A local leaderboard entry is recorded");
    success &= assertTrue(!board.empty() && std::abs(board[0].timeSurvived - (endedAt - startedAt) / 1000.0) < 1e-6,
                          "Entry should carry the match duration in seconds");

    channel.push(net::wire::RoomLeft, R"({"roomCode": "ABC123", "reason": "game_ended"})");
    idle(session);
    success &= assertTrue(!session.routedToLobby(), "A finished game lingers before returning");
    idle(session, 1000.0);
    success &= assertTrue(!session.routedToLobby(), "Still lingering halfway");
    idle(session, 1000.0);
    success &= assertTrue(session.routedToLobby(), "Lobby return after the linger delay");
    success &= assertTrue(reasons.size() == 1 && reasons[0] == "room_closed", "Route reason should be room_closed");
    success &= assertTrue(!store.hasRoomIdentity(), "Closed room is forgotten");

    ClientStore reloaded(store.path(), 5);
    success &= assertTrue(reloaded.load().success && reloaded.data().leaderboard.size() == 1,
                          "Leaderboard entry should be saved to disk");
    return success;
}

bool testRoomLeftRoutesImmediately()
{
    ScriptedChannel channel;
    auto bus = std::make_shared<BasicEventBus>();
    MatchSession session(ClientConfig{}, channel, bus);

    std::vector<std::string> reasons;
    auto token = bus->subscribe(RouteToLobbyEventName, [&](const EventContext &ctx) {
        if (const auto *route = eventPayload<RouteToLobbyEvent>(ctx))
        {
            reasons.push_back(route->reason);
        }
    });

    startHunt(session, channel);
    channel.push(net::wire::RoomLeft, R"({"roomCode": "ABC123", "reason": "kicked"})");
    const MatchFrame frame = idle(session);

    bool success = true;
    success &= assertTrue(session.routedToLobby(), "Other leave reasons route at once");
    success &= assertTrue(reasons.size() == 1 && reasons[0] == "kicked", "Route reason should be forwarded");
    success &= assertTrue(session.lobbyReason() == "kicked", "Session should remember the route reason");
    success &= assertTrue(frame.phase == GamePhase::Lobby, "Phase returns to the lobby");
    success &= assertTrue(!session.matchActive(), "Match is no longer active");
    return success;
}

bool testTeardownDropsPendingEvents()
{
    ScriptedChannel channel;
    auto bus = std::make_shared<BasicEventBus>();
    MatchSession session(ClientConfig{}, channel, bus);
    startHunt(session, channel);

    channel.push(net::wire::PlayerJoined, R"({"player": {"id": "p9", "name": "Late"}})");
    session.teardown();
    bus->pump();

    bool success = true;
    success &= assertTrue(session.tornDown(), "Session should be torn down");
    success &= assertTrue(session.remotes().find("p9") == nullptr, "Pending inbound events are discarded");
    success &= assertTrue(bus->pendingCount() == 0, "Bus queue should be empty");
    success &= assertTrue(session.timers().pendingCount() == 0, "All timers are cancelled");

    channel.push(net::wire::PlayerJoined, R"({"player": {"id": "p10", "name": "Later"}})");
    success &= assertTrue(bus->pendingCount() == 0, "Channel is detached from the bus");
    idle(session);
    success &= assertTrue(session.remotes().find("p10") == nullptr, "Nothing is applied after teardown");
    return success;
}

bool testHuntClockUpdatesKeepTheHunt()
{
    ScriptedChannel channel;
    auto bus = std::make_shared<BasicEventBus>();
    MatchSession session(ClientConfig{}, channel, bus);
    startHunt(session, channel);

    bool success = true;
    idle(session, 5000.0);
    channel.push(net::wire::HuntEnd, R"({"remainingTime": 25000, "endTime": 1700000030000})");
    MatchFrame frame = idle(session);
    success &= assertTrue(frame.phase == GamePhase::Hunt, "A clock update must not end the hunt");
    success &= assertTrue(frame.round.clockRemainingMs == 25000.0, "Clock should show the server's remaining time");
    frame = idle(session, 1000.0);
    success &= assertTrue(frame.round.clockRemainingMs == 24000.0, "Clock keeps counting down locally");

    channel.push(net::wire::HuntEnd, R"({"reason": "unicorn_disconnected", "message": "The chaser left"})");
    frame = idle(session);
    success &= assertTrue(frame.phase == GamePhase::RoundEnd, "A hunt end without remaining time ends the round");
    return success;
}

bool testGameEndAfterPhaseChange()
{
    ScriptedChannel channel;
    auto bus = std::make_shared<BasicEventBus>();
    ClientStore store(scratchPath("store_phase_first.json"), 5);
    MatchSession session(ClientConfig{}, channel, bus, nullptr, &store);
    startHunt(session, channel);

    channel.push(net::wire::PhaseChange, R"({"phase": "game_end", "roundInfo": {"currentRound": 2}})");
    MatchFrame frame = idle(session);

    bool success = true;
    success &= assertTrue(frame.phase == GamePhase::GameEnd, "phase_change should open the game end");
    success &= assertTrue(store.data().leaderboard.empty(), "Nothing is recorded before the standings arrive");

    const char *standings = R"({"totalRounds": 2, "leaderboard": [
                                 {"playerId": "p2", "name": "Bot", "coins": 7},
                                 {"playerId": "p1", "name": "Ann", "coins": 1}]})";
    channel.push(net::wire::GameEnd, standings);
    frame = idle(session);
    success &= assertTrue(frame.phase == GamePhase::GameEnd, "Still in the game end");
    success &= assertTrue(session.scores().at("p2") == 7, "Unnumbered game_end should apply the final leaderboard");
    success &= assertTrue(!session.matchActive(), "Match should no longer be active");
    success &= assertTrue(store.data().leaderboard.size() == 1, "The local leaderboard entry is recorded");

    channel.push(net::wire::GameEnd, standings);
    idle(session);
    success &= assertTrue(store.data().leaderboard.size() == 1, "A repeated game_end records nothing more");
    return success;
}

bool testLavaReportedOncePerLife()
{
    ScriptedChannel channel;
    auto bus = std::make_shared<BasicEventBus>();
    MatchSession session(ClientConfig{}, channel, bus);
    startHunt(session, channel);

    // The map border is lava.
    const char *intoLava = R"({"playerId": "p1", "toPosition": {"x": 32, "y": 32}})";
    channel.push(net::wire::PlayerTeleported, intoLava);
    for (int i = 0; i < 10; ++i)
    {
        idle(session);
    }

    bool success = true;
    success &= assertTrue(channel.count(net::wire::LavaDeath) == 1, "Ten ticks in lava report one death");

    channel.push(net::wire::PlayerRespawn, R"({"playerId": "p1", "position": {"row": 24, "col": 24}})");
    idle(session);
    success &= assertTrue(channel.count(net::wire::LavaDeath) == 1, "Respawn lands on safe ground");
    channel.push(net::wire::PlayerTeleported, intoLava);
    for (int i = 0; i < 10; ++i)
    {
        idle(session);
    }
    success &= assertTrue(channel.count(net::wire::LavaDeath) == 2, "Respawn re-arms the lava report");
    return success;
}

bool testLavaWhileOfflineIsReportedLater()
{
    ScriptedChannel channel;
    auto bus = std::make_shared<BasicEventBus>();
    MatchSession session(ClientConfig{}, channel, bus);
    startHunt(session, channel);

    channel.setConnected(false);
    channel.push(net::wire::PlayerTeleported, R"({"playerId": "p1", "toPosition": {"x": 32, "y": 32}})");
    for (int i = 0; i < 3; ++i)
    {
        idle(session);
    }

    bool success = true;
    success &= assertTrue(channel.count(net::wire::LavaDeath) == 0, "Nothing is sent while offline");
    success &= assertTrue(!session.predictor().hazardReported(), "An unsent report stays armed");

    channel.setConnected(true);
    idle(session);
    channel.push(net::wire::RoomJoined, R"({"roomCode": "ABC123", "playerId": "p1"})");
    idle(session);
    success &= assertTrue(channel.count(net::wire::LavaDeath) == 0, "Nothing is sent before the room is recovered");
    channel.push(net::wire::GameStateSync,
                 R"({"gameState": {"seq": 1, "phase": "hunt", "currentRound": 1, "totalRounds": 2,
                     "unicornIds": ["p2"],
                     "players": [{"id": "p1", "name": "Ann", "coins": 0},
                                 {"id": "p2", "name": "Bot", "isUnicorn": true, "coins": 0}],
                     "coins": [], "sinkholes": [], "sinkTraps": [], "deployedSinkTraps": []}})");
    for (int i = 0; i < 10; ++i)
    {
        idle(session);
    }
    success &= assertTrue(channel.count(net::wire::LavaDeath) == 1, "Lava entered offline is reported once back");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testJoinBuildsWorld();
    success &= testQuizPromptAfterPhaseChange();
    success &= testHuntPickupsAndPenalty();
    success &= testReconnectRejoinsAndSyncs();
    success &= testGameEndRecordsAndReturnsToLobby();
    success &= testHuntClockUpdatesKeepTheHunt();
    success &= testGameEndAfterPhaseChange();
    success &= testLavaReportedOncePerLife();
    success &= testLavaWhileOfflineIsReportedLater();
    success &= testRoomLeftRoutesImmediately();
    success &= testTeardownDropsPendingEvents();
    return success ? 0 : 1;
}
