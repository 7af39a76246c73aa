#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/Vec2.h"
#include "world/WorldGrid.h"

namespace net
{

/// A position as the server sends it: pixels when known, grid cell as fallback or companion.
struct WirePosition
{
    std::optional<Vec2> pixel;
    std::optional<world::GridCell> cell;
};

struct RoundInfo
{
    int currentRound = 0;
    int totalRounds = 0;
};

struct MapConfig
{
    int width = 0;
    int height = 0;
    int blockSize = 0;
    int tileSize = 0;
    std::vector<world::GridCell> spawnSlots;
};

struct PlayerInfo
{
    std::string id;
    std::string name;
    bool chaser = false;
    std::string state;
    int coins = 0;
    int trapInventory = 0;
    WirePosition position;
};

struct ItemSpawn
{
    std::optional<std::string> id;
    world::GridCell cell;
    std::optional<Vec2> pixel;
};

struct ScoreEntry
{
    std::string id;
    std::string name;
    int coins = 0;
};

struct RoomJoined
{
    std::string roomCode;
    std::string playerId;
    std::vector<PlayerInfo> players;
};

struct JoinError
{
    std::string message;
};

struct RoomLeft
{
    std::string roomCode;
    std::string reason;
};

struct PlayerJoined
{
    PlayerInfo player;
};

struct PlayerLeft
{
    std::string playerId;
};

struct GameStarted
{
    std::string roomCode;
    MapConfig mapConfig;
    std::vector<PlayerInfo> players;
    std::vector<std::string> chaserIds;
    int totalRounds = 0;
};

struct PositionUpdate
{
    std::string playerId;
    WirePosition position;
};

struct PhaseChange
{
    std::string phase;
    std::optional<int> seq;
    std::optional<RoundInfo> roundInfo;
};

struct QuizStart
{
    std::optional<int> seq;
    std::string questionId;
    std::string question;
    std::vector<std::string> options;
    double timeLimitMs = 0.0;
};

struct RoleTransfer
{
    std::vector<std::string> chaserIds;
    std::string reason;
};

struct HuntStart
{
    std::optional<int> seq;
    std::optional<RoundInfo> roundInfo;
    double durationMs = 0.0;
    std::vector<std::string> chaserIds;
};

/// Also sent periodically during a hunt with remainingMs set, as a clock update.
struct HuntEnd
{
    std::optional<int> seq;
    std::optional<RoundInfo> roundInfo;
    std::optional<double> remainingMs;
    std::string reason;
};

struct PlayerTagged
{
    std::string chaserId;
    std::string caughtId;
    int coinsGained = 0;
};

struct PlayerStateChange
{
    std::string playerId;
    std::string state;
    std::optional<bool> invulnerable;
};

struct PlayerRespawn
{
    std::string playerId;
    WirePosition position;
    bool invulnerable = false;
};

struct ItemsSpawned
{
    std::vector<ItemSpawn> items;
};

struct CoinCollected
{
    std::optional<std::string> coinId;
    std::optional<world::GridCell> cell;
    std::string playerId;
    std::optional<int> newScore;
    std::vector<ScoreEntry> leaderboard;
};

struct TrapCollected
{
    std::optional<std::string> trapId;
    std::optional<world::GridCell> cell;
    std::string playerId;
    std::optional<int> newInventoryCount;
};

struct TrapDeployed
{
    std::optional<std::string> trapId;
    WirePosition position;
    std::string playerId;
    std::optional<int> newInventoryCount;
};

struct TrapTriggered
{
    std::optional<std::string> trapId;
    std::string chaserId;
    WirePosition from;
    WirePosition to;
};

struct PlayerTeleported
{
    std::string playerId;
    WirePosition from;
    WirePosition to;
};

struct PenaltyQuizStart
{
    int questionCount = 0;
    int passThreshold = 0;
};

struct PenaltyQuizComplete
{
    bool passed = false;
    bool retry = false;
};

struct PenaltyQuizCancelled
{
    std::string reason;
};

struct GameEnd
{
    std::optional<int> seq;
    int totalRounds = 0;
    std::vector<ScoreEntry> leaderboard;
};

struct PlayerPresence
{
    std::string playerId;
};

/// Full authoritative state dump. A null gameState decodes to an empty optional.
struct Snapshot
{
    std::optional<int> seq;
    std::optional<std::string> phase;
    std::optional<int> currentRound;
    int totalRounds = 0;
    std::vector<PlayerInfo> players;
    std::vector<std::string> chaserIds;
    std::vector<ScoreEntry> leaderboard;
    std::vector<ItemSpawn> coins;
    std::vector<ItemSpawn> portals;
    std::vector<ItemSpawn> trapPickups;
    std::vector<ItemSpawn> deployedTraps;
    std::vector<std::string> frozenWithQuiz;
};

struct GameStateSync
{
    std::optional<Snapshot> snapshot;
};

} // namespace net
