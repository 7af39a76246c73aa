#include "net/WireCodec.h"

#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <utility>

namespace net
{

namespace
{

using json::JsonValue;

bool isObject(const JsonValue &value)
{
    return value.type == JsonValue::Type::Object;
}

/// Ids arrive as strings from current servers and as numbers from older ones.
std::optional<std::string> readId(const JsonValue &obj, const std::string &key)
{
    const JsonValue *value = json::getObjectField(obj, key);
    if (!value)
    {
        return std::nullopt;
    }
    if (value->type == JsonValue::Type::String && !value->string.empty())
    {
        return value->string;
    }
    if (value->type == JsonValue::Type::Number && std::isfinite(value->number))
    {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.0f", value->number);
        return std::string(buffer);
    }
    return std::nullopt;
}

std::optional<std::string> readFirstId(const JsonValue &obj, std::initializer_list<const char *> keys)
{
    for (const char *key : keys)
    {
        if (auto id = readId(obj, key))
        {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<int> readOptionalInt(const JsonValue &obj, const std::string &key)
{
    if (!json::hasNumber(obj, key))
    {
        return std::nullopt;
    }
    return static_cast<int>(std::lround(json::getDouble(obj, key, 0.0)));
}

std::optional<world::GridCell> readCell(const JsonValue &obj)
{
    if (!json::hasNumber(obj, "row") || !json::hasNumber(obj, "col"))
    {
        return std::nullopt;
    }
    return world::GridCell{static_cast<int>(std::floor(json::getDouble(obj, "row", 0.0))),
                           static_cast<int>(std::floor(json::getDouble(obj, "col", 0.0)))};
}

WirePosition readPosition(const JsonValue &obj)
{
    WirePosition position;
    if (json::hasNumber(obj, "x") && json::hasNumber(obj, "y"))
    {
        position.pixel = Vec2{json::getNumber(obj, "x", 0.0f), json::getNumber(obj, "y", 0.0f)};
    }
    position.cell = readCell(obj);
    return position;
}

bool hasAnyPosition(const WirePosition &position)
{
    return position.pixel.has_value() || position.cell.has_value();
}

std::optional<WirePosition> readNestedPosition(const JsonValue &obj, const std::string &key)
{
    const JsonValue *value = json::getObjectField(obj, key);
    if (!value || !isObject(*value))
    {
        return std::nullopt;
    }
    WirePosition position = readPosition(*value);
    if (!hasAnyPosition(position))
    {
        return std::nullopt;
    }
    return position;
}

std::optional<RoundInfo> readRoundInfo(const JsonValue &obj)
{
    const JsonValue *value = json::getObjectField(obj, "roundInfo");
    if (!value || !isObject(*value) || !json::hasNumber(*value, "currentRound"))
    {
        return std::nullopt;
    }
    RoundInfo info;
    info.currentRound = json::getInt(*value, "currentRound", 0);
    info.totalRounds = json::getInt(*value, "totalRounds", 0);
    return info;
}

/// Chaser ids: the list field wins, the legacy single id is the fallback.
std::vector<std::string> readChaserIds(const JsonValue &obj, const char *listKey, const char *singleKey)
{
    std::vector<std::string> ids;
    if (const JsonValue *list = json::getObjectField(obj, listKey))
    {
        if (list->type == JsonValue::Type::Array)
        {
            for (const JsonValue &entry : list->array)
            {
                if (entry.type == JsonValue::Type::String && !entry.string.empty())
                {
                    ids.push_back(entry.string);
                }
            }
            return ids;
        }
    }
    if (auto single = readId(obj, singleKey))
    {
        ids.push_back(*single);
    }
    return ids;
}

bool hasChaserField(const JsonValue &obj, const char *listKey, const char *singleKey)
{
    const JsonValue *list = json::getObjectField(obj, listKey);
    if (list && list->type == JsonValue::Type::Array)
    {
        return true;
    }
    return readId(obj, singleKey).has_value();
}

std::optional<PlayerInfo> readPlayer(const JsonValue &obj)
{
    if (!isObject(obj))
    {
        return std::nullopt;
    }
    auto id = readFirstId(obj, {"id", "playerId"});
    if (!id)
    {
        return std::nullopt;
    }
    PlayerInfo player;
    player.id = *id;
    player.name = json::getString(obj, "name", "");
    player.chaser = json::getBool(obj, "isUnicorn", false);
    player.state = json::getString(obj, "state", "active");
    player.coins = json::getInt(obj, "coins", 0);
    player.trapInventory = json::getInt(obj, "sinkInventory", 0);
    if (auto position = readNestedPosition(obj, "position"))
    {
        player.position = *position;
    }
    return player;
}

std::vector<PlayerInfo> readPlayers(const JsonValue &obj, const std::string &key)
{
    std::vector<PlayerInfo> players;
    const JsonValue *list = json::getObjectField(obj, key);
    if (!list || list->type != JsonValue::Type::Array)
    {
        return players;
    }
    for (const JsonValue &entry : list->array)
    {
        if (auto player = readPlayer(entry))
        {
            players.push_back(std::move(*player));
        }
    }
    return players;
}

std::optional<ItemSpawn> readItem(const JsonValue &obj, const std::string &idKey)
{
    if (!isObject(obj))
    {
        return std::nullopt;
    }
    auto cell = readCell(obj);
    if (!cell)
    {
        return std::nullopt;
    }
    ItemSpawn item;
    item.id = readFirstId(obj, {idKey.c_str(), "id"});
    item.cell = *cell;
    const WirePosition position = readPosition(obj);
    item.pixel = position.pixel;
    return item;
}

std::vector<ItemSpawn> readItems(const JsonValue &obj, const std::string &key, const std::string &idKey)
{
    std::vector<ItemSpawn> items;
    const JsonValue *list = json::getObjectField(obj, key);
    if (!list || list->type != JsonValue::Type::Array)
    {
        return items;
    }
    for (const JsonValue &entry : list->array)
    {
        if (auto item = readItem(entry, idKey))
        {
            items.push_back(std::move(*item));
        }
    }
    return items;
}

std::vector<ScoreEntry> readLeaderboard(const JsonValue &obj)
{
    std::vector<ScoreEntry> entries;
    const JsonValue *list = json::getObjectField(obj, "leaderboard");
    if (!list || list->type != JsonValue::Type::Array)
    {
        return entries;
    }
    for (const JsonValue &entry : list->array)
    {
        if (!isObject(entry))
        {
            continue;
        }
        auto id = readFirstId(entry, {"playerId", "id"});
        ScoreEntry score;
        score.id = id.value_or("");
        score.name = json::getString(entry, "name", "");
        score.coins = json::getInt(entry, "coins", 0);
        if (score.id.empty() && score.name.empty())
        {
            continue;
        }
        entries.push_back(std::move(score));
    }
    return entries;
}

bool requireObject(const JsonValue &payload, std::string &error)
{
    if (!isObject(payload))
    {
        error = "payload_not_object";
        return false;
    }
    return true;
}

bool requireId(const std::optional<std::string> &id, const char *field, std::string &error)
{
    if (!id)
    {
        error = std::string("missing_field:") + field;
        return false;
    }
    return true;
}

} // namespace

std::optional<RoomJoined> decodeRoomJoined(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    RoomJoined joined;
    joined.roomCode = json::getString(payload, "roomCode", "");
    if (joined.roomCode.empty())
    {
        error = "missing_field:roomCode";
        return std::nullopt;
    }
    joined.playerId = readId(payload, "playerId").value_or("");
    if (const JsonValue *room = json::getObjectField(payload, "room"))
    {
        joined.players = readPlayers(*room, "players");
    }
    return joined;
}

std::optional<JoinError> decodeJoinError(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    return JoinError{json::getString(payload, "message", "join failed")};
}

std::optional<RoomLeft> decodeRoomLeft(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    return RoomLeft{json::getString(payload, "roomCode", ""), json::getString(payload, "reason", "")};
}

std::optional<PlayerJoined> decodePlayerJoined(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    const JsonValue *player = json::getObjectField(payload, "player");
    auto info = player ? readPlayer(*player) : readPlayer(payload);
    if (!info)
    {
        error = "missing_field:player";
        return std::nullopt;
    }
    return PlayerJoined{std::move(*info)};
}

std::optional<PlayerLeft> decodePlayerLeft(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    auto id = readFirstId(payload, {"playerId", "id"});
    if (!requireId(id, "playerId", error))
    {
        return std::nullopt;
    }
    return PlayerLeft{*id};
}

std::optional<GameStarted> decodeGameStarted(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    GameStarted started;
    const JsonValue *room = json::getObjectField(payload, "room");
    if (room && isObject(*room))
    {
        started.roomCode = json::getString(*room, "code", json::getString(*room, "roomCode", ""));
        started.totalRounds = json::getInt(*room, "totalRounds", 0);
        if (const JsonValue *map = json::getObjectField(*room, "mapConfig"))
        {
            started.mapConfig.width = json::getInt(*map, "width", 0);
            started.mapConfig.height = json::getInt(*map, "height", 0);
            started.mapConfig.blockSize = json::getInt(*map, "blockSize", 0);
            started.mapConfig.tileSize = json::getInt(*map, "tileSize", 0);
            if (const JsonValue *slots = json::getObjectField(*map, "spawnPositions"))
            {
                if (slots->type == JsonValue::Type::Array)
                {
                    for (const JsonValue &slot : slots->array)
                    {
                        if (auto cell = readCell(slot))
                        {
                            started.mapConfig.spawnSlots.push_back(*cell);
                        }
                    }
                }
            }
        }
    }

    const JsonValue *state = json::getObjectField(payload, "gameState");
    const JsonValue &source = state && isObject(*state) ? *state : payload;
    started.players = readPlayers(source, "players");
    started.chaserIds = readChaserIds(source, "unicornIds", "unicornId");
    if (started.totalRounds == 0)
    {
        started.totalRounds = json::getInt(source, "totalRounds", 0);
    }
    if (started.roomCode.empty())
    {
        started.roomCode = json::getString(source, "roomCode", "");
    }
    return started;
}

std::optional<PositionUpdate> decodePositionUpdate(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    auto id = readId(payload, "playerId");
    if (!requireId(id, "playerId", error))
    {
        return std::nullopt;
    }
    auto position = readNestedPosition(payload, "position");
    if (!position)
    {
        WirePosition flat = readPosition(payload);
        if (!hasAnyPosition(flat))
        {
            error = "missing_field:position";
            return std::nullopt;
        }
        position = flat;
    }
    return PositionUpdate{*id, *position};
}

std::optional<PhaseChange> decodePhaseChange(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    PhaseChange change;
    change.phase = json::getString(payload, "phase", "");
    if (change.phase.empty())
    {
        error = "missing_field:phase";
        return std::nullopt;
    }
    change.seq = readOptionalInt(payload, "seq");
    change.roundInfo = readRoundInfo(payload);
    return change;
}

std::optional<QuizStart> decodeQuizStart(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    QuizStart quiz;
    quiz.seq = readOptionalInt(payload, "seq");
    if (const JsonValue *question = json::getObjectField(payload, "question"))
    {
        quiz.questionId = readId(*question, "id").value_or("");
        quiz.question = json::getString(*question, "question", "");
        quiz.options = json::getStringArray(*question, "options");
    }
    quiz.timeLimitMs = json::getDouble(payload, "timeLimit", 0.0);
    return quiz;
}

std::optional<RoleTransfer> decodeRoleTransfer(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    if (!hasChaserField(payload, "newUnicornIds", "newUnicornId"))
    {
        error = "missing_field:newUnicornIds";
        return std::nullopt;
    }
    RoleTransfer transfer;
    transfer.chaserIds = readChaserIds(payload, "newUnicornIds", "newUnicornId");
    transfer.reason = json::getString(payload, "reason", "");
    return transfer;
}

std::optional<HuntStart> decodeHuntStart(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    HuntStart hunt;
    hunt.seq = readOptionalInt(payload, "seq");
    hunt.roundInfo = readRoundInfo(payload);
    hunt.durationMs = json::getDouble(payload, "duration", 0.0);
    hunt.chaserIds = readChaserIds(payload, "unicornIds", "unicornId");
    return hunt;
}

std::optional<HuntEnd> decodeHuntEnd(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    HuntEnd end;
    end.seq = readOptionalInt(payload, "seq");
    end.roundInfo = readRoundInfo(payload);
    if (json::hasNumber(payload, "remainingTime"))
    {
        end.remainingMs = json::getDouble(payload, "remainingTime", 0.0);
    }
    end.reason = json::getString(payload, "reason", "");
    return end;
}

std::optional<PlayerTagged> decodePlayerTagged(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    auto chaser = readId(payload, "unicornId");
    auto caught = readId(payload, "caughtId");
    if (!requireId(chaser, "unicornId", error) || !requireId(caught, "caughtId", error))
    {
        return std::nullopt;
    }
    return PlayerTagged{*chaser, *caught, json::getInt(payload, "coinsGained", 0)};
}

std::optional<PlayerStateChange> decodePlayerStateChange(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    auto id = readId(payload, "playerId");
    if (!requireId(id, "playerId", error))
    {
        return std::nullopt;
    }
    PlayerStateChange change;
    change.playerId = *id;
    change.state = json::getString(payload, "state", "");
    if (change.state.empty())
    {
        error = "missing_field:state";
        return std::nullopt;
    }
    for (const char *key : {"invulnerable", "inIFrames"})
    {
        const JsonValue *flag = json::getObjectField(payload, key);
        if (flag && flag->type == JsonValue::Type::Bool)
        {
            change.invulnerable = flag->boolean;
            break;
        }
    }
    return change;
}

std::optional<PlayerRespawn> decodePlayerRespawn(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    auto id = readId(payload, "playerId");
    if (!requireId(id, "playerId", error))
    {
        return std::nullopt;
    }
    auto position = readNestedPosition(payload, "position");
    if (!position)
    {
        error = "missing_field:position";
        return std::nullopt;
    }
    PlayerRespawn respawn;
    respawn.playerId = *id;
    respawn.position = *position;
    respawn.invulnerable = json::getBool(payload, "invulnerable", json::getBool(payload, "inIFrames", false));
    return respawn;
}

std::optional<ItemsSpawned> decodeItemsSpawned(const JsonValue &payload, const std::string &listKey,
                                               const std::string &idKey, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    ItemsSpawned spawned;
    const JsonValue *list = json::getObjectField(payload, listKey);
    if (list && list->type == JsonValue::Type::Array)
    {
        spawned.items = readItems(payload, listKey, idKey);
        return spawned;
    }
    auto single = readItem(payload, idKey);
    if (!single)
    {
        error = "missing_field:" + listKey;
        return std::nullopt;
    }
    spawned.items.push_back(std::move(*single));
    return spawned;
}

std::optional<CoinCollected> decodeCoinCollected(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    CoinCollected collected;
    collected.coinId = readFirstId(payload, {"coinId", "id"});
    collected.cell = readCell(payload);
    if (!collected.coinId && !collected.cell)
    {
        error = "missing_field:coinId";
        return std::nullopt;
    }
    collected.playerId = readId(payload, "playerId").value_or("");
    collected.newScore = readOptionalInt(payload, "newScore");
    collected.leaderboard = readLeaderboard(payload);
    return collected;
}

std::optional<TrapCollected> decodeTrapCollected(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    TrapCollected collected;
    collected.trapId = readFirstId(payload, {"trapId", "id"});
    collected.cell = readCell(payload);
    if (!collected.trapId && !collected.cell)
    {
        error = "missing_field:trapId";
        return std::nullopt;
    }
    collected.playerId = readId(payload, "playerId").value_or("");
    collected.newInventoryCount = readOptionalInt(payload, "newInventoryCount");
    return collected;
}

std::optional<TrapDeployed> decodeTrapDeployed(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    TrapDeployed deployed;
    deployed.trapId = readFirstId(payload, {"trapId", "id"});
    deployed.position = readPosition(payload);
    if (!hasAnyPosition(deployed.position))
    {
        error = "missing_field:position";
        return std::nullopt;
    }
    deployed.playerId = readId(payload, "playerId").value_or("");
    deployed.newInventoryCount = readOptionalInt(payload, "newInventoryCount");
    return deployed;
}

std::optional<TrapTriggered> decodeTrapTriggered(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    auto chaser = readId(payload, "unicornId");
    auto from = readNestedPosition(payload, "fromPosition");
    auto to = readNestedPosition(payload, "toPosition");
    if (!requireId(chaser, "unicornId", error))
    {
        return std::nullopt;
    }
    if (!from || !to)
    {
        error = "missing_field:position";
        return std::nullopt;
    }
    return TrapTriggered{readId(payload, "trapId"), *chaser, *from, *to};
}

std::optional<PlayerTeleported> decodePlayerTeleported(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    auto id = readId(payload, "playerId");
    auto from = readNestedPosition(payload, "fromPosition");
    auto to = readNestedPosition(payload, "toPosition");
    if (!requireId(id, "playerId", error))
    {
        return std::nullopt;
    }
    if (!to)
    {
        error = "missing_field:toPosition";
        return std::nullopt;
    }
    return PlayerTeleported{*id, from.value_or(WirePosition{}), *to};
}

std::optional<PenaltyQuizStart> decodePenaltyQuizStart(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    const JsonValue *questions = json::getObjectField(payload, "questions");
    if (!questions || questions->type != JsonValue::Type::Array)
    {
        error = "missing_field:questions";
        return std::nullopt;
    }
    PenaltyQuizStart start;
    start.questionCount = json::getInt(payload, "totalQuestions", static_cast<int>(questions->array.size()));
    start.passThreshold = json::getInt(payload, "passThreshold", start.questionCount);
    return start;
}

std::optional<PenaltyQuizComplete> decodePenaltyQuizComplete(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    const JsonValue *passed = json::getObjectField(payload, "passed");
    if (!passed || passed->type != JsonValue::Type::Bool)
    {
        error = "missing_field:passed";
        return std::nullopt;
    }
    return PenaltyQuizComplete{passed->boolean, json::getBool(payload, "retry", false)};
}

std::optional<PenaltyQuizCancelled> decodePenaltyQuizCancelled(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    return PenaltyQuizCancelled{json::getString(payload, "reason", "")};
}

std::optional<GameEnd> decodeGameEnd(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    GameEnd end;
    end.seq = readOptionalInt(payload, "seq");
    end.totalRounds = json::getInt(payload, "totalRounds", 0);
    end.leaderboard = readLeaderboard(payload);
    return end;
}

std::optional<PlayerPresence> decodePlayerPresence(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    auto id = readId(payload, "playerId");
    if (!requireId(id, "playerId", error))
    {
        return std::nullopt;
    }
    return PlayerPresence{*id};
}

std::optional<GameStateSync> decodeGameStateSync(const JsonValue &payload, std::string &error)
{
    if (!requireObject(payload, error))
    {
        return std::nullopt;
    }
    const JsonValue *state = json::getObjectField(payload, "gameState");
    if (!state)
    {
        error = "missing_field:gameState";
        return std::nullopt;
    }
    GameStateSync sync;
    if (state->type == JsonValue::Type::Null)
    {
        return sync;
    }
    if (!isObject(*state))
    {
        error = "gameState_not_object";
        return std::nullopt;
    }

    Snapshot snapshot;
    snapshot.seq = readOptionalInt(*state, "seq");
    const std::string phase = json::getString(*state, "phase", "");
    if (!phase.empty())
    {
        snapshot.phase = phase;
    }
    snapshot.currentRound = readOptionalInt(*state, "currentRound");
    if (!snapshot.currentRound)
    {
        if (auto info = readRoundInfo(*state))
        {
            snapshot.currentRound = info->currentRound;
        }
    }
    snapshot.totalRounds = json::getInt(*state, "totalRounds", 0);
    snapshot.players = readPlayers(*state, "players");
    snapshot.chaserIds = readChaserIds(*state, "unicornIds", "unicornId");
    snapshot.leaderboard = readLeaderboard(*state);
    snapshot.coins = readItems(*state, "coins", "coinId");
    snapshot.portals = readItems(*state, "sinkholes", "sinkholeId");
    snapshot.trapPickups = readItems(*state, "sinkTraps", "trapId");
    snapshot.deployedTraps = readItems(*state, "deployedSinkTraps", "trapId");
    if (const JsonValue *frozen = json::getObjectField(*state, "frozenPlayers"))
    {
        if (frozen->type == JsonValue::Type::Array)
        {
            for (const JsonValue &entry : frozen->array)
            {
                auto id = readId(entry, "playerId");
                if (id && json::getBool(entry, "hasActiveQuiz", false))
                {
                    snapshot.frozenWithQuiz.push_back(*id);
                }
            }
        }
    }
    sync.snapshot = std::move(snapshot);
    return sync;
}

JsonValue encodeJoinRoom(const std::string &roomCode, const std::string &playerName, const std::string &playerId)
{
    JsonValue payload = json::makeObject();
    json::setField(payload, "roomCode", json::makeString(roomCode));
    json::setField(payload, "playerName", json::makeString(playerName));
    if (!playerId.empty())
    {
        json::setField(payload, "playerId", json::makeString(playerId));
    }
    return payload;
}

JsonValue encodePositionReport(const PositionReport &report)
{
    JsonValue payload = json::makeObject();
    json::setField(payload, "x", json::makeNumber(report.x));
    json::setField(payload, "y", json::makeNumber(report.y));
    json::setField(payload, "row", json::makeNumber(report.row));
    json::setField(payload, "col", json::makeNumber(report.col));
    json::setField(payload, "dirX", json::makeNumber(report.dirX));
    json::setField(payload, "dirY", json::makeNumber(report.dirY));
    json::setField(payload, "velocity", json::makeNumber(report.velocity));
    json::setField(payload, "timestamp", json::makeNumber(report.timestampMs));
    return payload;
}

JsonValue encodeCollectCoin(const std::string &coinId)
{
    JsonValue payload = json::makeObject();
    json::setField(payload, "coinId", json::makeString(coinId));
    return payload;
}

JsonValue encodeCollectTrap(const std::string &trapId)
{
    JsonValue payload = json::makeObject();
    json::setField(payload, "trapId", json::makeString(trapId));
    return payload;
}

JsonValue encodeDeployTrap(const world::GridCell &cell)
{
    JsonValue payload = json::makeObject();
    json::setField(payload, "row", json::makeNumber(cell.row));
    json::setField(payload, "col", json::makeNumber(cell.col));
    return payload;
}

JsonValue encodeEnterSinkhole(const std::string &sinkholeId)
{
    JsonValue payload = json::makeObject();
    json::setField(payload, "sinkholeId", json::makeString(sinkholeId));
    return payload;
}

JsonValue encodeBlitzAnswer(int answerIndex)
{
    JsonValue payload = json::makeObject();
    json::setField(payload, "answerIndex", json::makeNumber(answerIndex));
    return payload;
}

JsonValue encodePenaltyAnswer(int questionIndex, int answerIndex)
{
    JsonValue payload = json::makeObject();
    json::setField(payload, "questionIndex", json::makeNumber(questionIndex));
    json::setField(payload, "answerIndex", json::makeNumber(answerIndex));
    return payload;
}

JsonValue encodeEmpty()
{
    return json::makeObject();
}

} // namespace net
