#include "net/WireCodec.h"

#include <iostream>
#include <string>

namespace
{

bool assertTrue(bool condition, const char *message)
{
    if (!condition)
    {
        std::cerr << message << '\n';
        return false;
    }
    return true;
}

json::JsonValue parse(const std::string &text)
{
    auto value = json::parseJson(text);
    return value ? *value : json::JsonValue{};
}

bool testGameStartedShapes()
{
    std::string error;
    const auto started = net::decodeGameStarted(
        parse(R"({"room":{"code":"ABC123","totalRounds":3,"mapConfig":{"width":50,"height":50,"blockSize":4,)"
              R"("tileSize":64,"spawnPositions":[{"row":24,"col":24},{"row":28.7,"col":28}]}},)"
              R"("gameState":{"players":[{"id":"p1","name":"Player"},{"name":"nameless"},)"
              R"({"playerId":7,"name":"Legacy","isUnicorn":true,"sinkInventory":2}],"unicornIds":["p2"]}})"),
        error);

    bool success = true;
    if (!assertTrue(started.has_value(), "Game started should decode"))
    {
        return false;
    }
    success &= assertTrue(started->roomCode == "ABC123" && started->totalRounds == 3, "Room fields should decode");
    success &= assertTrue(started->mapConfig.width == 50 && started->mapConfig.tileSize == 64,
                          "Map config should decode");
    success &= assertTrue(started->mapConfig.spawnSlots.size() == 2 && started->mapConfig.spawnSlots[1].row == 28,
                          "Spawn slots should floor fractional cells");
    success &= assertTrue(started->players.size() == 2, "Players without an id should be skipped");
    success &= assertTrue(started->players[1].id == "7" && started->players[1].trapInventory == 2,
                          "Numeric ids should become strings");
    success &= assertTrue(started->chaserIds.size() == 1 && started->chaserIds[0] == "p2", "Chaser list should decode");

    const auto legacy = net::decodeGameStarted(parse(R"({"roomCode":"Z","unicornId":"p9","totalRounds":1})"), error);
    success &= assertTrue(legacy && legacy->roomCode == "Z" && legacy->chaserIds.size() == 1 &&
                              legacy->chaserIds[0] == "p9",
                          "Legacy single chaser id should decode");
    return success;
}

bool testRejectsMalformedPayloads()
{
    bool success = true;
    std::string error;
    success &= assertTrue(!net::decodeRoomJoined(parse("[1,2]"), error) && error == "payload_not_object",
                          "Non-object payload should be rejected");
    success &= assertTrue(!net::decodeRoomJoined(parse(R"({"playerId":"p1"})"), error) &&
                              error == "missing_field:roomCode",
                          "Room joined needs a room code");
    success &= assertTrue(!net::decodePositionUpdate(parse(R"({"playerId":"p2"})"), error) &&
                              error == "missing_field:position",
                          "Position update needs a position");
    success &= assertTrue(!net::decodePlayerTagged(parse(R"({"unicornId":"p2"})"), error) &&
                              error == "missing_field:caughtId",
                          "Tag needs the caught id");
    success &= assertTrue(!net::decodePenaltyQuizComplete(parse(R"({"passed":"yes"})"), error) &&
                              error == "missing_field:passed",
                          "Quiz completion needs a boolean");
    success &= assertTrue(!net::decodeRoleTransfer(parse(R"({"reason":"tag"})"), error),
                          "Role transfer needs a chaser field");
    return success;
}

bool testPositionShapes()
{
    std::string error;
    bool success = true;
    const auto nested = net::decodePositionUpdate(parse(R"({"playerId":"p2","position":{"x":10.5,"y":20}})"), error);
    success &= assertTrue(nested && nested->position.pixel && nested->position.pixel->x == 10.5f &&
                              !nested->position.cell,
                          "Nested pixel position should decode");

    const auto flat = net::decodePositionUpdate(parse(R"({"playerId":"p2","row":3,"col":4})"), error);
    success &= assertTrue(flat && flat->position.cell && flat->position.cell->row == 3 && flat->position.cell->col == 4,
                          "Flat grid position should decode");

    const auto teleport = net::decodePlayerTeleported(
        parse(R"({"playerId":"p1","toPosition":{"row":20,"col":24}})"), error);
    success &= assertTrue(teleport && !teleport->from.pixel && !teleport->from.cell && teleport->to.cell,
                          "Teleport without an origin should still decode");
    return success;
}

bool testItemSpawnShapes()
{
    std::string error;
    bool success = true;
    const auto batch = net::decodeItemsSpawned(
        parse(R"({"coins":[{"coinId":"c1","row":2,"col":3},{"id":"c2","row":4,"col":5,"x":300,"y":280},{"coinId":"c3"}]})"),
        "coins", "coinId", error);
    success &= assertTrue(batch && batch->items.size() == 2, "Items without a cell should be skipped");
    success &= assertTrue(batch && batch->items[1].id == std::optional<std::string>("c2") && batch->items[1].pixel,
                          "Generic id and pixel position should decode");

    const auto single = net::decodeItemsSpawned(parse(R"({"row":1,"col":1})"), "coins", "coinId", error);
    success &= assertTrue(single && single->items.size() == 1 && !single->items[0].id,
                          "Legacy single item without id should decode");

    const auto missing = net::decodeItemsSpawned(parse(R"({"other":1})"), "coins", "coinId", error);
    success &= assertTrue(!missing && error == "missing_field:coins", "Empty spawn should be rejected");
    return success;
}

bool testStateChangeAndSnapshot()
{
    std::string error;
    bool success = true;
    const auto change =
        net::decodePlayerStateChange(parse(R"({"playerId":"p1","state":"active","inIFrames":true})"), error);
    success &= assertTrue(change && change->invulnerable == std::optional<bool>(true),
                          "Legacy protection flag should decode");

    const auto none = net::decodeGameStateSync(parse(R"({"gameState":null})"), error);
    success &= assertTrue(none && !none->snapshot, "Null game state means no running match");

    const auto sync = net::decodeGameStateSync(
        parse(R"({"gameState":{"phase":"hunt","roundInfo":{"currentRound":2,"totalRounds":3},"totalRounds":3,)"
              R"("players":[{"id":"p1","state":"frozen"}],"unicornIds":["p2"],)"
              R"("sinkholes":[{"sinkholeId":"s1","row":16,"col":16}],)"
              R"("frozenPlayers":[{"playerId":"p1","hasActiveQuiz":true},{"playerId":"p3"}]}})"),
        error);
    if (!assertTrue(sync && sync->snapshot, "Snapshot should decode"))
    {
        return false;
    }
    const net::Snapshot &snapshot = *sync->snapshot;
    success &= assertTrue(snapshot.phase == std::optional<std::string>("hunt"), "Snapshot phase should decode");
    success &= assertTrue(snapshot.currentRound == std::optional<int>(2), "Round info should fill the round");
    success &= assertTrue(!snapshot.seq, "Absent seq stays absent");
    success &= assertTrue(snapshot.portals.size() == 1 && snapshot.portals[0].id == std::optional<std::string>("s1"),
                          "Sinkholes should decode as portals");
    success &= assertTrue(snapshot.frozenWithQuiz.size() == 1, "Only players with an active quiz are listed");
    return success;
}

bool testEncoders()
{
    bool success = true;
    const json::JsonValue join = net::encodeJoinRoom("ABC123", "Player", "");
    success &= assertTrue(json::getString(join, "roomCode", "") == "ABC123", "Join should carry the room");
    success &= assertTrue(json::getObjectField(join, "playerId") == nullptr, "Empty player id is omitted");

    PositionReport report;
    report.x = 266.0f;
    report.y = 453.0f;
    report.row = 7;
    report.col = 4;
    report.timestampMs = 1200.0;
    const json::JsonValue position = net::encodePositionReport(report);
    success &= assertTrue(json::getInt(position, "row", -1) == 7 && json::getInt(position, "col", -1) == 4,
                          "Position report should carry the cell");
    success &= assertTrue(json::getDouble(position, "timestamp", 0.0) == 1200.0, "Timestamp should be carried");

    const json::JsonValue answer = net::encodePenaltyAnswer(1, 3);
    success &= assertTrue(json::getInt(answer, "questionIndex", -1) == 1 && json::getInt(answer, "answerIndex", -1) == 3,
                          "Penalty answer should carry both indices");
    return success;
}

bool testHuntEndShapes()
{
    std::string error;
    const auto update = net::decodeHuntEnd(parse(R"({"remainingTime":25000,"endTime":1700000030000})"), error);
    const auto finished = net::decodeHuntEnd(
        parse(R"({"seq":2,"reason":"timeout","roundInfo":{"currentRound":2,"totalRounds":3}})"), error);

    bool success = true;
    success &= assertTrue(update && update->remainingMs && *update->remainingMs == 25000.0,
                          "Remaining time should decode as a clock update");
    success &= assertTrue(update && !update->seq && !update->roundInfo, "Clock updates carry no sequence");
    success &= assertTrue(finished && !finished->remainingMs && finished->seq == 2 && finished->reason == "timeout",
                          "A real hunt end has no remaining time");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testGameStartedShapes();
    success &= testRejectsMalformedPayloads();
    success &= testPositionShapes();
    success &= testItemSpawnShapes();
    success &= testStateChangeAndSnapshot();
    success &= testEncoders();
    success &= testHuntEndShapes();
    return success ? 0 : 1;
}
