#pragma once

#include <optional>
#include <string>

#include "json/JsonUtils.h"
#include "motion/LocalPredictor.h"
#include "net/ServerEvents.h"

namespace net
{

// Inbound decoding. A nullopt result leaves the reason in error; nothing is applied partially.
std::optional<RoomJoined> decodeRoomJoined(const json::JsonValue &payload, std::string &error);
std::optional<JoinError> decodeJoinError(const json::JsonValue &payload, std::string &error);
std::optional<RoomLeft> decodeRoomLeft(const json::JsonValue &payload, std::string &error);
std::optional<PlayerJoined> decodePlayerJoined(const json::JsonValue &payload, std::string &error);
std::optional<PlayerLeft> decodePlayerLeft(const json::JsonValue &payload, std::string &error);
std::optional<GameStarted> decodeGameStarted(const json::JsonValue &payload, std::string &error);
std::optional<PositionUpdate> decodePositionUpdate(const json::JsonValue &payload, std::string &error);
std::optional<PhaseChange> decodePhaseChange(const json::JsonValue &payload, std::string &error);
std::optional<QuizStart> decodeQuizStart(const json::JsonValue &payload, std::string &error);
std::optional<RoleTransfer> decodeRoleTransfer(const json::JsonValue &payload, std::string &error);
std::optional<HuntStart> decodeHuntStart(const json::JsonValue &payload, std::string &error);
std::optional<HuntEnd> decodeHuntEnd(const json::JsonValue &payload, std::string &error);
std::optional<PlayerTagged> decodePlayerTagged(const json::JsonValue &payload, std::string &error);
std::optional<PlayerStateChange> decodePlayerStateChange(const json::JsonValue &payload, std::string &error);
std::optional<PlayerRespawn> decodePlayerRespawn(const json::JsonValue &payload, std::string &error);
/// Accepts the batch shape ({listKey: [...]}) and the legacy single-item shape.
std::optional<ItemsSpawned> decodeItemsSpawned(const json::JsonValue &payload, const std::string &listKey,
                                               const std::string &idKey, std::string &error);
std::optional<CoinCollected> decodeCoinCollected(const json::JsonValue &payload, std::string &error);
std::optional<TrapCollected> decodeTrapCollected(const json::JsonValue &payload, std::string &error);
std::optional<TrapDeployed> decodeTrapDeployed(const json::JsonValue &payload, std::string &error);
std::optional<TrapTriggered> decodeTrapTriggered(const json::JsonValue &payload, std::string &error);
std::optional<PlayerTeleported> decodePlayerTeleported(const json::JsonValue &payload, std::string &error);
std::optional<PenaltyQuizStart> decodePenaltyQuizStart(const json::JsonValue &payload, std::string &error);
std::optional<PenaltyQuizComplete> decodePenaltyQuizComplete(const json::JsonValue &payload, std::string &error);
std::optional<PenaltyQuizCancelled> decodePenaltyQuizCancelled(const json::JsonValue &payload, std::string &error);
std::optional<GameEnd> decodeGameEnd(const json::JsonValue &payload, std::string &error);
std::optional<PlayerPresence> decodePlayerPresence(const json::JsonValue &payload, std::string &error);
std::optional<GameStateSync> decodeGameStateSync(const json::JsonValue &payload, std::string &error);

// Outbound encoding.
json::JsonValue encodeJoinRoom(const std::string &roomCode, const std::string &playerName,
                               const std::string &playerId);
json::JsonValue encodePositionReport(const PositionReport &report);
json::JsonValue encodeCollectCoin(const std::string &coinId);
json::JsonValue encodeCollectTrap(const std::string &trapId);
json::JsonValue encodeDeployTrap(const world::GridCell &cell);
json::JsonValue encodeEnterSinkhole(const std::string &sinkholeId);
json::JsonValue encodeBlitzAnswer(int answerIndex);
json::JsonValue encodePenaltyAnswer(int questionIndex, int answerIndex);
json::JsonValue encodeEmpty();

} // namespace net
