#pragma once

namespace net::wire
{

// Client to server.
inline constexpr const char *CreateRoom = "create_room";
inline constexpr const char *JoinRoom = "join_room";
inline constexpr const char *LeaveRoom = "leave_room";
inline constexpr const char *StartGame = "start_game";
inline constexpr const char *UpdatePosition = "update_position";
inline constexpr const char *CollectCoin = "collect_coin";
inline constexpr const char *CollectSinkTrap = "collect_sink_trap";
inline constexpr const char *DeploySinkTrap = "deploy_sink_trap";
inline constexpr const char *EnterSinkhole = "enter_sinkhole";
inline constexpr const char *BlitzAnswer = "blitz_answer";
inline constexpr const char *SubmitUnfreezeQuizAnswer = "submit_unfreeze_quiz_answer";
inline constexpr const char *RequestUnfreezeQuiz = "request_unfreeze_quiz";
inline constexpr const char *LavaDeath = "lava_death";
inline constexpr const char *GetGameState = "get_game_state";

// Server to client.
inline constexpr const char *RoomJoined = "room_joined";
inline constexpr const char *JoinError = "join_error";
inline constexpr const char *RoomLeft = "room_left";
inline constexpr const char *PlayerJoined = "player_joined";
inline constexpr const char *PlayerLeft = "player_left";
inline constexpr const char *GameStarted = "game_started";
inline constexpr const char *PlayerPositionUpdate = "player_position_update";
inline constexpr const char *PhaseChange = "phase_change";
inline constexpr const char *BlitzStart = "blitz_start";
inline constexpr const char *BlitzResult = "blitz_result";
inline constexpr const char *UnicornTransferred = "unicorn_transferred";
inline constexpr const char *HuntStart = "hunt_start";
inline constexpr const char *HuntEnd = "hunt_end";
inline constexpr const char *PlayerTagged = "player_tagged";
inline constexpr const char *PlayerStateChange = "player_state_change";
inline constexpr const char *PlayerRespawn = "player_respawn";
inline constexpr const char *CoinSpawned = "coin_spawned";
inline constexpr const char *CoinCollected = "coin_collected";
inline constexpr const char *SinkTrapSpawned = "sink_trap_spawned";
inline constexpr const char *SinkTrapCollected = "sink_trap_collected";
inline constexpr const char *SinkTrapDeployed = "sink_trap_deployed";
inline constexpr const char *SinkTrapTriggered = "sink_trap_triggered";
inline constexpr const char *SinkholeSpawned = "sinkhole_spawned";
inline constexpr const char *PlayerTeleported = "player_teleported";
inline constexpr const char *UnfreezeQuizStart = "unfreeze_quiz_start";
inline constexpr const char *UnfreezeQuizComplete = "unfreeze_quiz_complete";
inline constexpr const char *UnfreezeQuizCancelled = "unfreeze_quiz_cancelled";
inline constexpr const char *GameEnd = "game_end";
inline constexpr const char *GameStateSync = "game_state_sync";
inline constexpr const char *PlayerDisconnected = "player_disconnected";
inline constexpr const char *PlayerReconnected = "player_reconnected";

} // namespace net::wire
