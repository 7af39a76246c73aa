#pragma once

#include <string>

#include "json/JsonUtils.h"
#include "match/GamePhase.h"

/// A message received from the real-time channel, queued until the session pumps the bus.
struct InboundMessageEvent
{
    std::string name;
    json::JsonValue payload;
};

inline constexpr const char *InboundMessageEventName = "net.inbound";

struct ConnectionChangedEvent
{
    bool connected = false;
};

inline constexpr const char *ConnectionChangedEventName = "net.connection";

struct PhaseChangedEvent
{
    GamePhase previous = GamePhase::Lobby;
    GamePhase current = GamePhase::Lobby;
    int round = 0;
};

inline constexpr const char *PhaseChangedEventName = "match.phase_changed";

struct RouteToLobbyEvent
{
    std::string reason;
};

inline constexpr const char *RouteToLobbyEventName = "match.route_to_lobby";
