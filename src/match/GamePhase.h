#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class GamePhase
{
    Lobby,
    Quiz,
    Hunt,
    FrozenLocal,
    RoundEnd,
    GameEnd,
    Spectating
};

enum class LocalState
{
    Active,
    Frozen,
    Spectating
};

/// Phase slots that carry their own instance sequence.
enum class PhaseSlot
{
    Quiz,
    Hunt,
    RoundEnd,
    GameEnd
};

struct RoundContext
{
    int currentRound = 0;
    int totalRounds = 0;
    std::vector<std::string> chaserIds;
    double clockRemainingMs = 0.0;
};

inline const char *gamePhaseToString(GamePhase phase)
{
    switch (phase)
    {
    case GamePhase::Lobby:
        return "lobby";
    case GamePhase::Quiz:
        return "quiz";
    case GamePhase::Hunt:
        return "hunt";
    case GamePhase::FrozenLocal:
        return "frozen";
    case GamePhase::RoundEnd:
        return "round_end";
    case GamePhase::GameEnd:
        return "game_end";
    case GamePhase::Spectating:
        return "spectating";
    }
    return "lobby";
}

inline const char *phaseSlotToString(PhaseSlot slot)
{
    switch (slot)
    {
    case PhaseSlot::Quiz:
        return "quiz";
    case PhaseSlot::Hunt:
        return "hunt";
    case PhaseSlot::RoundEnd:
        return "round_end";
    case PhaseSlot::GameEnd:
        return "game_end";
    }
    return "quiz";
}

/// Maps the server's phase vocabulary onto global phases.
inline std::optional<GamePhase> gamePhaseFromServer(std::string_view text)
{
    if (text == "waiting" || text == "lobby")
    {
        return GamePhase::Lobby;
    }
    if (text == "blitz_quiz" || text == "blitz" || text == "quiz")
    {
        return GamePhase::Quiz;
    }
    if (text == "hunt")
    {
        return GamePhase::Hunt;
    }
    if (text == "round_end")
    {
        return GamePhase::RoundEnd;
    }
    if (text == "game_end")
    {
        return GamePhase::GameEnd;
    }
    return std::nullopt;
}
