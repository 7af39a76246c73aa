#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/ClientConfig.h"
#include "match/GamePhase.h"
#include "match/TimerScheduler.h"
#include "net/Channel.h"
#include "net/ServerEvents.h"
#include "telemetry/TelemetrySink.h"

/// Owns the global phase, the local sub-state and round bookkeeping.
///
/// Every quiz, hunt, round-end and game-end instance carries a sequence number (explicit seq, else
/// its round index, else the round cursor). An instance is applied only when its sequence is newer
/// than the last one applied to the same slot, so incremental events and snapshots can race freely.
/// Applying an instance also retires the earlier slots of the same round.
class PhaseStateMachine
{
  public:
    struct Hooks
    {
        std::function<void(GamePhase previous, GamePhase current)> phaseChanged;
        std::function<void(bool localChaser)> rolesChanged;
        /// Frozen was cleared by a pass, a cancel or a respawn.
        std::function<void()> penaltyResolved;
        std::function<std::string(const std::string &playerId)> displayName;
    };

    PhaseStateMachine(TimerScheduler &timers, net::Channel &channel, TimerConfig timing, CapabilityFlags capabilities,
                      std::shared_ptr<TelemetrySink> telemetry = nullptr);
    ~PhaseStateMachine();

    PhaseStateMachine(const PhaseStateMachine &) = delete;
    PhaseStateMachine &operator=(const PhaseStateMachine &) = delete;

    void setHooks(Hooks hooks) { m_hooks = std::move(hooks); }
    void setLocalId(std::string id) { m_localId = std::move(id); }
    const std::string &localId() const { return m_localId; }

    void startMatch(int totalRounds, const std::vector<std::string> &chaserIds);
    void resetToLobby();

    bool onPhaseChange(const net::PhaseChange &change);
    bool onQuizStarted(const net::QuizStart &quiz);
    bool onHuntStarted(const net::HuntStart &hunt);
    bool onHuntEnded(const net::HuntEnd &end);
    bool onGameEnded(const net::GameEnd &end);

    /// Replaces the role-holder set. Raises an announcement only when the set changes.
    bool applyRoles(const std::vector<std::string> &chaserIds);

    /// Idempotent merge of a full snapshot into whatever state is current.
    bool mergeSnapshot(const net::Snapshot &snapshot);

    bool onLocalStateChanged(const std::string &state, std::optional<bool> invulnerable);
    bool onLocalRespawn(bool invulnerable);
    bool onPenaltyQuizContent(const net::PenaltyQuizStart &content);
    bool onPenaltyQuizComplete(const net::PenaltyQuizComplete &result);
    bool onPenaltyQuizCancelled(const net::PenaltyQuizCancelled &cancelled);

    /// Sends one answer per quiz instance.
    bool submitQuizAnswer(int answerIndex);
    bool submitPenaltyAnswer(int questionIndex, int answerIndex);

    [[nodiscard]] GamePhase globalPhase() const noexcept { return m_globalPhase; }
    [[nodiscard]] GamePhase effectivePhase() const noexcept;
    [[nodiscard]] LocalState localState() const noexcept { return m_localState; }
    [[nodiscard]] bool localChaser() const noexcept { return m_localChaser; }
    [[nodiscard]] bool invulnerable() const noexcept { return m_invulnerable; }
    [[nodiscard]] bool penaltyQuizLoading() const noexcept;
    [[nodiscard]] bool penaltyContentReady() const noexcept { return m_penaltyContentReady; }
    [[nodiscard]] bool announcementVisible() const noexcept { return m_announcementVisible; }
    const std::string &announcementText() const { return m_announcementText; }
    double announcementRemainingMs() const;

    /// Movement and position broadcast are live only in an unfrozen hunt.
    [[nodiscard]] bool movementAllowed() const noexcept { return effectivePhase() == GamePhase::Hunt; }
    double huntElapsedMs() const;

    RoundContext roundContext() const;
    [[nodiscard]] int roundCursor() const noexcept { return m_roundCursor; }
    int lastAppliedSequence(PhaseSlot slot) const;

  private:
    int sequenceFor(PhaseSlot slot, const std::optional<int> &seq, const std::optional<int> &round) const;
    bool admit(PhaseSlot slot, int sequence, const char *source);
    void enterQuiz(int sequence);
    void enterHunt(int sequence, double durationMs, const std::vector<std::string> &chaserIds);
    void enterRoundEnd(int sequence);
    void enterGameEnd();

    void enterFrozen(double requestDelayMs);
    void leaveFrozen(bool grantInvulnerability);
    void clearFrozen(bool grantInvulnerability);
    void schedulePenaltyRequest(double delayMs);
    void startInvulnerability();
    void endInvulnerability();
    void showAnnouncement(std::string text, double durationMs);
    void capAnnouncement(double capMs);
    void hideAnnouncement();

    void cancelTimer(TimerScheduler::TimerId &id);
    void notifyPhase(GamePhase previous);
    std::string nameOf(const std::string &id) const;
    void send(const char *event, const json::JsonValue &payload);
    void record(std::string_view eventName, TelemetrySink::Payload payload) const;

    TimerScheduler &m_timers;
    net::Channel &m_channel;
    TimerConfig m_timing;
    CapabilityFlags m_capabilities;
    std::shared_ptr<TelemetrySink> m_telemetry;
    Hooks m_hooks;
    std::string m_localId;

    GamePhase m_globalPhase = GamePhase::Lobby;
    LocalState m_localState = LocalState::Active;
    std::array<int, 4> m_lastApplied{0, 0, 0, 0};
    int m_roundCursor = 1;
    RoundContext m_round;
    double m_huntStartedAtMs = 0.0;
    double m_huntDurationMs = 0.0;
    bool m_localChaser = false;
    bool m_quizAnswered = false;

    bool m_penaltyContentReady = false;
    std::uint64_t m_frozenGeneration = 0;
    TimerScheduler::TimerId m_penaltyTimer = 0;

    bool m_invulnerable = false;
    std::uint64_t m_invulnerabilityGeneration = 0;
    TimerScheduler::TimerId m_invulnerabilityTimer = 0;

    bool m_announcementVisible = false;
    std::string m_announcementText;
    double m_announcementEndsAtMs = 0.0;
    std::uint64_t m_announcementGeneration = 0;
    TimerScheduler::TimerId m_announcementTimer = 0;
};
