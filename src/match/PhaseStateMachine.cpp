#include "match/PhaseStateMachine.h"

#include <algorithm>
#include <utility>

#include "net/WireCodec.h"
#include "net/WireProtocol.h"

namespace
{

std::size_t slotIndex(PhaseSlot slot)
{
    return static_cast<std::size_t>(slot);
}

std::vector<std::string> normalizedIds(std::vector<std::string> ids)
{
    ids.erase(std::remove(ids.begin(), ids.end(), std::string()), ids.end());
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

} // namespace

PhaseStateMachine::PhaseStateMachine(TimerScheduler &timers, net::Channel &channel, TimerConfig timing,
                                     CapabilityFlags capabilities, std::shared_ptr<TelemetrySink> telemetry)
    : m_timers(timers), m_channel(channel), m_timing(timing), m_capabilities(capabilities),
      m_telemetry(std::move(telemetry))
{
}

PhaseStateMachine::~PhaseStateMachine()
{
    cancelTimer(m_penaltyTimer);
    cancelTimer(m_invulnerabilityTimer);
    cancelTimer(m_announcementTimer);
}

void PhaseStateMachine::startMatch(int totalRounds, const std::vector<std::string> &chaserIds)
{
    const GamePhase previous = effectivePhase();
    cancelTimer(m_penaltyTimer);
    cancelTimer(m_invulnerabilityTimer);
    cancelTimer(m_announcementTimer);
    m_globalPhase = GamePhase::Lobby;
    m_localState = LocalState::Active;
    m_lastApplied = {0, 0, 0, 0};
    m_roundCursor = 1;
    m_round = RoundContext{};
    m_round.totalRounds = totalRounds;
    m_huntStartedAtMs = 0.0;
    m_huntDurationMs = 0.0;
    m_localChaser = false;
    m_quizAnswered = false;
    m_penaltyContentReady = false;
    m_invulnerable = false;
    m_announcementVisible = false;
    m_announcementText.clear();
    ++m_frozenGeneration;
    ++m_invulnerabilityGeneration;
    ++m_announcementGeneration;

    record("phase.match_started", {{"total_rounds", std::to_string(totalRounds)}});
    applyRoles(chaserIds);
    notifyPhase(previous);
}

void PhaseStateMachine::resetToLobby()
{
    startMatch(0, {});
}

bool PhaseStateMachine::onPhaseChange(const net::PhaseChange &change)
{
    const auto phase = gamePhaseFromServer(change.phase);
    if (!phase)
    {
        record("phase.unknown", {{"phase", change.phase}});
        return false;
    }
    std::optional<int> round;
    if (change.roundInfo)
    {
        round = change.roundInfo->currentRound;
        if (change.roundInfo->totalRounds > 0)
        {
            m_round.totalRounds = change.roundInfo->totalRounds;
        }
    }

    switch (*phase)
    {
    case GamePhase::Quiz: {
        const int sequence = sequenceFor(PhaseSlot::Quiz, change.seq, round);
        if (!admit(PhaseSlot::Quiz, sequence, "phase_change"))
        {
            return false;
        }
        enterQuiz(sequence);
        return true;
    }
    case GamePhase::Hunt: {
        const int sequence = sequenceFor(PhaseSlot::Hunt, change.seq, round);
        if (!admit(PhaseSlot::Hunt, sequence, "phase_change"))
        {
            return false;
        }
        enterHunt(sequence, 0.0, {});
        return true;
    }
    case GamePhase::RoundEnd: {
        const int sequence = sequenceFor(PhaseSlot::RoundEnd, change.seq, round);
        if (!admit(PhaseSlot::RoundEnd, sequence, "phase_change"))
        {
            return false;
        }
        enterRoundEnd(sequence);
        return true;
    }
    case GamePhase::GameEnd: {
        const int sequence = sequenceFor(PhaseSlot::GameEnd, change.seq, round);
        if (!admit(PhaseSlot::GameEnd, sequence, "phase_change"))
        {
            return false;
        }
        enterGameEnd();
        return true;
    }
    default:
        // Lobby announcements carry nothing the machine does not already know.
        return false;
    }
}

bool PhaseStateMachine::onQuizStarted(const net::QuizStart &quiz)
{
    const int sequence = sequenceFor(PhaseSlot::Quiz, quiz.seq, std::nullopt);
    if (!admit(PhaseSlot::Quiz, sequence, "blitz_start"))
    {
        return false;
    }
    enterQuiz(sequence);
    return true;
}

bool PhaseStateMachine::onHuntStarted(const net::HuntStart &hunt)
{
    std::optional<int> round;
    if (hunt.roundInfo)
    {
        round = hunt.roundInfo->currentRound;
        if (hunt.roundInfo->totalRounds > 0)
        {
            m_round.totalRounds = hunt.roundInfo->totalRounds;
        }
    }
    const int sequence = sequenceFor(PhaseSlot::Hunt, hunt.seq, round);
    if (!admit(PhaseSlot::Hunt, sequence, "hunt_start"))
    {
        // A phase_change may have opened this hunt without its duration or chasers.
        if (sequence == m_lastApplied[slotIndex(PhaseSlot::Hunt)] && m_globalPhase == GamePhase::Hunt)
        {
            if (m_huntDurationMs <= 0.0 && hunt.durationMs > 0.0)
            {
                m_huntDurationMs = hunt.durationMs;
            }
            if (!hunt.chaserIds.empty())
            {
                applyRoles(hunt.chaserIds);
            }
        }
        return false;
    }
    enterHunt(sequence, hunt.durationMs, hunt.chaserIds);
    return true;
}

bool PhaseStateMachine::onHuntEnded(const net::HuntEnd &end)
{
    if (end.remainingMs && *end.remainingMs > 0.0)
    {
        // Periodic clock update from the server, the hunt is still running.
        if (m_globalPhase == GamePhase::Hunt)
        {
            m_huntDurationMs = std::max(0.0, m_timers.nowMs() - m_huntStartedAtMs) + *end.remainingMs;
            record("phase.hunt_clock", {{"remaining_ms", std::to_string(static_cast<long long>(*end.remainingMs))}});
        }
        return false;
    }
    std::optional<int> round;
    if (end.roundInfo)
    {
        round = end.roundInfo->currentRound;
    }
    const int sequence = sequenceFor(PhaseSlot::RoundEnd, end.seq, round);
    if (!admit(PhaseSlot::RoundEnd, sequence, "hunt_end"))
    {
        return false;
    }
    enterRoundEnd(sequence);
    return true;
}

bool PhaseStateMachine::onGameEnded(const net::GameEnd &end)
{
    if (end.totalRounds > 0)
    {
        m_round.totalRounds = end.totalRounds;
    }
    const int sequence = sequenceFor(PhaseSlot::GameEnd, end.seq, std::nullopt);
    if (!admit(PhaseSlot::GameEnd, sequence, "game_end"))
    {
        return false;
    }
    enterGameEnd();
    return true;
}

bool PhaseStateMachine::applyRoles(const std::vector<std::string> &chaserIds)
{
    std::vector<std::string> ids = normalizedIds(chaserIds);
    if (ids == m_round.chaserIds)
    {
        return false;
    }
    m_round.chaserIds = std::move(ids);
    m_localChaser = !m_localId.empty() &&
                    std::binary_search(m_round.chaserIds.begin(), m_round.chaserIds.end(), m_localId);
    record("phase.roles_changed",
           {{"chasers", std::to_string(m_round.chaserIds.size())}, {"local_chaser", m_localChaser ? "true" : "false"}});
    if (m_hooks.rolesChanged)
    {
        m_hooks.rolesChanged(m_localChaser);
    }

    if (m_round.chaserIds.empty())
    {
        return true;
    }
    if (m_localChaser)
    {
        showAnnouncement("You are the chaser!", m_timing.roleAnnouncementMs);
    }
    else
    {
        std::string names;
        for (const std::string &id : m_round.chaserIds)
        {
            if (!names.empty())
            {
                names += ", ";
            }
            names += nameOf(id);
        }
        showAnnouncement("Chaser: " + names, m_timing.roleAnnouncementOtherMs);
    }
    return true;
}

bool PhaseStateMachine::mergeSnapshot(const net::Snapshot &snapshot)
{
    bool changed = false;
    if (snapshot.totalRounds > 0 && snapshot.totalRounds != m_round.totalRounds)
    {
        m_round.totalRounds = snapshot.totalRounds;
        changed = true;
    }

    if (snapshot.phase)
    {
        const auto phase = gamePhaseFromServer(*snapshot.phase);
        if (phase == GamePhase::Quiz)
        {
            const int sequence = sequenceFor(PhaseSlot::Quiz, snapshot.seq, snapshot.currentRound);
            if (admit(PhaseSlot::Quiz, sequence, "snapshot"))
            {
                enterQuiz(sequence);
                changed = true;
            }
        }
        else if (phase == GamePhase::Hunt)
        {
            const int sequence = sequenceFor(PhaseSlot::Hunt, snapshot.seq, snapshot.currentRound);
            if (admit(PhaseSlot::Hunt, sequence, "snapshot"))
            {
                enterHunt(sequence, 0.0, {});
                changed = true;
            }
        }
        else if (phase == GamePhase::RoundEnd)
        {
            const int sequence = sequenceFor(PhaseSlot::RoundEnd, snapshot.seq, snapshot.currentRound);
            if (admit(PhaseSlot::RoundEnd, sequence, "snapshot"))
            {
                enterRoundEnd(sequence);
                changed = true;
            }
        }
        else if (phase == GamePhase::GameEnd)
        {
            const int sequence = sequenceFor(PhaseSlot::GameEnd, snapshot.seq, std::nullopt);
            if (admit(PhaseSlot::GameEnd, sequence, "snapshot"))
            {
                enterGameEnd();
                changed = true;
            }
        }
    }

    if (snapshot.currentRound && *snapshot.currentRound > m_round.currentRound)
    {
        m_round.currentRound = *snapshot.currentRound;
        m_roundCursor = std::max(m_roundCursor, m_round.currentRound);
        changed = true;
    }

    if (!snapshot.chaserIds.empty() && applyRoles(snapshot.chaserIds))
    {
        changed = true;
    }

    const auto self = std::find_if(snapshot.players.begin(), snapshot.players.end(),
                                   [this](const net::PlayerInfo &player) { return player.id == m_localId; });
    if (self == snapshot.players.end())
    {
        return changed;
    }
    if (self->state == "frozen")
    {
        // A quiz the server still holds was lost with the old connection, so ask for it at once.
        const bool quizHeld = std::find(snapshot.frozenWithQuiz.begin(), snapshot.frozenWithQuiz.end(),
                                        m_localId) != snapshot.frozenWithQuiz.end();
        if (m_localState == LocalState::Active)
        {
            enterFrozen(quizHeld ? 0.0 : m_timing.snapshotPenaltyRequestMs);
            changed = true;
        }
        else if (m_localState == LocalState::Frozen && quizHeld && !m_penaltyContentReady)
        {
            schedulePenaltyRequest(0.0);
        }
    }
    else if (self->state == "eliminated" || self->state == "spectating")
    {
        if (m_localState != LocalState::Spectating)
        {
            const GamePhase previous = effectivePhase();
            cancelTimer(m_penaltyTimer);
            m_localState = LocalState::Spectating;
            notifyPhase(previous);
            changed = true;
        }
    }
    else if (m_localState == LocalState::Frozen)
    {
        leaveFrozen(false);
        changed = true;
    }
    return changed;
}

bool PhaseStateMachine::onLocalStateChanged(const std::string &state, std::optional<bool> invulnerable)
{
    if (state == "frozen")
    {
        if (m_localState != LocalState::Active)
        {
            return false;
        }
        enterFrozen(m_timing.penaltyQuizFallbackMs);
        return true;
    }
    if (state == "eliminated" || state == "spectating")
    {
        if (m_localState == LocalState::Spectating)
        {
            return false;
        }
        const GamePhase previous = effectivePhase();
        cancelTimer(m_penaltyTimer);
        ++m_frozenGeneration;
        m_localState = LocalState::Spectating;
        notifyPhase(previous);
        return true;
    }

    bool changed = false;
    if (m_localState == LocalState::Frozen)
    {
        leaveFrozen(false);
        changed = true;
    }
    if (invulnerable)
    {
        if (*invulnerable)
        {
            startInvulnerability();
            changed = true;
        }
        else if (m_invulnerable)
        {
            endInvulnerability();
            changed = true;
        }
    }
    return changed;
}

bool PhaseStateMachine::onLocalRespawn(bool invulnerable)
{
    if (m_localState == LocalState::Frozen)
    {
        leaveFrozen(false);
    }
    else if (m_hooks.penaltyResolved)
    {
        m_hooks.penaltyResolved();
    }
    if (invulnerable)
    {
        startInvulnerability();
    }
    return true;
}

bool PhaseStateMachine::onPenaltyQuizContent(const net::PenaltyQuizStart &content)
{
    if (m_localState == LocalState::Spectating)
    {
        return false;
    }
    if (m_localState == LocalState::Active)
    {
        enterFrozen(m_timing.penaltyQuizFallbackMs);
    }
    cancelTimer(m_penaltyTimer);
    m_penaltyContentReady = true;
    record("phase.penalty_quiz_ready", {{"questions", std::to_string(content.questionCount)}});
    return true;
}

bool PhaseStateMachine::onPenaltyQuizComplete(const net::PenaltyQuizComplete &result)
{
    if (m_localState != LocalState::Frozen)
    {
        return false;
    }
    if (result.passed)
    {
        record("phase.penalty_quiz_passed", {});
        leaveFrozen(true);
        return true;
    }

    record("phase.penalty_quiz_failed", {{"retry", result.retry ? "true" : "false"}});
    m_penaltyContentReady = false;
    if (result.retry)
    {
        schedulePenaltyRequest(m_timing.penaltyQuizFallbackMs);
    }
    return true;
}

bool PhaseStateMachine::onPenaltyQuizCancelled(const net::PenaltyQuizCancelled &cancelled)
{
    if (m_localState != LocalState::Frozen)
    {
        return false;
    }
    record("phase.penalty_quiz_cancelled", {{"reason", cancelled.reason}});
    leaveFrozen(false);
    return true;
}

bool PhaseStateMachine::submitQuizAnswer(int answerIndex)
{
    if (m_globalPhase != GamePhase::Quiz || m_quizAnswered || m_localState == LocalState::Spectating)
    {
        return false;
    }
    m_quizAnswered = true;
    send(net::wire::BlitzAnswer, net::encodeBlitzAnswer(answerIndex));
    return true;
}

bool PhaseStateMachine::submitPenaltyAnswer(int questionIndex, int answerIndex)
{
    if (m_localState != LocalState::Frozen || !m_penaltyContentReady)
    {
        return false;
    }
    send(net::wire::SubmitUnfreezeQuizAnswer, net::encodePenaltyAnswer(questionIndex, answerIndex));
    return true;
}

GamePhase PhaseStateMachine::effectivePhase() const noexcept
{
    switch (m_localState)
    {
    case LocalState::Frozen:
        return GamePhase::FrozenLocal;
    case LocalState::Spectating:
        return GamePhase::Spectating;
    case LocalState::Active:
        break;
    }
    return m_globalPhase;
}

bool PhaseStateMachine::penaltyQuizLoading() const noexcept
{
    return m_localState == LocalState::Frozen && !m_penaltyContentReady;
}

double PhaseStateMachine::announcementRemainingMs() const
{
    if (!m_announcementVisible)
    {
        return 0.0;
    }
    return std::max(0.0, m_announcementEndsAtMs - m_timers.nowMs());
}

double PhaseStateMachine::huntElapsedMs() const
{
    if (m_globalPhase != GamePhase::Hunt)
    {
        return 0.0;
    }
    return std::max(0.0, m_timers.nowMs() - m_huntStartedAtMs);
}

RoundContext PhaseStateMachine::roundContext() const
{
    RoundContext context = m_round;
    if (m_globalPhase == GamePhase::Hunt && m_huntDurationMs > 0.0)
    {
        context.clockRemainingMs = std::max(0.0, m_huntStartedAtMs + m_huntDurationMs - m_timers.nowMs());
    }
    else
    {
        context.clockRemainingMs = 0.0;
    }
    return context;
}

int PhaseStateMachine::lastAppliedSequence(PhaseSlot slot) const
{
    return m_lastApplied[slotIndex(slot)];
}

int PhaseStateMachine::sequenceFor(PhaseSlot slot, const std::optional<int> &seq,
                                   const std::optional<int> &round) const
{
    if (seq)
    {
        return *seq;
    }
    if (round && *round > 0)
    {
        return *round;
    }
    if (slot == PhaseSlot::RoundEnd && m_globalPhase != GamePhase::Hunt)
    {
        // Outside a hunt an unnumbered hunt end can only repeat the one already applied.
        return m_lastApplied[slotIndex(PhaseSlot::RoundEnd)];
    }
    return m_roundCursor;
}

bool PhaseStateMachine::admit(PhaseSlot slot, int sequence, const char *source)
{
    const std::size_t index = slotIndex(slot);
    if (sequence <= m_lastApplied[index])
    {
        record("phase.stale", {{"slot", phaseSlotToString(slot)},
                               {"sequence", std::to_string(sequence)},
                               {"last_applied", std::to_string(m_lastApplied[index])},
                               {"source", source}});
        return false;
    }
    m_lastApplied[index] = sequence;
    for (std::size_t earlier = 0; earlier < index; ++earlier)
    {
        m_lastApplied[earlier] = std::max(m_lastApplied[earlier], sequence);
    }
    return true;
}

void PhaseStateMachine::enterQuiz(int sequence)
{
    const GamePhase previous = effectivePhase();
    m_globalPhase = GamePhase::Quiz;
    m_quizAnswered = false;
    m_round.currentRound = sequence;
    m_roundCursor = std::max(m_roundCursor, sequence);
    m_huntDurationMs = 0.0;
    if (m_localState == LocalState::Frozen)
    {
        clearFrozen(false);
    }
    notifyPhase(previous);
}

void PhaseStateMachine::enterHunt(int sequence, double durationMs, const std::vector<std::string> &chaserIds)
{
    const GamePhase previous = effectivePhase();
    m_globalPhase = GamePhase::Hunt;
    m_round.currentRound = sequence;
    m_roundCursor = std::max(m_roundCursor, sequence);
    m_huntStartedAtMs = m_timers.nowMs();
    m_huntDurationMs = durationMs;
    if (!chaserIds.empty())
    {
        applyRoles(chaserIds);
    }
    capAnnouncement(m_timing.huntStartAnnouncementCapMs);
    notifyPhase(previous);
}

void PhaseStateMachine::enterRoundEnd(int sequence)
{
    const GamePhase previous = effectivePhase();
    m_globalPhase = GamePhase::RoundEnd;
    m_roundCursor = std::max(m_roundCursor, sequence + 1);
    m_huntDurationMs = 0.0;
    if (m_localState == LocalState::Frozen)
    {
        clearFrozen(false);
    }
    notifyPhase(previous);
}

void PhaseStateMachine::enterGameEnd()
{
    const GamePhase previous = effectivePhase();
    m_globalPhase = GamePhase::GameEnd;
    m_huntDurationMs = 0.0;
    if (m_localState == LocalState::Frozen)
    {
        clearFrozen(false);
    }
    hideAnnouncement();
    notifyPhase(previous);
}

void PhaseStateMachine::enterFrozen(double requestDelayMs)
{
    const GamePhase previous = effectivePhase();
    m_localState = LocalState::Frozen;
    ++m_frozenGeneration;
    m_penaltyContentReady = false;
    schedulePenaltyRequest(requestDelayMs);
    record("phase.frozen", {{"request_delay_ms", std::to_string(static_cast<long long>(requestDelayMs))}});
    notifyPhase(previous);
}

void PhaseStateMachine::leaveFrozen(bool grantInvulnerability)
{
    const GamePhase previous = effectivePhase();
    clearFrozen(grantInvulnerability);
    notifyPhase(previous);
}

void PhaseStateMachine::clearFrozen(bool grantInvulnerability)
{
    m_localState = LocalState::Active;
    ++m_frozenGeneration;
    cancelTimer(m_penaltyTimer);
    m_penaltyContentReady = false;
    if (grantInvulnerability)
    {
        startInvulnerability();
    }
    if (m_hooks.penaltyResolved)
    {
        m_hooks.penaltyResolved();
    }
}

void PhaseStateMachine::schedulePenaltyRequest(double delayMs)
{
    cancelTimer(m_penaltyTimer);
    const std::uint64_t generation = m_frozenGeneration;
    m_penaltyTimer = m_timers.schedule(delayMs, [this, generation]() {
        m_penaltyTimer = 0;
        if (generation != m_frozenGeneration || m_localState != LocalState::Frozen || m_penaltyContentReady)
        {
            return;
        }
        record("phase.penalty_quiz_requested", {});
        send(net::wire::RequestUnfreezeQuiz, net::encodeEmpty());
    });
}

void PhaseStateMachine::startInvulnerability()
{
    if (!m_capabilities.invulnerability)
    {
        return;
    }
    m_invulnerable = true;
    const std::uint64_t generation = ++m_invulnerabilityGeneration;
    cancelTimer(m_invulnerabilityTimer);
    m_invulnerabilityTimer = m_timers.schedule(m_timing.invulnerabilityMs, [this, generation]() {
        m_invulnerabilityTimer = 0;
        if (generation != m_invulnerabilityGeneration)
        {
            return;
        }
        m_invulnerable = false;
        record("phase.invulnerability_expired", {});
    });
}

void PhaseStateMachine::endInvulnerability()
{
    m_invulnerable = false;
    ++m_invulnerabilityGeneration;
    cancelTimer(m_invulnerabilityTimer);
}

void PhaseStateMachine::showAnnouncement(std::string text, double durationMs)
{
    m_announcementVisible = true;
    m_announcementText = std::move(text);
    m_announcementEndsAtMs = m_timers.nowMs() + durationMs;
    const std::uint64_t generation = ++m_announcementGeneration;
    cancelTimer(m_announcementTimer);
    m_announcementTimer = m_timers.schedule(durationMs, [this, generation]() {
        m_announcementTimer = 0;
        if (generation == m_announcementGeneration)
        {
            hideAnnouncement();
        }
    });
}

void PhaseStateMachine::capAnnouncement(double capMs)
{
    if (!m_announcementVisible || announcementRemainingMs() <= capMs)
    {
        return;
    }
    std::string text = m_announcementText;
    showAnnouncement(std::move(text), capMs);
}

void PhaseStateMachine::hideAnnouncement()
{
    m_announcementVisible = false;
    m_announcementText.clear();
    ++m_announcementGeneration;
    cancelTimer(m_announcementTimer);
}

void PhaseStateMachine::cancelTimer(TimerScheduler::TimerId &id)
{
    if (id != 0)
    {
        m_timers.cancel(id);
        id = 0;
    }
}

void PhaseStateMachine::notifyPhase(GamePhase previous)
{
    const GamePhase current = effectivePhase();
    if (current == previous)
    {
        return;
    }
    record("session.phase_changed", {{"from", gamePhaseToString(previous)},
                                     {"to", gamePhaseToString(current)},
                                     {"round", std::to_string(m_round.currentRound)}});
    if (m_hooks.phaseChanged)
    {
        m_hooks.phaseChanged(previous, current);
    }
}

std::string PhaseStateMachine::nameOf(const std::string &id) const
{
    if (m_hooks.displayName)
    {
        std::string name = m_hooks.displayName(id);
        if (!name.empty())
        {
            return name;
        }
    }
    return id;
}

void PhaseStateMachine::send(const char *event, const json::JsonValue &payload)
{
    m_channel.send(event, payload);
}

void PhaseStateMachine::record(std::string_view eventName, TelemetrySink::Payload payload) const
{
    recordTelemetry(m_telemetry, eventName, payload);
}
