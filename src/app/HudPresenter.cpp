#include "app/HudPresenter.h"

#include "session/MatchSession.h"
#include "telemetry/TelemetrySink.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace
{

std::string scoreName(const MatchFrame &frame, const std::string &id)
{
    if (id == frame.localId)
    {
        return "You";
    }
    for (const auto &remote : frame.remotes)
    {
        if (remote.id == id && !remote.name.empty())
        {
            return remote.name;
        }
    }
    return id;
}

bool expired(const std::optional<double> &shownAtMs, double durationMs, double nowMs)
{
    return shownAtMs && nowMs - *shownAtMs >= durationMs;
}

} // namespace

HudPresenter::HudPresenter(CollectibleConfig collectibles, CapabilityFlags capabilities)
    : m_collectibles(collectibles), m_capabilities(capabilities)
{
}

HudPresenter::~HudPresenter()
{
    unsubscribe();
}

void HudPresenter::setEventBus(std::shared_ptr<EventBus> bus)
{
    if (m_eventBus == bus)
    {
        return;
    }
    unsubscribe();
    m_eventBus = std::move(bus);
    subscribe();
}

void HudPresenter::setTelemetrySink(std::shared_ptr<TelemetrySink> sink)
{
    m_telemetry = std::move(sink);
}

void HudPresenter::showWarningMessage(const std::string &message, double durationMs)
{
    m_warning = message;
    m_warningDurationMs = durationMs > 0.0 ? durationMs : 1500.0;
    m_warningShownAtMs.reset();
    recordTelemetry(m_telemetry, "hud.warning", {{"message", message}});
}

HudModel HudPresenter::present(const MatchFrame &frame)
{
    HudModel model;
    model.unconsumedEvents = updateUnconsumedEvents();

    if (!m_toast.empty())
    {
        if (!m_toastShownAtMs)
        {
            m_toastShownAtMs = frame.nowMs;
        }
        if (expired(m_toastShownAtMs, ToastDurationMs, frame.nowMs))
        {
            m_toast.clear();
            m_toastShownAtMs.reset();
        }
    }
    model.toast = m_toast;

    if (!m_warning.empty())
    {
        if (!m_warningShownAtMs)
        {
            m_warningShownAtMs = frame.nowMs;
        }
        if (expired(m_warningShownAtMs, m_warningDurationMs, frame.nowMs))
        {
            m_warning.clear();
            m_warningShownAtMs.reset();
        }
    }
    model.warning = m_warning;

    std::string phaseLine;
    if (frame.round.totalRounds > 0)
    {
        phaseLine = "Round " + std::to_string(frame.round.currentRound) + "/" +
                    std::to_string(frame.round.totalRounds) + "  ";
    }
    phaseLine += phaseDisplayName(frame.phase);
    if (frame.phase == GamePhase::Hunt && frame.round.clockRemainingMs > 0.0)
    {
        phaseLine += "  " + formatClock(frame.round.clockRemainingMs);
    }
    model.phaseLine = std::move(phaseLine);

    if (frame.phase != GamePhase::Lobby)
    {
        model.roleLine = frame.localChaser ? "You are the chaser" : "Run!";
        if (frame.invulnerable)
        {
            model.roleLine += "  (protected)";
        }
    }
    model.announcement = frame.announcement;

    if (frame.connectionLost)
    {
        model.banner = "Connection lost, rejoining...";
    }
    else if (frame.penaltyQuizLoading)
    {
        model.banner = "Frozen! Loading penalty quiz...";
    }
    else if (frame.phase == GamePhase::FrozenLocal)
    {
        model.banner = "Frozen! Answer with 1-4 to thaw";
    }

    if (frame.quiz && frame.phase == GamePhase::Quiz)
    {
        model.quizLines.push_back(frame.quiz->question);
        for (std::size_t i = 0; i < frame.quiz->options.size(); ++i)
        {
            model.quizLines.push_back(std::to_string(i + 1) + ") " + frame.quiz->options[i]);
        }
    }

    std::vector<std::pair<std::string, int>> scores;
    scores.reserve(frame.scores.size());
    for (const auto &entry : frame.scores)
    {
        scores.emplace_back(scoreName(frame, entry.first), entry.second);
    }
    std::stable_sort(scores.begin(), scores.end(), [](const auto &lhs, const auto &rhs) {
        if (lhs.second != rhs.second)
        {
            return lhs.second > rhs.second;
        }
        return lhs.first < rhs.first;
    });
    for (const auto &entry : scores)
    {
        model.scoreLines.push_back(entry.first + "  " + std::to_string(entry.second));
    }

    model.inventoryLine =
        "Traps " + std::to_string(frame.trapInventory) + "/" + std::to_string(m_collectibles.trapInventoryMax);
    if (m_capabilities.stamina)
    {
        const int percent = static_cast<int>(std::lround(std::clamp(frame.stamina, 0.0f, 1.0f) * 100.0f));
        model.staminaLine = "Stamina " + std::to_string(percent) + "%";
    }
    return model;
}

std::string HudPresenter::formatClock(double remainingMs)
{
    const int totalSeconds = static_cast<int>(std::ceil(std::max(0.0, remainingMs) / 1000.0));
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d", totalSeconds / 60, totalSeconds % 60);
    return buffer;
}

const char *HudPresenter::phaseDisplayName(GamePhase phase)
{
    switch (phase)
    {
    case GamePhase::Lobby:
        return "Lobby";
    case GamePhase::Quiz:
        return "Quiz";
    case GamePhase::Hunt:
        return "Hunt";
    case GamePhase::FrozenLocal:
        return "Frozen";
    case GamePhase::RoundEnd:
        return "Round over";
    case GamePhase::GameEnd:
        return "Game over";
    case GamePhase::Spectating:
        return "Spectating";
    }
    return "Unknown";
}

void HudPresenter::subscribe()
{
    if (!m_eventBus)
    {
        return;
    }

    m_phaseHandler = m_eventBus->subscribe(PhaseChangedEventName, [this](const EventContext &ctx) {
        if (const auto *payload = eventPayload<PhaseChangedEvent>(ctx))
        {
            handlePhaseChanged(*payload);
        }
    });
    m_lobbyHandler = m_eventBus->subscribe(RouteToLobbyEventName, [this](const EventContext &ctx) {
        if (const auto *payload = eventPayload<RouteToLobbyEvent>(ctx))
        {
            handleRouteToLobby(*payload);
        }
    });
}

void HudPresenter::unsubscribe()
{
    m_phaseHandler.reset();
    m_lobbyHandler.reset();
}

void HudPresenter::handlePhaseChanged(const PhaseChangedEvent &event)
{
    switch (event.current)
    {
    case GamePhase::Hunt:
        if (event.previous != GamePhase::FrozenLocal)
        {
            setToast("Round " + std::to_string(event.round) + " hunt!");
        }
        break;
    case GamePhase::RoundEnd:
        setToast("Round " + std::to_string(event.round) + " complete");
        break;
    case GamePhase::GameEnd:
        setToast("Game over");
        break;
    default:
        break;
    }
}

void HudPresenter::handleRouteToLobby(const RouteToLobbyEvent &event)
{
    setToast("Returned to lobby (" + event.reason + ")");
}

void HudPresenter::setToast(std::string text)
{
    m_toast = std::move(text);
    m_toastShownAtMs.reset();
}

std::size_t HudPresenter::updateUnconsumedEvents()
{
    if (!m_eventBus)
    {
        return 0;
    }
    const std::size_t unconsumed = m_eventBus->unconsumedCount();
    if (unconsumed >= UnconsumedWarningThreshold)
    {
        const std::string warningText = std::string("Events lost ") + std::to_string(unconsumed);
        if (m_warning != warningText)
        {
            showWarningMessage(warningText);
        }
    }
    return unconsumed;
}
