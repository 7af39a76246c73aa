#pragma once

#include "config/ClientConfig.h"
#include "events/EventBus.h"
#include "events/MatchEvents.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class TelemetrySink;
struct MatchFrame;

/// Text the HUD draws for one frame. Empty strings are not drawn.
struct HudModel
{
    std::string phaseLine;
    std::string roleLine;
    std::string announcement;
    std::string banner;
    std::vector<std::string> quizLines;
    std::vector<std::string> scoreLines;
    std::string inventoryLine;
    std::string staminaLine;
    std::string toast;
    std::string warning;
    std::size_t unconsumedEvents = 0;
};

/// Formats match frames into HUD text and turns phase and lobby events into short toasts.
class HudPresenter
{
  public:
    HudPresenter(CollectibleConfig collectibles, CapabilityFlags capabilities);
    ~HudPresenter();

    void setEventBus(std::shared_ptr<EventBus> bus);
    void setTelemetrySink(std::shared_ptr<TelemetrySink> sink);

    void showWarningMessage(const std::string &message, double durationMs = 0.0);

    HudModel present(const MatchFrame &frame);

    const std::string &lastWarningMessage() const { return m_warning; }
    const std::string &lastToast() const { return m_toast; }

    static std::string formatClock(double remainingMs);
    static const char *phaseDisplayName(GamePhase phase);

    static constexpr double ToastDurationMs = 2000.0;
    static constexpr std::size_t UnconsumedWarningThreshold = 10;

  private:
    void subscribe();
    void unsubscribe();
    void handlePhaseChanged(const PhaseChangedEvent &event);
    void handleRouteToLobby(const RouteToLobbyEvent &event);
    void setToast(std::string text);
    std::size_t updateUnconsumedEvents();

    CollectibleConfig m_collectibles;
    CapabilityFlags m_capabilities;
    std::shared_ptr<EventBus> m_eventBus;
    std::shared_ptr<TelemetrySink> m_telemetry;
    EventBus::SubscriptionToken m_phaseHandler;
    EventBus::SubscriptionToken m_lobbyHandler;

    std::string m_toast;
    std::optional<double> m_toastShownAtMs;
    std::string m_warning;
    double m_warningDurationMs = 0.0;
    std::optional<double> m_warningShownAtMs;
};
