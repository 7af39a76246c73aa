#pragma once

#include <any>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "telemetry/TelemetrySink.h"

struct EventContext
{
    std::any payload;
};

template <typename T> const T *eventPayload(const EventContext &context)
{
    return std::any_cast<T>(&context.payload);
}

/// Frame-pumped event queue between the network channel, the match session and the HUD.
/// Dispatch never delivers synchronously; handlers run inside pump() on the caller's thread.
class EventBus
{
  public:
    using HandlerId = std::size_t;
    using EventHandler = std::function<void(const EventContext &)>;

    /// Move-only handle for one subscription. Destroying or resetting it unsubscribes.
    class SubscriptionToken
    {
      public:
        SubscriptionToken() = default;
        SubscriptionToken(EventBus *bus, std::string eventName, HandlerId handlerId);
        ~SubscriptionToken();

        SubscriptionToken(const SubscriptionToken &) = delete;
        SubscriptionToken &operator=(const SubscriptionToken &) = delete;
        SubscriptionToken(SubscriptionToken &&other) noexcept;
        SubscriptionToken &operator=(SubscriptionToken &&other) noexcept;

        void reset();

        [[nodiscard]] bool valid() const noexcept { return m_bus != nullptr && m_handlerId != 0; }
        explicit operator bool() const noexcept { return valid(); }
        const std::string &eventName() const noexcept { return m_eventName; }

      private:
        EventBus *m_bus = nullptr;
        std::string m_eventName;
        HandlerId m_handlerId = 0;
    };

    virtual ~EventBus() = default;

    virtual SubscriptionToken subscribe(const std::string &eventName, EventHandler handler) = 0;
    virtual void unsubscribe(const std::string &eventName, HandlerId handlerId) = 0;
    virtual void dispatch(const std::string &eventName, const EventContext &context) = 0;
    /// Delivers queued events. Returns the number of handler invocations.
    virtual std::size_t pump() = 0;
    /// Ages events nobody listens to and drops the ones past their frame budget.
    virtual void advanceFrame() = 0;
    /// Drops queued events without counting them as lost.
    virtual void clearPending() = 0;
    virtual std::size_t pendingCount() const = 0;
    virtual std::size_t unconsumedCount() const = 0;
};

class NullEventBus : public EventBus
{
  public:
    SubscriptionToken subscribe(const std::string &, EventHandler) override { return {}; }
    void unsubscribe(const std::string &, HandlerId) override {}
    void dispatch(const std::string &, const EventContext &) override {}
    std::size_t pump() override { return 0; }
    void advanceFrame() override {}
    void clearPending() override {}
    std::size_t pendingCount() const override { return 0; }
    std::size_t unconsumedCount() const override { return 0; }
};

class BasicEventBus : public EventBus
{
  public:
    explicit BasicEventBus(std::shared_ptr<TelemetrySink> telemetry = nullptr);

    void setTelemetrySink(std::shared_ptr<TelemetrySink> telemetry);
    /// Frames an undelivered event survives before it is dropped and counted as unconsumed.
    void setExpiryFrames(std::size_t frames);
    /// Events dispatched by handlers are delivered in the same pump, up to this many passes.
    void setMaxPumpPasses(std::size_t passes);

    SubscriptionToken subscribe(const std::string &eventName, EventHandler handler) override;
    void unsubscribe(const std::string &eventName, HandlerId handlerId) override;
    void dispatch(const std::string &eventName, const EventContext &context) override;
    std::size_t pump() override;
    void advanceFrame() override;
    void clearPending() override;
    std::size_t pendingCount() const override;
    std::size_t unconsumedCount() const override;
    std::size_t unconsumedCount(const std::string &eventName) const;

  private:
    struct Subscriber
    {
        HandlerId id = 0;
        EventHandler handler;
    };

    struct Queued
    {
        std::string name;
        EventContext context;
        std::size_t framesWaiting = 0;
    };

    struct Batch
    {
        std::string name;
        EventContext context;
        std::vector<Subscriber> subscribers;
    };

    std::vector<Batch> takeDeliverable();
    std::size_t deliver(const std::vector<Batch> &batches);
    void report(const char *eventName, TelemetrySink::Payload payload) const;

    std::shared_ptr<TelemetrySink> m_telemetry;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::vector<Subscriber>> m_subscribers;
    std::deque<Queued> m_queue;
    std::map<std::string, std::size_t> m_unconsumed;
    std::size_t m_unconsumedTotal = 0;
    std::size_t m_expiryFrames = 2;
    std::size_t m_maxPumpPasses = 4;
    HandlerId m_nextId = 1;
};
