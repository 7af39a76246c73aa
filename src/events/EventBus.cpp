#include "events/EventBus.h"

#include <algorithm>
#include <exception>
#include <utility>

EventBus::SubscriptionToken::SubscriptionToken(EventBus *bus, std::string eventName, HandlerId handlerId)
    : m_bus(bus), m_eventName(std::move(eventName)), m_handlerId(handlerId)
{
}

EventBus::SubscriptionToken::~SubscriptionToken()
{
    reset();
}

EventBus::SubscriptionToken::SubscriptionToken(SubscriptionToken &&other) noexcept
    : m_bus(std::exchange(other.m_bus, nullptr)),
      m_eventName(std::move(other.m_eventName)),
      m_handlerId(std::exchange(other.m_handlerId, 0))
{
    other.m_eventName.clear();
}

EventBus::SubscriptionToken &EventBus::SubscriptionToken::operator=(SubscriptionToken &&other) noexcept
{
    if (this != &other)
    {
        reset();
        m_bus = std::exchange(other.m_bus, nullptr);
        m_eventName = std::move(other.m_eventName);
        m_handlerId = std::exchange(other.m_handlerId, 0);
        other.m_eventName.clear();
    }
    return *this;
}

void EventBus::SubscriptionToken::reset()
{
    EventBus *bus = std::exchange(m_bus, nullptr);
    const HandlerId id = std::exchange(m_handlerId, 0);
    const std::string name = std::move(m_eventName);
    m_eventName.clear();
    if (bus && id != 0)
    {
        bus->unsubscribe(name, id);
    }
}

BasicEventBus::BasicEventBus(std::shared_ptr<TelemetrySink> telemetry) : m_telemetry(std::move(telemetry)) {}

void BasicEventBus::setTelemetrySink(std::shared_ptr<TelemetrySink> telemetry)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_telemetry = std::move(telemetry);
}

void BasicEventBus::setExpiryFrames(std::size_t frames)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_expiryFrames = std::max<std::size_t>(1, frames);
}

void BasicEventBus::setMaxPumpPasses(std::size_t passes)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_maxPumpPasses = std::max<std::size_t>(1, passes);
}

EventBus::SubscriptionToken BasicEventBus::subscribe(const std::string &eventName, EventHandler handler)
{
    if (!handler)
    {
        return {};
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    const HandlerId id = m_nextId++;
    m_subscribers[eventName].push_back(Subscriber{id, std::move(handler)});
    return SubscriptionToken(this, eventName, id);
}

void BasicEventBus::unsubscribe(const std::string &eventName, HandlerId handlerId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_subscribers.find(eventName);
    if (it == m_subscribers.end())
    {
        return;
    }
    std::vector<Subscriber> &list = it->second;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [handlerId](const Subscriber &subscriber) { return subscriber.id == handlerId; }),
               list.end());
    if (list.empty())
    {
        m_subscribers.erase(it);
    }
}

void BasicEventBus::dispatch(const std::string &eventName, const EventContext &context)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queue.push_back(Queued{eventName, context, 0});
}

std::size_t BasicEventBus::pump()
{
    std::size_t maxPasses = 1;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        maxPasses = m_maxPumpPasses;
    }

    std::size_t invocations = 0;
    for (std::size_t pass = 0; pass < maxPasses; ++pass)
    {
        const std::vector<Batch> batches = takeDeliverable();
        if (batches.empty())
        {
            return invocations;
        }
        invocations += deliver(batches);
    }

    // Handlers kept raising new events. Whatever is left waits for the next frame.
    std::size_t pending = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        pending = m_queue.size();
    }
    if (pending > 0)
    {
        report("event_bus.pump_truncated", {{"passes", std::to_string(maxPasses)}, {"pending", std::to_string(pending)}});
    }
    return invocations;
}

std::vector<BasicEventBus::Batch> BasicEventBus::takeDeliverable()
{
    std::vector<Batch> batches;
    std::lock_guard<std::mutex> lock(m_mutex);
    std::deque<Queued> parked;
    for (Queued &queued : m_queue)
    {
        const auto it = m_subscribers.find(queued.name);
        if (it == m_subscribers.end() || it->second.empty())
        {
            parked.push_back(std::move(queued));
            continue;
        }
        batches.push_back(Batch{std::move(queued.name), std::move(queued.context), it->second});
    }
    m_queue = std::move(parked);
    return batches;
}

std::size_t BasicEventBus::deliver(const std::vector<Batch> &batches)
{
    std::size_t invocations = 0;
    for (const Batch &batch : batches)
    {
        for (const Subscriber &subscriber : batch.subscribers)
        {
            ++invocations;
            try
            {
                subscriber.handler(batch.context);
            }
            catch (const std::exception &ex)
            {
                report("event_bus.warning",
                       {{"event", batch.name}, {"reason", "handler_exception"}, {"message", ex.what()}});
            }
        }
    }
    return invocations;
}

void BasicEventBus::advanceFrame()
{
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_queue.begin(); it != m_queue.end();)
        {
            if (++it->framesWaiting < m_expiryFrames)
            {
                ++it;
                continue;
            }
            ++m_unconsumed[it->name];
            ++m_unconsumedTotal;
            expired.push_back(std::move(it->name));
            it = m_queue.erase(it);
        }
    }

    for (const std::string &name : expired)
    {
        report("event_bus.no_listener", {{"event", name}});
    }
}

void BasicEventBus::clearPending()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queue.clear();
}

std::size_t BasicEventBus::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

std::size_t BasicEventBus::unconsumedCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_unconsumedTotal;
}

std::size_t BasicEventBus::unconsumedCount(const std::string &eventName) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_unconsumed.find(eventName);
    return it == m_unconsumed.end() ? 0 : it->second;
}

void BasicEventBus::report(const char *eventName, TelemetrySink::Payload payload) const
{
    std::shared_ptr<TelemetrySink> telemetry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        telemetry = m_telemetry;
    }
    recordTelemetry(telemetry, eventName, payload);
}
