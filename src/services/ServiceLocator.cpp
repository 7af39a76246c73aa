#include "services/ServiceLocator.h"

#include <utility>

ServiceLocator &ServiceLocator::instance()
{
    static ServiceLocator locator;
    return locator;
}

ServiceLocator::ServiceLocator()
    : m_nullTelemetry(std::make_shared<NullTelemetrySink>()), m_nullEventBus(std::make_shared<NullEventBus>())
{
}

void ServiceLocator::setTelemetrySink(std::shared_ptr<TelemetrySink> sink)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_telemetry = std::move(sink);
}

void ServiceLocator::setEventBus(std::shared_ptr<EventBus> bus)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_eventBus = std::move(bus);
}

void ServiceLocator::setClientStore(ClientStore *store)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_store = store;
}

std::shared_ptr<TelemetrySink> ServiceLocator::telemetrySink() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_telemetry ? m_telemetry : m_nullTelemetry;
}

std::shared_ptr<EventBus> ServiceLocator::eventBus() const
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_eventBus)
        {
            return m_eventBus;
        }
    }
    reportFallback("event_bus");
    return m_nullEventBus;
}

ClientStore *ServiceLocator::clientStore() const
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_store)
        {
            return m_store;
        }
    }
    reportFallback("client_store");
    return nullptr;
}

void ServiceLocator::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_telemetry.reset();
    m_eventBus.reset();
    m_store = nullptr;
}

void ServiceLocator::reportFallback(const char *service) const
{
    telemetrySink()->recordEvent("service_locator.fallback", {{"service", service}, {"reason", "unregistered"}});
}
