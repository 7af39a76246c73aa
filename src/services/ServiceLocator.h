#pragma once

#include <memory>
#include <mutex>

#include "events/EventBus.h"
#include "telemetry/TelemetrySink.h"

class ClientStore;

/// Process-wide collaborators of the debug client: telemetry sink, event bus and the on-disk client store.
/// Engine classes take these as constructor arguments; only scenes read them from here.
class ServiceLocator
{
  public:
    static ServiceLocator &instance();

    void setTelemetrySink(std::shared_ptr<TelemetrySink> sink);
    void setEventBus(std::shared_ptr<EventBus> bus);
    /// Not owned. The application keeps the store alive until clear().
    void setClientStore(ClientStore *store);

    /// Never null. Falls back to a NullTelemetrySink.
    std::shared_ptr<TelemetrySink> telemetrySink() const;
    /// Never null. Falls back to a NullEventBus and reports service_locator.fallback.
    std::shared_ptr<EventBus> eventBus() const;
    /// May be null when the store failed to initialise; callers run without persistence then.
    ClientStore *clientStore() const;

    void clear();

  private:
    ServiceLocator();

    void reportFallback(const char *service) const;

    mutable std::mutex m_mutex;
    std::shared_ptr<TelemetrySink> m_telemetry;
    std::shared_ptr<EventBus> m_eventBus;
    ClientStore *m_store = nullptr;
    std::shared_ptr<TelemetrySink> m_nullTelemetry;
    std::shared_ptr<EventBus> m_nullEventBus;
};
