#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

class TelemetrySink
{
  public:
    using Payload = std::unordered_map<std::string, std::string>;

    virtual ~TelemetrySink() = default;

    virtual void recordEvent(std::string_view eventName, const Payload &payload) = 0;
    virtual void flush() {}
};

class NullTelemetrySink : public TelemetrySink
{
  public:
    void recordEvent(std::string_view, const Payload &) override {}
};

/// Null-tolerant helper so engine code can log through an optional sink without repeating the check.
inline void recordTelemetry(const std::shared_ptr<TelemetrySink> &sink, std::string_view eventName,
                            const TelemetrySink::Payload &payload = {})
{
    if (sink)
    {
        sink->recordEvent(eventName, payload);
    }
}
