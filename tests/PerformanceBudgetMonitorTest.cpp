#include "telemetry/PerformanceBudgetMonitor.h"
#include "telemetry/TelemetrySink.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{

class RecordingTelemetrySink : public TelemetrySink
{
  public:
    void recordEvent(std::string_view name, const Payload &payload) override
    {
        events.push_back({std::string(name), payload});
    }

    struct Entry
    {
        std::string name;
        Payload payload;
    };

    std::vector<Entry> events;
};

bool assertTrue(bool condition, const char *message)
{
    if (!condition)
    {
        std::cerr << message << '\n';
        return false;
    }
    return true;
}

} // namespace

int main()
{
    bool success = true;

    PerformanceBudgetConfig config;
    config.pumpMs = 0.0f;
    config.simulateMs = 0.01f;
    config.renderMs = 0.0f;
    config.toleranceMs = 0.0f;

    auto sink = std::make_shared<RecordingTelemetrySink>();
    telemetry::PerformanceBudgetMonitor monitor(config, sink);
    telemetry::StageTimingSample sample;
    sample.pumpMs = 50.0;
    sample.simulateMs = 0.5;

    auto violation = monitor.evaluate(sample);
    success &= assertTrue(violation.has_value(), "Expected simulate budget violation to be detected");
    if (violation)
    {
        success &= assertTrue(violation->stage == "simulate", "Disabled pump budget should be skipped");
    }
    success &= assertTrue(sink->events.empty(), "evaluate() should not record telemetry");

    monitor.report(sample);
    success &= assertTrue(sink->events.size() == 1, "report() should record one event per violation");
    if (!sink->events.empty())
    {
        success &= assertTrue(sink->events.front().name == "perf.budget_exceeded", "Unexpected telemetry event name");
        success &= assertTrue(sink->events.front().payload.at("stage") == "simulate",
                              "Telemetry should name the offending stage");
    }
    success &= assertTrue(monitor.violationCount() == 1, "Violation count should track reports");

    PerformanceBudgetConfig toleranceConfig;
    toleranceConfig.pumpMs = 1.0f;
    toleranceConfig.toleranceMs = 0.5f;
    telemetry::PerformanceBudgetMonitor toleranceMonitor(toleranceConfig);
    telemetry::StageTimingSample toleranceSample;
    toleranceSample.pumpMs = 1.2;
    success &= assertTrue(!toleranceMonitor.evaluate(toleranceSample).has_value(),
                          "Timing within tolerance should not trigger a violation");
    toleranceSample.pumpMs = 1.7;
    success &= assertTrue(toleranceMonitor.evaluate(toleranceSample).has_value(),
                          "Timing beyond tolerance should trigger a violation");
    success &= assertTrue(!toleranceMonitor.report({0.1, 0.1, 0.1}).has_value(),
                          "Samples under budget should not be reported");

    return success ? 0 : 1;
}
