#pragma once

#include <memory>
#include <optional>
#include <string>

#include "config/ClientConfig.h"
#include "telemetry/TelemetrySink.h"

namespace telemetry
{

struct StageTimingSample
{
    double pumpMs = 0.0;
    double simulateMs = 0.0;
    double renderMs = 0.0;
};

struct BudgetViolation
{
    std::string stage;
    double sampleMs = 0.0;
    double budgetMs = 0.0;
};

/// Compares one frame's stage timings to the configured budgets. Only the first stage over budget is reported.
class PerformanceBudgetMonitor
{
  public:
    PerformanceBudgetMonitor();
    explicit PerformanceBudgetMonitor(PerformanceBudgetConfig budget, std::shared_ptr<TelemetrySink> telemetry = nullptr);

    void setBudget(PerformanceBudgetConfig budget);
    [[nodiscard]] const PerformanceBudgetConfig &budget() const { return m_budget; }

    [[nodiscard]] std::optional<BudgetViolation> evaluate(const StageTimingSample &sample) const;

    /// evaluate() plus a perf.budget_exceeded record when a stage is over.
    std::optional<BudgetViolation> report(const StageTimingSample &sample);
    [[nodiscard]] std::size_t violationCount() const noexcept { return m_violations; }

  private:
    PerformanceBudgetConfig m_budget{};
    std::shared_ptr<TelemetrySink> m_telemetry;
    std::size_t m_violations = 0;
};

} // namespace telemetry
