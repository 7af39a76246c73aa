#include "telemetry/PerformanceBudgetMonitor.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <sstream>
#include <string_view>
#include <utility>

namespace telemetry
{

namespace
{

std::string formatMs(double value)
{
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(3);
    oss << value;
    return oss.str();
}

} // namespace

PerformanceBudgetMonitor::PerformanceBudgetMonitor() = default;

PerformanceBudgetMonitor::PerformanceBudgetMonitor(PerformanceBudgetConfig budget,
                                                   std::shared_ptr<TelemetrySink> telemetry)
    : m_budget(std::move(budget)), m_telemetry(std::move(telemetry))
{
}

void PerformanceBudgetMonitor::setBudget(PerformanceBudgetConfig budget)
{
    m_budget = std::move(budget);
}

std::optional<BudgetViolation> PerformanceBudgetMonitor::evaluate(const StageTimingSample &sample) const
{
    const double toleranceMs = static_cast<double>(std::max(0.0f, m_budget.toleranceMs));
    struct StageInfo
    {
        std::string_view id;
        double sample;
        float budget;
    };
    const std::array<StageInfo, 3> stages{{
        StageInfo{"pump", sample.pumpMs, m_budget.pumpMs},
        StageInfo{"simulate", sample.simulateMs, m_budget.simulateMs},
        StageInfo{"render", sample.renderMs, m_budget.renderMs},
    }};

    for (const StageInfo &stage : stages)
    {
        if (!(stage.budget > 0.0f) || !std::isfinite(stage.sample))
        {
            continue;
        }
        const double threshold = static_cast<double>(stage.budget) + toleranceMs;
        if (stage.sample > threshold)
        {
            BudgetViolation violation;
            violation.stage = std::string(stage.id);
            violation.sampleMs = stage.sample;
            violation.budgetMs = static_cast<double>(stage.budget);
            return violation;
        }
    }
    return std::nullopt;
}

std::optional<BudgetViolation> PerformanceBudgetMonitor::report(const StageTimingSample &sample)
{
    auto violation = evaluate(sample);
    if (violation)
    {
        ++m_violations;
        recordTelemetry(m_telemetry, "perf.budget_exceeded",
                        {{"stage", violation->stage},
                         {"sample_ms", formatMs(violation->sampleMs)},
                         {"budget_ms", formatMs(violation->budgetMs)}});
    }
    return violation;
}

} // namespace telemetry
