#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

/// One-shot timers driven by an explicit clock. Nothing fires outside advance().
class TimerScheduler
{
  public:
    using TimerId = std::uint64_t;
    using Callback = std::function<void()>;

    TimerId schedule(double delayMs, Callback callback);
    bool cancel(TimerId id);
    void cancelAll();

    /// Moves the clock forward and fires due timers in due order. Returns the number fired.
    std::size_t advance(double deltaMs);

    [[nodiscard]] double nowMs() const noexcept { return m_nowMs; }
    [[nodiscard]] bool isPending(TimerId id) const;
    [[nodiscard]] std::size_t pendingCount() const noexcept { return m_timers.size(); }

  private:
    struct Entry
    {
        double dueMs = 0.0;
        Callback callback;
    };

    std::map<TimerId, Entry> m_timers;
    double m_nowMs = 0.0;
    TimerId m_nextId = 1;
};
