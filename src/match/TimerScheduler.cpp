#include "match/TimerScheduler.h"

#include <algorithm>
#include <utility>

TimerScheduler::TimerId TimerScheduler::schedule(double delayMs, Callback callback)
{
    const TimerId id = m_nextId++;
    m_timers.emplace(id, Entry{m_nowMs + std::max(0.0, delayMs), std::move(callback)});
    return id;
}

bool TimerScheduler::cancel(TimerId id)
{
    return m_timers.erase(id) > 0;
}

void TimerScheduler::cancelAll()
{
    m_timers.clear();
}

std::size_t TimerScheduler::advance(double deltaMs)
{
    m_nowMs += std::max(0.0, deltaMs);

    std::size_t fired = 0;
    while (true)
    {
        // Callbacks may schedule or cancel, so the earliest due entry is looked up again each round.
        auto due = m_timers.end();
        for (auto it = m_timers.begin(); it != m_timers.end(); ++it)
        {
            if (it->second.dueMs > m_nowMs)
            {
                continue;
            }
            if (due == m_timers.end() || it->second.dueMs < due->second.dueMs)
            {
                due = it;
            }
        }
        if (due == m_timers.end())
        {
            break;
        }

        Callback callback = std::move(due->second.callback);
        m_timers.erase(due);
        ++fired;
        if (callback)
        {
            callback();
        }
    }
    return fired;
}

bool TimerScheduler::isPending(TimerId id) const
{
    return m_timers.find(id) != m_timers.end();
}
