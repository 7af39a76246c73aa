#pragma once

#include <cstddef>

/// Timestamp gate for outgoing position reports. Bursts inside one interval collapse to a single send.
class PositionThrottle
{
  public:
    explicit PositionThrottle(double intervalMs = 20.0) : m_intervalMs(intervalMs > 0.0 ? intervalMs : 0.0) {}

    bool tryAcquire(double nowMs)
    {
        if (m_hasSent && nowMs - m_lastSentMs < m_intervalMs)
        {
            return false;
        }
        m_hasSent = true;
        m_lastSentMs = nowMs;
        ++m_acceptedCount;
        return true;
    }

    void reset()
    {
        m_hasSent = false;
        m_lastSentMs = 0.0;
    }

    [[nodiscard]] double intervalMs() const noexcept { return m_intervalMs; }
    [[nodiscard]] std::size_t acceptedCount() const noexcept { return m_acceptedCount; }

  private:
    double m_intervalMs;
    double m_lastSentMs = 0.0;
    bool m_hasSent = false;
    std::size_t m_acceptedCount = 0;
};
