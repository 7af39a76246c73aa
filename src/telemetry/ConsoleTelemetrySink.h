#pragma once

#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "telemetry/TelemetrySink.h"

/// One line per event: "[qbit HH:MM:SS] name key=value ...". Keys are sorted, values with spaces are quoted.
class ConsoleTelemetrySink : public TelemetrySink
{
  public:
    ConsoleTelemetrySink();
    explicit ConsoleTelemetrySink(std::ostream &out);

    /// Events whose name starts with one of these prefixes are counted but not printed.
    void setMutedPrefixes(std::vector<std::string> prefixes);
    void setTimestamps(bool enabled);

    void recordEvent(std::string_view eventName, const Payload &payload) override;
    void flush() override;

    std::size_t mutedCount() const;

  private:
    bool isMuted(std::string_view eventName) const;

    mutable std::mutex m_mutex;
    std::ostream &m_out;
    std::vector<std::string> m_mutedPrefixes;
    std::size_t m_muted = 0;
    bool m_timestamps = true;
};
