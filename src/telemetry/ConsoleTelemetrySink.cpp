#include "telemetry/ConsoleTelemetrySink.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <utility>

namespace
{

void writeClock(std::ostream &out)
{
    const std::time_t time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    out << ' ' << std::put_time(&tm, "%H:%M:%S");
}

void writeValue(std::ostream &out, const std::string &value)
{
    if (!value.empty() && value.find_first_of(" \t\"") == std::string::npos)
    {
        out << value;
        return;
    }
    out << '"';
    for (const char c : value)
    {
        if (c == '"' || c == '\\')
        {
            out << '\\';
        }
        out << c;
    }
    out << '"';
}

} // namespace

ConsoleTelemetrySink::ConsoleTelemetrySink() : ConsoleTelemetrySink(std::clog) {}

ConsoleTelemetrySink::ConsoleTelemetrySink(std::ostream &out) : m_out(out) {}

void ConsoleTelemetrySink::setMutedPrefixes(std::vector<std::string> prefixes)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_mutedPrefixes = std::move(prefixes);
}

void ConsoleTelemetrySink::setTimestamps(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_timestamps = enabled;
}

bool ConsoleTelemetrySink::isMuted(std::string_view eventName) const
{
    return std::any_of(m_mutedPrefixes.begin(), m_mutedPrefixes.end(), [eventName](const std::string &prefix) {
        return !prefix.empty() && eventName.substr(0, prefix.size()) == prefix;
    });
}

void ConsoleTelemetrySink::recordEvent(std::string_view eventName, const Payload &payload)
{
    std::vector<const Payload::value_type *> fields;
    fields.reserve(payload.size());
    for (const auto &field : payload)
    {
        fields.push_back(&field);
    }
    std::sort(fields.begin(), fields.end(), [](const auto *lhs, const auto *rhs) { return lhs->first < rhs->first; });

    std::lock_guard<std::mutex> lock(m_mutex);
    if (isMuted(eventName))
    {
        ++m_muted;
        return;
    }
    m_out << "[qbit";
    if (m_timestamps)
    {
        writeClock(m_out);
    }
    m_out << "] " << eventName;
    for (const auto *field : fields)
    {
        m_out << ' ' << field->first << '=';
        writeValue(m_out, field->second);
    }
    m_out << '\n';
}

void ConsoleTelemetrySink::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out.flush();
}

std::size_t ConsoleTelemetrySink::mutedCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_muted;
}
