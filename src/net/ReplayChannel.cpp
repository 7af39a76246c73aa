#include "net/ReplayChannel.h"

#include <fstream>
#include <sstream>
#include <utility>

namespace net
{

ReplayLoadResult parseReplayScript(const std::string &text)
{
    ReplayLoadResult result;
    std::istringstream stream(text);
    std::string line;
    int lineNumber = 0;
    while (std::getline(stream, line))
    {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#')
        {
            continue;
        }

        const std::string where = "line " + std::to_string(lineNumber) + ": ";
        const auto root = json::parseJson(line.substr(first));
        if (!root || root->type != json::JsonValue::Type::Object)
        {
            result.errors.push_back(where + "failed to parse JSON");
            continue;
        }
        ReplayRecord record;
        record.event = json::getString(*root, "event", "");
        if (record.event.empty())
        {
            result.errors.push_back(where + "missing event");
            continue;
        }
        if (!json::hasNumber(*root, "at_ms"))
        {
            result.errors.push_back(where + "missing at_ms");
            continue;
        }
        record.atMs = json::getDouble(*root, "at_ms", 0.0);
        if (record.atMs < 0.0)
        {
            result.errors.push_back(where + "at_ms must be non-negative");
            continue;
        }
        record.replyTo = json::getString(*root, "reply_to", "");
        if (const json::JsonValue *payload = json::getObjectField(*root, "payload"))
        {
            record.payload = *payload;
        }
        else
        {
            record.payload = json::makeObject();
        }
        result.records.push_back(std::move(record));
    }
    result.success = result.errors.empty();
    return result;
}

ReplayLoadResult loadReplayScript(const std::filesystem::path &path)
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open())
    {
        ReplayLoadResult result;
        result.errors.push_back(path.lexically_normal().string() + ": failed to open");
        return result;
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    ReplayLoadResult result = parseReplayScript(buffer.str());
    for (std::string &error : result.errors)
    {
        error = path.lexically_normal().string() + ": " + error;
    }
    return result;
}

ReplayChannel::ReplayChannel(std::vector<ReplayRecord> records, std::shared_ptr<TelemetrySink> telemetry,
                             bool startConnected)
    : m_records(std::move(records)), m_armed(m_records.size(), false), m_telemetry(std::move(telemetry)),
      m_connected(startConnected)
{
    for (std::size_t i = 0; i < m_records.size(); ++i)
    {
        if (m_records[i].replyTo.empty())
        {
            m_queue.push_back({m_records[i].atMs, m_nextOrder++, i});
            m_armed[i] = true;
        }
    }
}

void ReplayChannel::send(const std::string &event, const json::JsonValue &payload)
{
    if (!m_connected)
    {
        recordTelemetry(m_telemetry, "net.outbound_dropped", {{"event", event}});
        return;
    }
    recordTelemetry(m_telemetry, "net.outbound", {{"event", event}, {"payload", json::serialize(payload)}});
    m_sent.push_back({m_nowMs, event, payload});

    for (std::size_t i = 0; i < m_records.size(); ++i)
    {
        if (!m_armed[i] && m_records[i].replyTo == event)
        {
            m_armed[i] = true;
            m_queue.push_back({m_nowMs + m_records[i].atMs, m_nextOrder++, i});
            break;
        }
    }
}

void ReplayChannel::poll(double nowMs)
{
    m_nowMs = nowMs;
    Pending next;
    while (popDue(next))
    {
        const ReplayRecord &record = m_records[next.record];
        ++m_delivered;
        if (record.event == ReplayDisconnect)
        {
            if (m_connected)
            {
                m_connected = false;
                notifyConnection(false);
            }
            continue;
        }
        if (record.event == ReplayConnect)
        {
            if (!m_connected)
            {
                m_connected = true;
                notifyConnection(true);
            }
            continue;
        }
        deliver(record.event, record.payload);
    }
}

bool ReplayChannel::isComplete() const
{
    for (const Pending &pending : m_queue)
    {
        if (m_records[pending.record].replyTo.empty())
        {
            return false;
        }
    }
    return true;
}

bool ReplayChannel::popDue(Pending &out)
{
    std::size_t best = m_queue.size();
    for (std::size_t i = 0; i < m_queue.size(); ++i)
    {
        const Pending &candidate = m_queue[i];
        if (candidate.dueMs > m_nowMs)
        {
            continue;
        }
        // Messages do not arrive over a dropped link; control records still run.
        const std::string &event = m_records[candidate.record].event;
        if (!m_connected && event != ReplayConnect && event != ReplayDisconnect)
        {
            continue;
        }
        if (best == m_queue.size() || candidate.dueMs < m_queue[best].dueMs ||
            (candidate.dueMs == m_queue[best].dueMs && candidate.order < m_queue[best].order))
        {
            best = i;
        }
    }
    if (best == m_queue.size())
    {
        return false;
    }
    out = m_queue[best];
    m_queue.erase(m_queue.begin() + static_cast<std::ptrdiff_t>(best));
    return true;
}

} // namespace net
