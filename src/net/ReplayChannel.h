#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "json/JsonUtils.h"
#include "net/Channel.h"
#include "telemetry/TelemetrySink.h"

namespace net
{

/// One scripted inbound message. A record with replyTo is held until the client sends that event,
/// then delivered atMs after the send.
struct ReplayRecord
{
    double atMs = 0.0;
    std::string event;
    json::JsonValue payload;
    std::string replyTo;
};

struct ReplayLoadResult
{
    std::vector<ReplayRecord> records;
    bool success = false;
    std::vector<std::string> errors;
};

inline constexpr const char *ReplayDisconnect = "$disconnect";
inline constexpr const char *ReplayConnect = "$connect";

ReplayLoadResult parseReplayScript(const std::string &text);
ReplayLoadResult loadReplayScript(const std::filesystem::path &path);

/// Channel that plays a JSON-lines script against the session clock. Used by the debug client and tests.
class ReplayChannel : public Channel
{
  public:
    struct SentMessage
    {
        double atMs = 0.0;
        std::string event;
        json::JsonValue payload;
    };

    explicit ReplayChannel(std::vector<ReplayRecord> records, std::shared_ptr<TelemetrySink> telemetry = nullptr,
                           bool startConnected = true);

    void send(const std::string &event, const json::JsonValue &payload) override;
    bool isConnected() const override { return m_connected; }
    void poll(double nowMs) override;

    const std::vector<SentMessage> &sent() const { return m_sent; }
    std::size_t deliveredCount() const { return m_delivered; }
    /// True once every timed record has been delivered. Unarmed replies do not count.
    bool isComplete() const;

  private:
    struct Pending
    {
        double dueMs = 0.0;
        std::size_t order = 0;
        std::size_t record = 0;
    };

    bool popDue(Pending &out);

    std::vector<ReplayRecord> m_records;
    std::vector<bool> m_armed;
    std::vector<Pending> m_queue;
    std::vector<SentMessage> m_sent;
    std::shared_ptr<TelemetrySink> m_telemetry;
    std::size_t m_nextOrder = 0;
    std::size_t m_delivered = 0;
    double m_nowMs = 0.0;
    bool m_connected = true;
};

} // namespace net
