#pragma once

#include <functional>
#include <string>
#include <utility>

#include "json/JsonUtils.h"

namespace net
{

/// Bidirectional event-named message channel. Sends are fire-and-forget; replies arrive as inbound messages.
class Channel
{
  public:
    using MessageHandler = std::function<void(const std::string &event, const json::JsonValue &payload)>;
    using ConnectionHandler = std::function<void(bool connected)>;

    virtual ~Channel() = default;

    virtual void send(const std::string &event, const json::JsonValue &payload) = 0;
    virtual bool isConnected() const = 0;

    /// Delivers whatever became available by nowMs. Channels that push from elsewhere may ignore it.
    virtual void poll(double nowMs) { (void)nowMs; }

    void setMessageHandler(MessageHandler handler) { m_onMessage = std::move(handler); }
    void setConnectionHandler(ConnectionHandler handler) { m_onConnection = std::move(handler); }

  protected:
    void deliver(const std::string &event, const json::JsonValue &payload)
    {
        if (m_onMessage)
        {
            m_onMessage(event, payload);
        }
    }

    void notifyConnection(bool connected)
    {
        if (m_onConnection)
        {
            m_onConnection(connected);
        }
    }

  private:
    MessageHandler m_onMessage;
    ConnectionHandler m_onConnection;
};

class NullChannel : public Channel
{
  public:
    void send(const std::string &, const json::JsonValue &) override {}
    bool isConnected() const override { return false; }
};

} // namespace net
