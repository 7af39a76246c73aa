#pragma once

#include <memory>
#include <optional>
#include <string>

#include "net/Channel.h"
#include "telemetry/TelemetrySink.h"

class ClientStore;

struct RoomIdentity
{
    std::string roomCode;
    std::string playerName;
    std::string playerId;
};

/// Tracks channel health for a room and drives the rejoin-then-snapshot recovery when the channel returns.
class ReconnectionController
{
  public:
    enum class Status
    {
        Idle,
        Joining,
        Connected,
        Lost,
        Rejoining,
        Syncing
    };

    ReconnectionController(net::Channel &channel, std::shared_ptr<TelemetrySink> telemetry = nullptr,
                           ClientStore *store = nullptr);

    /// Restores a room identity persisted by an earlier run. Returns false when none was stored.
    bool restoreIdentity();

    void beginJoin(const RoomIdentity &identity);
    void onJoinSucceeded(const std::string &playerId);
    /// Returns true when the caller should route back to the lobby.
    bool onJoinFailed(const std::string &reason);
    void onConnectionLost();
    void onConnectionRestored();
    void onSnapshotReceived();
    void leave();
    /// The server closed the room. Drops the identity without sending anything.
    void forgetRoom();

    [[nodiscard]] Status status() const noexcept { return m_status; }
    [[nodiscard]] bool connectionLost() const noexcept
    {
        return m_status == Status::Lost || m_status == Status::Rejoining;
    }
    [[nodiscard]] bool broadcastAllowed() const noexcept { return m_status == Status::Connected; }
    const std::optional<RoomIdentity> &identity() const { return m_identity; }
    int rejoinAttempts() const { return m_rejoinAttempts; }

  private:
    void sendJoin();
    void persistIdentity();
    void saveStore();
    void setStatus(Status status);

    net::Channel &m_channel;
    std::shared_ptr<TelemetrySink> m_telemetry;
    ClientStore *m_store = nullptr;
    std::optional<RoomIdentity> m_identity;
    Status m_status = Status::Idle;
    bool m_rejoining = false;
    int m_rejoinAttempts = 0;
};

const char *reconnectionStatusToString(ReconnectionController::Status status);
