#include "session/ReconnectionController.h"

#include <utility>

#include "net/WireCodec.h"
#include "net/WireProtocol.h"
#include "persist/ClientStore.h"

const char *reconnectionStatusToString(ReconnectionController::Status status)
{
    switch (status)
    {
    case ReconnectionController::Status::Idle:
        return "idle";
    case ReconnectionController::Status::Joining:
        return "joining";
    case ReconnectionController::Status::Connected:
        return "connected";
    case ReconnectionController::Status::Lost:
        return "lost";
    case ReconnectionController::Status::Rejoining:
        return "rejoining";
    case ReconnectionController::Status::Syncing:
        return "syncing";
    }
    return "unknown";
}

ReconnectionController::ReconnectionController(net::Channel &channel, std::shared_ptr<TelemetrySink> telemetry,
                                               ClientStore *store)
    : m_channel(channel), m_telemetry(std::move(telemetry)), m_store(store)
{
}

bool ReconnectionController::restoreIdentity()
{
    if (!m_store || !m_store->hasRoomIdentity())
    {
        return false;
    }
    const ClientStoreData &data = m_store->data();
    m_identity = RoomIdentity{data.roomCode, data.playerName, data.playerId};
    recordTelemetry(m_telemetry, "reconnect.identity_restored", {{"room", data.roomCode}});
    return true;
}

void ReconnectionController::beginJoin(const RoomIdentity &identity)
{
    m_identity = identity;
    m_rejoining = false;
    m_rejoinAttempts = 0;
    setStatus(Status::Joining);
    sendJoin();
}

void ReconnectionController::onJoinSucceeded(const std::string &playerId)
{
    if (!m_identity)
    {
        return;
    }
    if (!playerId.empty())
    {
        m_identity->playerId = playerId;
    }
    persistIdentity();

    if (m_rejoining)
    {
        m_rejoining = false;
        setStatus(Status::Syncing);
        m_channel.send(net::wire::GetGameState, net::encodeEmpty());
        return;
    }
    setStatus(Status::Connected);
}

bool ReconnectionController::onJoinFailed(const std::string &reason)
{
    const bool wasRejoin = m_rejoining;
    recordTelemetry(m_telemetry, "reconnect.join_failed",
                    {{"reason", reason}, {"rejoin", wasRejoin ? "true" : "false"}});
    m_identity.reset();
    m_rejoining = false;
    if (m_store)
    {
        m_store->clearRoomIdentity();
        saveStore();
    }
    setStatus(Status::Idle);
    return true;
}

void ReconnectionController::onConnectionLost()
{
    if (m_status == Status::Idle || m_status == Status::Lost)
    {
        return;
    }
    setStatus(Status::Lost);
}

void ReconnectionController::onConnectionRestored()
{
    if (m_status != Status::Lost)
    {
        return;
    }
    if (!m_identity)
    {
        setStatus(Status::Idle);
        return;
    }
    m_rejoining = true;
    ++m_rejoinAttempts;
    setStatus(Status::Rejoining);
    sendJoin();
}

void ReconnectionController::onSnapshotReceived()
{
    if (m_status == Status::Syncing)
    {
        setStatus(Status::Connected);
    }
}

void ReconnectionController::leave()
{
    if (m_status == Status::Connected || m_status == Status::Syncing)
    {
        m_channel.send(net::wire::LeaveRoom, net::encodeEmpty());
    }
    forgetRoom();
}

void ReconnectionController::forgetRoom()
{
    m_identity.reset();
    m_rejoining = false;
    if (m_store)
    {
        m_store->clearRoomIdentity();
        saveStore();
    }
    setStatus(Status::Idle);
}

void ReconnectionController::sendJoin()
{
    m_channel.send(net::wire::JoinRoom,
                   net::encodeJoinRoom(m_identity->roomCode, m_identity->playerName, m_identity->playerId));
}

void ReconnectionController::persistIdentity()
{
    if (!m_store || !m_identity)
    {
        return;
    }
    m_store->setPlayerName(m_identity->playerName);
    m_store->setRoomIdentity(m_identity->roomCode, m_identity->playerId);
    saveStore();
}

void ReconnectionController::saveStore()
{
    if (!m_store->save())
    {
        recordTelemetry(m_telemetry, "reconnect.persist_failed",
                        {{"path", m_store->path().lexically_normal().string()}});
    }
}

void ReconnectionController::setStatus(Status status)
{
    if (status == m_status)
    {
        return;
    }
    recordTelemetry(m_telemetry, "reconnect.status",
                    {{"from", reconnectionStatusToString(m_status)}, {"to", reconnectionStatusToString(status)}});
    m_status = status;
}
