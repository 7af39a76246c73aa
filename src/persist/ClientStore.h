#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "telemetry/TelemetrySink.h"

struct LeaderboardEntry
{
    std::string name;
    double timeSurvived = 0.0;
    std::string date;
};

struct ClientStoreData
{
    std::string playerName;
    std::string roomCode;
    std::string playerId;
    std::vector<LeaderboardEntry> leaderboard;
};

struct ClientStoreLoadResult
{
    ClientStoreData data;
    bool success = false;
    std::vector<std::string> errors;
};

/// Client-local, non-authoritative state kept between runs. Writes go through a temporary file and rename.
class ClientStore
{
  public:
    explicit ClientStore(std::filesystem::path path, std::size_t leaderboardCapacity = 20,
                         std::shared_ptr<TelemetrySink> telemetry = nullptr);

    /// A missing file is an empty store. A corrupt file is reported and treated as empty.
    ClientStoreLoadResult load();
    bool save();

    const ClientStoreData &data() const { return m_data; }
    const std::filesystem::path &path() const { return m_path; }

    void setPlayerName(const std::string &name);
    void setRoomIdentity(const std::string &roomCode, const std::string &playerId);
    void clearRoomIdentity();
    [[nodiscard]] bool hasRoomIdentity() const noexcept { return !m_data.roomCode.empty(); }

    /// Inserts keeping the board sorted by timeSurvived descending and capped.
    void addLeaderboardEntry(LeaderboardEntry entry);

  private:
    std::filesystem::path m_path;
    std::size_t m_capacity;
    std::shared_ptr<TelemetrySink> m_telemetry;
    ClientStoreData m_data;
};
