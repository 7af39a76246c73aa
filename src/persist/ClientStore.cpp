#include "persist/ClientStore.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "json/JsonUtils.h"

namespace fs = std::filesystem;

namespace
{

constexpr int kStoreSchemaVersion = 1;

} // namespace

ClientStore::ClientStore(fs::path path, std::size_t leaderboardCapacity, std::shared_ptr<TelemetrySink> telemetry)
    : m_path(std::move(path)), m_capacity(leaderboardCapacity), m_telemetry(std::move(telemetry))
{
}

ClientStoreLoadResult ClientStore::load()
{
    ClientStoreLoadResult result;
    m_data = ClientStoreData{};

    std::error_code ec;
    if (!fs::exists(m_path, ec))
    {
        result.success = true;
        return result;
    }

    std::ifstream stream(m_path, std::ios::binary);
    if (!stream.is_open())
    {
        result.errors.push_back(m_path.lexically_normal().string() + ": failed to open");
    }
    else
    {
        std::stringstream buffer;
        buffer << stream.rdbuf();
        const auto root = json::parseJson(buffer.str());
        if (!root || root->type != json::JsonValue::Type::Object)
        {
            result.errors.push_back(m_path.lexically_normal().string() + ": failed to parse JSON");
        }
        else if (json::getInt(*root, "schema_version", 0) != kStoreSchemaVersion)
        {
            result.errors.push_back(m_path.lexically_normal().string() + ": schema_version mismatch");
        }
        else
        {
            m_data.playerName = json::getString(*root, "player_name", "");
            m_data.roomCode = json::getString(*root, "room_code", "");
            m_data.playerId = json::getString(*root, "player_id", "");
            if (const json::JsonValue *board = json::getObjectField(*root, "leaderboard"))
            {
                if (board->type == json::JsonValue::Type::Array)
                {
                    for (const json::JsonValue &item : board->array)
                    {
                        if (item.type != json::JsonValue::Type::Object)
                        {
                            continue;
                        }
                        LeaderboardEntry entry;
                        entry.name = json::getString(item, "name", "");
                        entry.timeSurvived = json::getDouble(item, "timeSurvived", 0.0);
                        entry.date = json::getString(item, "date", "");
                        addLeaderboardEntry(std::move(entry));
                    }
                }
            }
        }
    }

    if (!result.errors.empty())
    {
        m_data = ClientStoreData{};
        for (const std::string &error : result.errors)
        {
            recordTelemetry(m_telemetry, "store.load_failed", {{"error", error}});
        }
        return result;
    }
    result.data = m_data;
    result.success = true;
    return result;
}

bool ClientStore::save()
{
    json::JsonValue root = json::makeObject();
    json::setField(root, "schema_version", json::makeNumber(kStoreSchemaVersion));
    json::setField(root, "player_name", json::makeString(m_data.playerName));
    json::setField(root, "room_code", json::makeString(m_data.roomCode));
    json::setField(root, "player_id", json::makeString(m_data.playerId));
    json::JsonValue board = json::makeArray();
    for (const LeaderboardEntry &entry : m_data.leaderboard)
    {
        json::JsonValue item = json::makeObject();
        json::setField(item, "name", json::makeString(entry.name));
        json::setField(item, "timeSurvived", json::makeNumber(entry.timeSurvived));
        json::setField(item, "date", json::makeString(entry.date));
        board.array.push_back(std::move(item));
    }
    json::setField(root, "leaderboard", std::move(board));

    std::error_code ec;
    if (m_path.has_parent_path())
    {
        fs::create_directories(m_path.parent_path(), ec);
    }

    fs::path temp = m_path;
    temp += ".tmp";
    {
        std::ofstream stream(temp, std::ios::binary | std::ios::trunc);
        if (!stream.is_open())
        {
            recordTelemetry(m_telemetry, "store.save_failed",
                            {{"path", temp.lexically_normal().string()}, {"error", "failed_to_open"}});
            return false;
        }
        stream << json::serialize(root) << '\n';
        if (!stream.good())
        {
            recordTelemetry(m_telemetry, "store.save_failed",
                            {{"path", temp.lexically_normal().string()}, {"error", "write_failed"}});
            return false;
        }
    }

    fs::rename(temp, m_path, ec);
    if (ec)
    {
        recordTelemetry(m_telemetry, "store.save_failed",
                        {{"path", m_path.lexically_normal().string()}, {"error", ec.message()}});
        std::error_code removeEc;
        fs::remove(temp, removeEc);
        return false;
    }
    return true;
}

void ClientStore::setPlayerName(const std::string &name)
{
    m_data.playerName = name;
}

void ClientStore::setRoomIdentity(const std::string &roomCode, const std::string &playerId)
{
    m_data.roomCode = roomCode;
    m_data.playerId = playerId;
}

void ClientStore::clearRoomIdentity()
{
    m_data.roomCode.clear();
}

void ClientStore::addLeaderboardEntry(LeaderboardEntry entry)
{
    auto &board = m_data.leaderboard;
    const auto position = std::upper_bound(board.begin(), board.end(), entry.timeSurvived,
                                           [](double value, const LeaderboardEntry &existing) {
                                               return value > existing.timeSurvived;
                                           });
    board.insert(position, std::move(entry));
    if (board.size() > m_capacity)
    {
        board.resize(m_capacity);
    }
}
