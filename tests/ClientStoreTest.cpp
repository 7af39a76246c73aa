#include "persist/ClientStore.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace
{

class RecordingTelemetrySink : public TelemetrySink
{
  public:
    void recordEvent(std::string_view eventName, const Payload &payload) override
    {
        events.emplace_back(std::string(eventName), payload);
    }

    std::vector<std::pair<std::string, Payload>> events;
};

bool assertTrue(bool condition, const char *message)
{
    if (!condition)
    {
        std::cerr << message << '\n';
        return false;
    }
    return true;
}

std::filesystem::path scratchDir()
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "qbit_city_store_test";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return dir;
}

bool testMissingFileIsEmpty()
{
    ClientStore store(scratchDir() / "absent.json");
    const ClientStoreLoadResult result = store.load();
    bool success = true;
    success &= assertTrue(result.success && result.errors.empty(), "Missing store should load as empty");
    success &= assertTrue(!store.hasRoomIdentity() && store.data().leaderboard.empty(), "Store should be empty");
    return success;
}

bool testSaveAndReload()
{
    const std::filesystem::path path = scratchDir() / "nested" / "store.json";
    {
        ClientStore store(path, 3);
        store.setPlayerName("Player");
        store.setRoomIdentity("ABC123", "p1");
        store.addLeaderboardEntry({"Player", 30.0, "2026-01-01"});
        store.addLeaderboardEntry({"Bot", 90.0, "2026-01-02"});
        store.addLeaderboardEntry({"Ann", 60.0, "2026-01-03"});
        store.addLeaderboardEntry({"Slow", 5.0, "2026-01-04"});
        if (!assertTrue(store.save(), "Save should create parent directories"))
        {
            return false;
        }
    }

    bool success = true;
    std::filesystem::path temp = path;
    temp += ".tmp";
    success &= assertTrue(!std::filesystem::exists(temp), "Temporary file should be renamed away");

    ClientStore reloaded(path, 3);
    const ClientStoreLoadResult result = reloaded.load();
    success &= assertTrue(result.success, "Saved store should load");
    success &= assertTrue(reloaded.data().playerName == "Player" && reloaded.data().playerId == "p1",
                          "Identity should survive a round trip");
    const auto &board = reloaded.data().leaderboard;
    success &= assertTrue(board.size() == 3, "Leaderboard should be capped");
    success &= assertTrue(board.size() == 3 && board[0].name == "Bot" && board[1].name == "Ann" &&
                              board[2].name == "Player",
                          "Leaderboard should be sorted by time survived");

    reloaded.clearRoomIdentity();
    success &= assertTrue(!reloaded.hasRoomIdentity(), "Clearing should drop the room");
    return success;
}

bool testCorruptFileReported()
{
    const std::filesystem::path dir = scratchDir();
    std::filesystem::create_directories(dir);
    const std::filesystem::path path = dir / "corrupt.json";
    {
        std::ofstream stream(path);
        stream << "{\"schema_version\": 1, \"room_code\": ";
    }

    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    ClientStore store(path, 20, telemetry);
    const ClientStoreLoadResult result = store.load();
    bool success = true;
    success &= assertTrue(!result.success && result.errors.size() == 1, "Corrupt store should report an error");
    success &= assertTrue(!store.hasRoomIdentity(), "Corrupt store should be treated as empty");
    success &= assertTrue(!telemetry->events.empty() && telemetry->events.front().first == "store.load_failed",
                          "Load failure should be reported to telemetry");

    {
        std::ofstream stream(path, std::ios::trunc);
        stream << "{\"schema_version\": 7, \"room_code\": \"ABC123\"}";
    }
    const ClientStoreLoadResult mismatch = store.load();
    success &= assertTrue(!mismatch.success && !store.hasRoomIdentity(), "Unknown schema version should be rejected");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testMissingFileIsEmpty();
    success &= testSaveAndReload();
    success &= testCorruptFileReported();
    return success ? 0 : 1;
}
