#include "telemetry/FileTelemetrySink.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
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

std::filesystem::path freshDir(const char *name)
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return dir;
}

std::size_t countLogs(const std::filesystem::path &dir)
{
    std::size_t count = 0;
    for (const auto &entry : std::filesystem::directory_iterator(dir))
    {
        if (entry.path().extension() == ".jsonl")
        {
            ++count;
        }
    }
    return count;
}

bool testWritesSortedJsonLines()
{
    const auto dir = freshDir("qbit_city_telemetry_lines");
    auto fallback = std::make_shared<RecordingTelemetrySink>();
    FileTelemetrySink sink(fallback);
    sink.setOutputDirectory(dir);
    sink.recordEvent("phase.stale", {{"slot", "quiz"}, {"last_applied", "1"}});
    const std::filesystem::path file = sink.currentFile();
    sink.flush();

    std::ifstream stream(file);
    std::string line;
    std::getline(stream, line);

    bool success = true;
    success &= assertTrue(file.filename().string().rfind("session_", 0) == 0, "Log files use the session prefix");
    success &= assertTrue(line == R"({"event":"phase.stale","last_applied":"1","slot":"quiz"})",
                          "Fields should be written sorted after the event name");
    success &= assertTrue(fallback->events.empty(), "Healthy sink should not touch the fallback");
    return success;
}

bool testRotationAndRetention()
{
    const auto dir = freshDir("qbit_city_telemetry_rotation");
    FileTelemetrySink sink(std::make_shared<RecordingTelemetrySink>());
    sink.setOutputDirectory(dir);
    sink.setRotationThresholdBytes(64);
    sink.setMaxRetentionFiles(2);

    const std::string padding(80, 'x');
    for (int i = 0; i < 5; ++i)
    {
        sink.recordEvent("net.outbound", {{"payload", padding}});
    }
    sink.flush();

    bool success = true;
    success &= assertTrue(countLogs(dir) == 2, "Old rotated logs should be pruned to the retention limit");

    std::ifstream stream(sink.currentFile());
    std::stringstream buffer;
    buffer << stream.rdbuf();
    success &= assertTrue(buffer.str().find("telemetry.rotation") != std::string::npos,
                          "A rotated file should start with a rotation marker");
    return success;
}

bool testFallbackWhenDirectoryUnusable()
{
    const auto dir = freshDir("qbit_city_telemetry_blocked");
    std::filesystem::create_directories(dir);
    const std::filesystem::path blocker = dir / "not_a_dir";
    {
        std::ofstream stream(blocker);
        stream << "occupied";
    }

    auto fallback = std::make_shared<RecordingTelemetrySink>();
    FileTelemetrySink sink(fallback);
    sink.setOutputDirectory(blocker / "logs");
    sink.recordEvent("session.joined", {{"room", "ABC123"}});

    bool success = true;
    success &= assertTrue(fallback->events.size() == 2, "Failure and the original event should reach the fallback");
    success &= assertTrue(fallback->events.size() == 2 &&
                              fallback->events[0].first == "telemetry.directory_unavailable" &&
                              fallback->events[1].first == "session.joined",
                          "Fallback should see the failure before the event");
    success &= assertTrue(sink.currentFile().empty(), "No file should be open");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= testWritesSortedJsonLines();
    success &= testRotationAndRetention();
    success &= testFallbackWhenDirectoryUnusable();
    return success ? 0 : 1;
}
