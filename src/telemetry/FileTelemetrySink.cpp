#include "telemetry/FileTelemetrySink.h"

#include "json/JsonUtils.h"
#include "telemetry/ConsoleTelemetrySink.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace
{

constexpr const char *kFilePrefix = "session_";

std::string makeTimestampedName(std::uint64_t sequence)
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t raw = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &raw);
#else
    localtime_r(&raw, &tm);
#endif
    std::ostringstream oss;
    oss << kFilePrefix << std::put_time(&tm, "%Y%m%d_%H%M%S") << '_' << std::setw(4) << std::setfill('0') << sequence
        << ".jsonl";
    return oss.str();
}

} // namespace

FileTelemetrySink::FileTelemetrySink() : FileTelemetrySink(std::make_shared<ConsoleTelemetrySink>()) {}

FileTelemetrySink::FileTelemetrySink(std::shared_ptr<TelemetrySink> fallback) : m_fallback(std::move(fallback)) {}

FileTelemetrySink::~FileTelemetrySink()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    closeStreamLocked();
}

void FileTelemetrySink::recordEvent(std::string_view eventName, const Payload &payload)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureStreamLocked())
    {
        if (m_fallback)
        {
            m_fallback->recordEvent(eventName, payload);
        }
        return;
    }

    const std::string line = formatEventLine(eventName, payload);
    m_stream << line;
    if (!m_stream.good())
    {
        Payload error{{"file", m_currentFile.lexically_normal().string()}, {"error", "write_failed"}};
        closeStreamLocked();
        reportFallbackLocked("telemetry.write_failed", std::move(error));
        if (m_fallback)
        {
            m_fallback->recordEvent(eventName, payload);
        }
        return;
    }

    m_bytesWritten += static_cast<std::uintmax_t>(line.size());
    if (m_rotationThresholdBytes > 0 && m_bytesWritten >= m_rotationThresholdBytes)
    {
        rotateLocked();
    }
}

void FileTelemetrySink::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stream.is_open())
    {
        m_stream.flush();
    }
    if (m_fallback)
    {
        m_fallback->flush();
    }
}

void FileTelemetrySink::setOutputDirectory(const std::filesystem::path &path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    closeStreamLocked();
    m_outputDirectory = path.empty() ? fs::path("build") / "session_logs" : path;
}

std::filesystem::path FileTelemetrySink::outputDirectory() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_outputDirectory;
}

void FileTelemetrySink::setRotationThresholdBytes(std::uintmax_t bytes)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rotationThresholdBytes = bytes;
}

void FileTelemetrySink::setMaxRetentionFiles(std::size_t count)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_maxRetentionFiles = count;
    pruneLogsLocked();
}

std::filesystem::path FileTelemetrySink::currentFile() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentFile;
}

bool FileTelemetrySink::ensureStreamLocked()
{
    if (m_stream.is_open())
    {
        return true;
    }

    std::error_code ec;
    fs::create_directories(m_outputDirectory, ec);
    if (ec && !fs::is_directory(m_outputDirectory))
    {
        reportFallbackLocked("telemetry.directory_unavailable",
                             {{"path", m_outputDirectory.lexically_normal().string()}, {"error", ec.message()}});
        return false;
    }

    const fs::path path = m_outputDirectory / makeTimestampedName(++m_sequence);
    m_stream.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!m_stream.is_open())
    {
        m_stream.clear();
        reportFallbackLocked("telemetry.log_open_failed",
                             {{"path", path.lexically_normal().string()}, {"error", "failed_to_open"}});
        return false;
    }

    m_currentFile = path;
    m_bytesWritten = 0;
    pruneLogsLocked();
    return true;
}

void FileTelemetrySink::closeStreamLocked()
{
    if (m_stream.is_open())
    {
        m_stream.flush();
        m_stream.close();
    }
    m_stream.clear();
    m_currentFile.clear();
    m_bytesWritten = 0;
}

void FileTelemetrySink::rotateLocked()
{
    const fs::path previous = m_currentFile;
    closeStreamLocked();
    if (!ensureStreamLocked())
    {
        reportFallbackLocked("telemetry.rotation_failed", {{"previous", previous.lexically_normal().string()}});
        return;
    }
    const std::string line = formatEventLine(
        "telemetry.rotation",
        {{"previous", previous.lexically_normal().string()}, {"threshold", std::to_string(m_rotationThresholdBytes)}});
    m_stream << line;
    m_bytesWritten += static_cast<std::uintmax_t>(line.size());
}

void FileTelemetrySink::pruneLogsLocked()
{
    if (m_maxRetentionFiles == 0)
    {
        return;
    }

    std::error_code iterEc;
    fs::directory_iterator iter(m_outputDirectory, iterEc);
    if (iterEc)
    {
        return;
    }

    std::vector<fs::path> logs;
    for (const auto &entry : iter)
    {
        std::error_code typeEc;
        if (!entry.is_regular_file(typeEc))
        {
            continue;
        }
        const fs::path &path = entry.path();
        if (path.extension() == ".jsonl" && path.filename().string().rfind(kFilePrefix, 0) == 0)
        {
            logs.push_back(path);
        }
    }
    if (logs.size() <= m_maxRetentionFiles)
    {
        return;
    }

    // Names embed time and sequence, so lexical order is creation order.
    std::sort(logs.begin(), logs.end(), [](const fs::path &a, const fs::path &b) {
        return a.filename().string() > b.filename().string();
    });
    for (std::size_t i = m_maxRetentionFiles; i < logs.size(); ++i)
    {
        if (logs[i] == m_currentFile)
        {
            continue;
        }
        std::error_code removeEc;
        fs::remove(logs[i], removeEc);
        if (removeEc)
        {
            reportFallbackLocked("telemetry.prune_failed",
                                 {{"path", logs[i].lexically_normal().string()}, {"error", removeEc.message()}});
        }
    }
}

void FileTelemetrySink::reportFallbackLocked(std::string_view eventName, Payload payload)
{
    if (m_fallback)
    {
        m_fallback->recordEvent(eventName, payload);
    }
}

std::string FileTelemetrySink::formatEventLine(std::string_view eventName, const Payload &payload)
{
    std::vector<std::pair<std::string, std::string>> fields(payload.begin(), payload.end());
    std::sort(fields.begin(), fields.end());

    std::string line = "{\"event\":";
    json::escapeInto(line, std::string(eventName));
    for (const auto &field : fields)
    {
        line.push_back(',');
        json::escapeInto(line, field.first);
        line.push_back(':');
        json::escapeInto(line, field.second);
    }
    line += "}\n";
    return line;
}
