#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "telemetry/TelemetrySink.h"

/// Writes one JSON object per line to session_<time>_<seq>.jsonl, rotating by size and pruning old files.
/// Falls back to another sink whenever the directory or file cannot be written.
class FileTelemetrySink : public TelemetrySink
{
  public:
    FileTelemetrySink();
    explicit FileTelemetrySink(std::shared_ptr<TelemetrySink> fallback);
    ~FileTelemetrySink() override;

    void recordEvent(std::string_view eventName, const Payload &payload) override;
    void flush() override;

    void setOutputDirectory(const std::filesystem::path &path);
    std::filesystem::path outputDirectory() const;

    void setRotationThresholdBytes(std::uintmax_t bytes);
    void setMaxRetentionFiles(std::size_t count);

    std::filesystem::path currentFile() const;

  private:
    bool ensureStreamLocked();
    void closeStreamLocked();
    void rotateLocked();
    void pruneLogsLocked();
    void reportFallbackLocked(std::string_view eventName, Payload payload);
    static std::string formatEventLine(std::string_view eventName, const Payload &payload);

    mutable std::mutex m_mutex;
    std::ofstream m_stream;
    std::shared_ptr<TelemetrySink> m_fallback;
    std::filesystem::path m_outputDirectory{std::filesystem::path("build") / "session_logs"};
    std::filesystem::path m_currentFile;
    std::uintmax_t m_rotationThresholdBytes = 4ull * 1024ull * 1024ull;
    std::size_t m_maxRetentionFiles = 8;
    std::uintmax_t m_bytesWritten = 0;
    std::uint64_t m_sequence = 0;
};
