#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include <QString>

#include "common/models.hpp"
#include "common/process_utils.hpp"
#include "common/streaming_process.hpp"
#include "observe/severity_classifier.hpp"

namespace tether {

// How to obtain and interpret one platform's live log stream.
struct LogStreamProfile {
    ProcessCommand stream;
    // Run once before streaming to discard the device-side backlog.
    std::optional<ProcessCommand> clearCommand;
    LogFlavor flavor = LogFlavor::Logcat;
    // Lines starting with this prefix are stream chatter, not log content.
    QString bannerPrefix;
    bool prefiltered = false;
};

/**
 * LogCollector tails a platform log stream in the background and keeps the
 * most recent interesting lines in a bounded buffer.
 *
 * Collection is best effort: a stream that cannot be spawned leaves the
 * collector stopped, and start() may simply be called again later.
 */
class LogCollector
{
public:
    static constexpr int kDefaultMaxLines = 200;

    explicit LogCollector(LogStreamProfile profile,
                          QString appId = QString(),
                          int maxLines = kDefaultMaxLines);
    ~LogCollector();

    LogCollector(const LogCollector &) = delete;
    LogCollector &operator=(const LogCollector &) = delete;

    // Idempotent while running. Returns false when the stream could not be spawned.
    bool start();
    // Safe to call when never started.
    void stop();
    bool isRunning() const;

    // Returns and clears everything buffered so far.
    std::vector<LogEntry> drain();
    // The last n entries, oldest first, without clearing.
    std::vector<LogEntry> recent(std::size_t n = 50) const;

    bool save(const QString &path) const;

    // Filter, classify and buffer one raw stream line.
    void ingestLine(const QString &rawLine);

private:
    void reportStreamEnd();

    LogStreamProfile m_profile;
    LogInterestFilter m_filter;
    std::size_t m_maxLines;

    mutable std::mutex m_bufferMutex;
    std::deque<LogEntry> m_buffer;

    StreamingProcess m_stream;
    bool m_started = false;
};

} // namespace tether
