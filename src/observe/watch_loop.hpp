#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "common/config.hpp"
#include "common/enums.hpp"
#include "observe/log_collector.hpp"
#include "observe/snapshot_capture.hpp"

namespace tether {

class DevicePlatform;

enum class WatchOutcome {
    Completed,
    Interrupted,
    RetriesExhausted,
    DeviceUnavailable,
    OutputUnavailable
};

int exitCodeFor(WatchOutcome outcome);

struct WatchOptions {
    std::chrono::milliseconds debounce{1000};
    std::optional<std::chrono::milliseconds> timeout;
    int maxRetries = 3;
    std::chrono::milliseconds retryDelay{2000};
    std::chrono::milliseconds pollFloor{2000};
    // Granularity of debounce checks and interruptible sleeps.
    std::chrono::milliseconds tick{100};
    OutputFormat format = OutputFormat::Human;
    CaptureTargets targets;

    static WatchOptions fromSettings(const WatchSettings &settings);
};

/**
 * WatchLoop takes an initial snapshot and then one snapshot per settled UI
 * change, until the deadline, an interrupt or an unrecoverable event stream.
 *
 * Platforms with a UI event stream are watched event-driven with debounce and
 * bounded reconnects; the others are polled. The loop owns the session's log
 * collector and stops it, and any event subprocess, on every exit path.
 */
class WatchLoop
{
public:
    WatchLoop(DevicePlatform &platform,
              WatchOptions options,
              std::unique_ptr<LogCollector> logs,
              const std::atomic<bool> &interrupted,
              std::ostream &out);
    ~WatchLoop();

    WatchLoop(const WatchLoop &) = delete;
    WatchLoop &operator=(const WatchLoop &) = delete;

    WatchOutcome run();

    const SnapshotCapture &capture() const;

private:
    using Clock = std::chrono::steady_clock;

    WatchOutcome runSession();
    WatchOutcome runEventMode(const ProcessCommand &eventCommand);
    WatchOutcome runPollMode();

    void captureSnapshot(const std::string &trigger);
    // Relaunches a log stream that exited on its own so later snapshots
    // keep collecting lines.
    void restartLogsIfEnded();

    // Sleeps in ticks. Returns false as soon as an interrupt is seen.
    bool pause(std::chrono::milliseconds duration) const;
    bool deadlineReached() const;
    std::chrono::milliseconds timeUntilDeadline() const;
    void reportDisconnect(int retries);

    DevicePlatform &m_platform;
    WatchOptions m_options;
    std::unique_ptr<LogCollector> m_logs;
    const std::atomic<bool> &m_interrupted;
    SnapshotCapture m_capture;

    int m_sequence = 0;
    std::optional<Clock::time_point> m_deadline;
};

} // namespace tether
