#include "observe/watch_loop.hpp"

#include <QDebug>
#include <QUuid>

#include <algorithm>
#include <thread>
#include <utility>

#include "common/logging.hpp"
#include "observe/event_stream.hpp"
#include "platform/device_platform.hpp"

namespace tether {

namespace {

std::chrono::milliseconds secondsToMs(double seconds)
{
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

QString formatSeconds(std::chrono::milliseconds duration)
{
    return QString::number(static_cast<double>(duration.count()) / 1000.0);
}

} // namespace

int exitCodeFor(WatchOutcome outcome)
{
    switch (outcome) {
    case WatchOutcome::Completed:
        return 0;
    case WatchOutcome::Interrupted:
        return 130;
    case WatchOutcome::RetriesExhausted:
    case WatchOutcome::DeviceUnavailable:
    case WatchOutcome::OutputUnavailable:
        return 1;
    }
    return 1;
}

WatchOptions WatchOptions::fromSettings(const WatchSettings &settings)
{
    WatchOptions options;
    options.debounce = secondsToMs(settings.debounceSeconds);
    options.maxRetries = std::max(1, settings.maxRetries);
    options.retryDelay = secondsToMs(settings.retryDelaySeconds);
    options.pollFloor = secondsToMs(settings.pollFloorSeconds);
    options.targets.outputDir = settings.outputDir;
    options.targets.manifestPath = settings.manifestPath;
    options.targets.latestElementsPath = settings.latestElementsPath();
    return options;
}

WatchLoop::WatchLoop(DevicePlatform &platform,
                     WatchOptions options,
                     std::unique_ptr<LogCollector> logs,
                     const std::atomic<bool> &interrupted,
                     std::ostream &out)
    : m_platform(platform)
    , m_options(std::move(options))
    , m_logs(std::move(logs))
    , m_interrupted(interrupted)
    , m_capture(platform, m_logs.get(), m_options.targets, m_options.format, out)
{
}

WatchLoop::~WatchLoop()
{
    if (m_logs) {
        m_logs->stop();
    }
}

WatchOutcome WatchLoop::run()
{
    const QString sessionId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    tether::logging::CorrelationScope scope(sessionId);

    const WatchOutcome outcome = runSession();
    if (m_logs) {
        m_logs->stop();
    }

    TLOG_INFO(QStringLiteral("WatchLoop"),
              QStringLiteral("run"),
              QStringLiteral("watch_finished"),
              QStringLiteral("session_end"),
              QStringLiteral("watch_loop"),
              tether::logging::defaultWho(),
              sessionId,
              (nlohmann::json{{"outcome", exitCodeFor(outcome)},
                              {"snapshots", m_capture.entries().size()}}));
    return outcome;
}

const SnapshotCapture &WatchLoop::capture() const
{
    return m_capture;
}

WatchOutcome WatchLoop::runSession()
{
    const ProbeResult probe = m_platform.probe();
    if (!probe.available) {
        TLOG_WARN(QStringLiteral("WatchLoop"),
                  QStringLiteral("runSession"),
                  QStringLiteral("device_unavailable"),
                  QStringLiteral("probe_failed"),
                  QStringLiteral("abort_session"),
                  tether::logging::defaultWho(),
                  tether::logging::currentCorrelationId(),
                  (nlohmann::json{{"message", probe.message}}));
        return WatchOutcome::DeviceUnavailable;
    }

    if (!m_capture.resetOutput()) {
        return WatchOutcome::OutputUnavailable;
    }
    m_sequence = 0;
    if (m_logs) {
        m_logs->start();
    }

    qInfo().noquote() << "watching for UI changes...";
    if (m_options.timeout) {
        qInfo().noquote() << QStringLiteral("timeout: %1s").arg(formatSeconds(*m_options.timeout));
    }
    qInfo().noquote() << QStringLiteral("debounce: %1s").arg(formatSeconds(m_options.debounce));

    TLOG_INFO(QStringLiteral("WatchLoop"),
              QStringLiteral("runSession"),
              QStringLiteral("watch_started"),
              QStringLiteral("user_invocation"),
              QStringLiteral("watch_loop"),
              tether::logging::defaultWho(),
              tether::logging::currentCorrelationId(),
              (nlohmann::json{{"device", m_platform.deviceLabel().toStdString()},
                              {"debounceMs", m_options.debounce.count()},
                              {"maxRetries", m_options.maxRetries},
                              {"outputDir", m_options.targets.outputDir.toStdString()}}));

    if (m_interrupted.load()) {
        return WatchOutcome::Interrupted;
    }
    captureSnapshot(kTriggerInitial);

    m_deadline.reset();
    if (m_options.timeout) {
        m_deadline = Clock::now() + *m_options.timeout;
    }

    const std::optional<ProcessCommand> eventCommand = m_platform.eventStreamCommand();
    if (eventCommand) {
        return runEventMode(*eventCommand);
    }
    return runPollMode();
}

WatchOutcome WatchLoop::runEventMode(const ProcessCommand &eventCommand)
{
    EventStreamReader events(eventCommand);
    int retries = 0;

    while (true) {
        if (m_interrupted.load()) {
            return WatchOutcome::Interrupted;
        }
        if (deadlineReached()) {
            qInfo().noquote() << "timeout reached";
            return WatchOutcome::Completed;
        }

        if (!events.start()) {
            qWarning().noquote() << "failed to start events:" << eventCommand.program;
            ++retries;
        } else {
            qInfo().noquote() << "events connected";
            bool captured = false;
            while (events.isConnected()) {
                if (m_interrupted.load()) {
                    events.stop();
                    return WatchOutcome::Interrupted;
                }
                if (deadlineReached()) {
                    events.stop();
                    qInfo().noquote() << "timeout reached";
                    return WatchOutcome::Completed;
                }
                const std::optional<std::string> settled = events.takeSettledEvent(m_options.debounce);
                if (settled) {
                    // The stream is restarted after the capture so the dump
                    // itself does not feed back as new events.
                    events.stop();
                    captureSnapshot(*settled);
                    retries = 0;
                    captured = true;
                    break;
                }
                std::this_thread::sleep_for(m_options.tick);
            }
            events.stop();
            if (captured) {
                continue;
            }
            ++retries;
            qWarning().noquote() << "event stream ended";
        }

        reportDisconnect(retries);
        if (retries >= m_options.maxRetries) {
            qWarning().noquote() << "max retries reached, exiting";
            TLOG_ERROR(QStringLiteral("WatchLoop"),
                       QStringLiteral("runEventMode"),
                       QStringLiteral("event_retries_exhausted"),
                       QStringLiteral("event_stream_unavailable"),
                       QStringLiteral("abort_session"),
                       tether::logging::defaultWho(),
                       tether::logging::currentCorrelationId(),
                       (nlohmann::json{{"retries", retries},
                                       {"program", eventCommand.program.toStdString()}}));
            return WatchOutcome::RetriesExhausted;
        }
        qInfo().noquote() << QStringLiteral("reconnecting (%1/%2)...")
                                 .arg(retries)
                                 .arg(m_options.maxRetries);
        if (!pause(m_options.retryDelay)) {
            return WatchOutcome::Interrupted;
        }
    }
}

WatchOutcome WatchLoop::runPollMode()
{
    const std::chrono::milliseconds interval = std::max(m_options.debounce, m_options.pollFloor);
    qInfo().noquote() << QStringLiteral("poll mode (every %1s)").arg(formatSeconds(interval));

    while (true) {
        if (m_interrupted.load()) {
            return WatchOutcome::Interrupted;
        }
        if (deadlineReached()) {
            qInfo().noquote() << "timeout reached";
            return WatchOutcome::Completed;
        }
        if (!pause(std::min(interval, timeUntilDeadline()))) {
            return WatchOutcome::Interrupted;
        }
        if (deadlineReached()) {
            qInfo().noquote() << "timeout reached";
            return WatchOutcome::Completed;
        }
        captureSnapshot(kTriggerPoll);
    }
}

void WatchLoop::captureSnapshot(const std::string &trigger)
{
    tether::logging::SnapshotScope snapshot(++m_sequence);
    m_capture.capture(trigger, m_sequence);
    restartLogsIfEnded();
}

void WatchLoop::restartLogsIfEnded()
{
    if (!m_logs || m_logs->isRunning()) {
        return;
    }
    TLOG_INFO(QStringLiteral("WatchLoop"),
              QStringLiteral("restartLogsIfEnded"),
              QStringLiteral("log_stream_restart"),
              QStringLiteral("log_stream_not_running"),
              QStringLiteral("log_collector_start"),
              tether::logging::defaultWho(),
              tether::logging::currentCorrelationId(),
              nlohmann::json::object());
    if (!m_logs->start()) {
        qWarning().noquote() << "log stream restart failed";
    }
}

bool WatchLoop::pause(std::chrono::milliseconds duration) const
{
    const Clock::time_point until = Clock::now() + duration;
    while (Clock::now() < until) {
        if (m_interrupted.load()) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            until - Clock::now());
        std::this_thread::sleep_for(std::max(std::chrono::milliseconds(1),
                                             std::min(m_options.tick, remaining)));
    }
    return !m_interrupted.load();
}

bool WatchLoop::deadlineReached() const
{
    return m_deadline && Clock::now() >= *m_deadline;
}

std::chrono::milliseconds WatchLoop::timeUntilDeadline() const
{
    if (!m_deadline) {
        return std::chrono::milliseconds::max();
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *m_deadline - Clock::now());
    return std::max(std::chrono::milliseconds(0), remaining);
}

void WatchLoop::reportDisconnect(int retries)
{
    TLOG_WARN(QStringLiteral("WatchLoop"),
              QStringLiteral("runEventMode"),
              QStringLiteral("event_stream_disconnected"),
              QStringLiteral("spawn_failed_or_exited"),
              QStringLiteral("reconnect_with_backoff"),
              tether::logging::defaultWho(),
              tether::logging::currentCorrelationId(),
              (nlohmann::json{{"retries", retries}, {"maxRetries", m_options.maxRetries}}));
}

} // namespace tether
