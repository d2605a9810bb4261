#include "observe/log_collector.hpp"

#include <QDebug>
#include <QSaveFile>

#include <algorithm>
#include <chrono>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace tether {

namespace {

constexpr int kClearTimeoutMs = 3000;

QString rightTrimmed(const QString &line)
{
    int end = line.size();
    while (end > 0 && line.at(end - 1).isSpace()) {
        --end;
    }
    return line.left(end);
}

} // namespace

LogCollector::LogCollector(LogStreamProfile profile, QString appId, int maxLines)
    : m_profile(std::move(profile))
    , m_filter(m_profile.flavor, std::move(appId), m_profile.prefiltered)
    , m_maxLines(static_cast<std::size_t>(std::max(1, maxLines)))
{
}

LogCollector::~LogCollector()
{
    stop();
}

bool LogCollector::start()
{
    if (m_started && m_stream.isRunning()) {
        return true;
    }

    if (m_profile.clearCommand) {
        const CommandResult cleared = runCommand(*m_profile.clearCommand, kClearTimeoutMs);
        if (!cleared.succeeded()) {
            TLOG_DEBUG(QStringLiteral("LogCollector"),
                       QStringLiteral("start"),
                       QStringLiteral("log_clear_failed"),
                       QStringLiteral("backlog_clear"),
                       QStringLiteral("run_command"),
                       tether::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"program", m_profile.clearCommand->program.toStdString()},
                                       {"error", cleared.standardError.toStdString()}}));
        }
    }

    const bool started = m_stream.start(m_profile.stream, [this](const QString &line) {
        ingestLine(line);
    });
    if (!started) {
        m_started = false;
        qWarning().noquote() << "log stream unavailable:" << m_profile.stream.program;
        TLOG_WARN(QStringLiteral("LogCollector"),
                  QStringLiteral("start"),
                  QStringLiteral("log_stream_start_failed"),
                  QStringLiteral("spawn_error"),
                  QStringLiteral("stay_stopped"),
                  tether::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"program", m_profile.stream.program.toStdString()}}));
        return false;
    }

    m_started = true;
    TLOG_INFO(QStringLiteral("LogCollector"),
              QStringLiteral("start"),
              QStringLiteral("log_stream_started"),
              QStringLiteral("collector_start"),
              QStringLiteral("streaming_process"),
              tether::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"program", m_profile.stream.program.toStdString()},
                              {"maxLines", m_maxLines}}));
    return true;
}

void LogCollector::stop()
{
    m_stream.stop();
    m_started = false;
}

bool LogCollector::isRunning() const
{
    return m_stream.isRunning();
}

std::vector<LogEntry> LogCollector::drain()
{
    reportStreamEnd();

    std::vector<LogEntry> entries;
    {
        std::lock_guard<std::mutex> lock(m_bufferMutex);
        entries.assign(std::make_move_iterator(m_buffer.begin()),
                       std::make_move_iterator(m_buffer.end()));
        m_buffer.clear();
    }
    return entries;
}

std::vector<LogEntry> LogCollector::recent(std::size_t n) const
{
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    const std::size_t count = std::min(n, m_buffer.size());
    return std::vector<LogEntry>(m_buffer.end() - static_cast<std::ptrdiff_t>(count),
                                 m_buffer.end());
}

bool LogCollector::save(const QString &path) const
{
    const OrderedJson payload = recent();
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    file.write(QByteArray::fromStdString(payload.dump(2)));
    return file.commit();
}

void LogCollector::ingestLine(const QString &rawLine)
{
    const QString line = rightTrimmed(rawLine);
    if (line.isEmpty()) {
        return;
    }
    if (!m_profile.bannerPrefix.isEmpty() && line.startsWith(m_profile.bannerPrefix)) {
        return;
    }
    if (!m_filter.matches(line)) {
        return;
    }

    LogEntry entry;
    entry.line = line.toStdString();
    entry.timestamp = std::chrono::system_clock::now();
    entry.severity = SeverityClassifier::classify(line, m_profile.flavor);

    std::lock_guard<std::mutex> lock(m_bufferMutex);
    m_buffer.push_back(std::move(entry));
    while (m_buffer.size() > m_maxLines) {
        m_buffer.pop_front();
    }
}

void LogCollector::reportStreamEnd()
{
    if (!m_started || m_stream.isRunning()) {
        return;
    }
    // Report once; a later start() relaunches the stream.
    m_started = false;
    qWarning().noquote() << "log stream ended:" << m_profile.stream.program;
    TLOG_WARN(QStringLiteral("LogCollector"),
              QStringLiteral("reportStreamEnd"),
              QStringLiteral("log_stream_ended"),
              QStringLiteral("process_exit"),
              QStringLiteral("best_effort"),
              tether::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"program", m_profile.stream.program.toStdString()}}));
}

} // namespace tether
