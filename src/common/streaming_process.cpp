#include "common/streaming_process.hpp"

#include <QProcess>

#include "common/logging.hpp"

namespace tether {

namespace {

constexpr int kStartTimeoutMs = 5000;
constexpr int kReadPollMs = 100;

QString chompLine(const QByteArray &raw)
{
    QString line = QString::fromUtf8(raw);
    while (line.endsWith(QLatin1Char('\n')) || line.endsWith(QLatin1Char('\r'))) {
        line.chop(1);
    }
    return line;
}

} // namespace

StreamingProcess::~StreamingProcess()
{
    stop();
}

bool StreamingProcess::start(const ProcessCommand &command, LineHandler handler)
{
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (m_reader.joinable()) {
        if (m_running.load()) {
            return true;
        }
        // The previous subprocess exited on its own; reap its reader first.
        m_reader.join();
    }

    m_stopRequested = false;
    std::promise<bool> started;
    std::future<bool> startedFuture = started.get_future();
    m_reader = std::thread(&StreamingProcess::readerLoop, this,
                           command, std::move(handler), &started);

    if (!startedFuture.get()) {
        m_reader.join();
        return false;
    }
    return true;
}

void StreamingProcess::stop()
{
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    m_stopRequested = true;
    if (m_reader.joinable()) {
        m_reader.join();
    }
    m_running = false;
}

bool StreamingProcess::isRunning() const
{
    return m_running.load();
}

void StreamingProcess::readerLoop(ProcessCommand command, LineHandler handler,
                                  std::promise<bool> *started)
{
    QProcess process;
    process.setStandardErrorFile(QProcess::nullDevice());
    process.start(command.program, command.arguments);
    if (!process.waitForStarted(kStartTimeoutMs)) {
        TLOG_WARN(QStringLiteral("StreamingProcess"),
                  QStringLiteral("readerLoop"),
                  QStringLiteral("stream_start_failed"),
                  QStringLiteral("spawn_error"),
                  QStringLiteral("qprocess"),
                  tether::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"program", command.program.toStdString()},
                                  {"error", process.errorString().toStdString()}}));
        m_running = false;
        started->set_value(false);
        return;
    }

    m_running = true;
    // `started` belongs to start() and must not be touched after this point.
    started->set_value(true);

    const auto deliverCompleteLines = [&process, &handler]() {
        while (process.canReadLine()) {
            handler(chompLine(process.readLine()));
        }
    };

    while (!m_stopRequested.load()) {
        if (process.waitForReadyRead(kReadPollMs)) {
            deliverCompleteLines();
            continue;
        }
        if (process.state() == QProcess::NotRunning) {
            break;
        }
    }

    if (!m_stopRequested.load()) {
        // Exited on its own: hand over whatever it printed last.
        deliverCompleteLines();
        const QByteArray tail = process.readAllStandardOutput();
        if (!tail.isEmpty()) {
            handler(chompLine(tail));
        }
        TLOG_DEBUG(QStringLiteral("StreamingProcess"),
                   QStringLiteral("readerLoop"),
                   QStringLiteral("stream_ended"),
                   QStringLiteral("process_exit"),
                   QStringLiteral("eof"),
                   tether::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"program", command.program.toStdString()},
                                   {"exitCode", process.exitCode()}}));
    }

    terminateProcess(process);
    m_running = false;
}

} // namespace tether
