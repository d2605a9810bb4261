#include <QtTest/QtTest>

#include <QProcess>
#include <QTemporaryDir>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "common/streaming_process.hpp"

using tether::ProcessCommand;

namespace {

ProcessCommand shell(const QString &script)
{
    return ProcessCommand{QStringLiteral("/bin/sh"), {QStringLiteral("-c"), script}};
}

} // namespace

class ProcessUtilsTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testRunCommandCapturesOutput();
    void testRunCommandExitCode();
    void testRunCommandTimeout();
    void testRunCommandMissingProgram();
    void testTerminateEscalatesToKill();
    void testFindExecutable();
    void testStreamingDeliversLines();
    void testStreamingNaturalExit();
    void testStreamingRestartAfterExit();
    void testStreamingSpawnFailure();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void ProcessUtilsTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    tether::logging::initLogging(QStringLiteral("tether-test"), false);
}

void ProcessUtilsTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ProcessUtilsTests::testRunCommandCapturesOutput()
{
    const tether::CommandResult result = tether::runCommand(
        shell(QStringLiteral("printf 'hello\\n'; echo oops >&2")), 5000);
    QVERIFY(result.started);
    QVERIFY(!result.timedOut);
    QVERIFY(result.succeeded());
    QCOMPARE(result.standardOutput, QByteArray("hello\n"));
    QCOMPARE(result.standardError.trimmed(), QStringLiteral("oops"));
}

void ProcessUtilsTests::testRunCommandExitCode()
{
    const tether::CommandResult result = tether::runCommand(shell(QStringLiteral("exit 3")), 5000);
    QVERIFY(result.started);
    QCOMPARE(result.exitCode, 3);
    QVERIFY(!result.succeeded());
}

void ProcessUtilsTests::testRunCommandTimeout()
{
    const auto started = std::chrono::steady_clock::now();
    const tether::CommandResult result = tether::runCommand(shell(QStringLiteral("exec sleep 30")), 300);
    QVERIFY(result.started);
    QVERIFY(result.timedOut);
    QVERIFY(!result.succeeded());
    QVERIFY(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

void ProcessUtilsTests::testRunCommandMissingProgram()
{
    const tether::CommandResult result = tether::runCommand(
        ProcessCommand{QStringLiteral("/nonexistent/tether-tool"), {}}, 1000);
    QVERIFY(!result.started);
    QVERIFY(!result.succeeded());
    QVERIFY(!result.standardError.isEmpty());
}

void ProcessUtilsTests::testTerminateEscalatesToKill()
{
    QProcess process;
    process.start(QStringLiteral("/bin/sh"),
                  {QStringLiteral("-c"), QStringLiteral("trap '' TERM; while true; do sleep 0.1; done")});
    QVERIFY(process.waitForStarted(5000));

    tether::terminateProcess(process, 300);
    QCOMPARE(process.state(), QProcess::NotRunning);

    // Already stopped: nothing to do.
    tether::terminateProcess(process, 300);
    QProcess neverStarted;
    tether::terminateProcess(neverStarted, 300);
}

void ProcessUtilsTests::testFindExecutable()
{
    QVERIFY(!tether::findExecutable(QStringLiteral("sh")).isEmpty());
    QVERIFY(tether::findExecutable(QStringLiteral("tether-no-such-tool")).isEmpty());
}

void ProcessUtilsTests::testStreamingDeliversLines()
{
    std::mutex mutex;
    QStringList lines;

    tether::StreamingProcess stream;
    QVERIFY(stream.start(shell(QStringLiteral("echo one; echo two; exec sleep 30")),
                         [&](const QString &line) {
                             std::lock_guard<std::mutex> lock(mutex);
                             lines << line;
                         }));
    QVERIFY(stream.isRunning());

    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < until) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (lines.size() >= 2) {
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    stream.stop();
    QVERIFY(!stream.isRunning());
    std::lock_guard<std::mutex> lock(mutex);
    QCOMPARE(lines, QStringList({QStringLiteral("one"), QStringLiteral("two")}));
}

void ProcessUtilsTests::testStreamingNaturalExit()
{
    std::atomic<int> count{0};
    tether::StreamingProcess stream;
    QVERIFY(stream.start(shell(QStringLiteral("printf 'a\\nb\\nno-newline'")),
                         [&](const QString &) { ++count; }));

    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (stream.isRunning() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    QVERIFY(!stream.isRunning());
    QCOMPARE(count.load(), 3);
    stream.stop();
}

void ProcessUtilsTests::testStreamingRestartAfterExit()
{
    std::atomic<int> count{0};
    tether::StreamingProcess stream;
    QVERIFY(stream.start(shell(QStringLiteral("echo first")), [&](const QString &) { ++count; }));

    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (stream.isRunning() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    QVERIFY(!stream.isRunning());

    QVERIFY(stream.start(shell(QStringLiteral("echo second; exec sleep 30")),
                         [&](const QString &) { ++count; }));
    QVERIFY(stream.isRunning());
    stream.stop();
}

void ProcessUtilsTests::testStreamingSpawnFailure()
{
    tether::StreamingProcess stream;
    QVERIFY(!stream.start(ProcessCommand{QStringLiteral("/nonexistent/tether-stream"), {}},
                          [](const QString &) {}));
    QVERIFY(!stream.isRunning());
    stream.stop();
}

QTEST_MAIN(ProcessUtilsTests)
#include "test_process_utils.moc"
