#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <chrono>
#include <thread>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "fake_platform.hpp"
#include "observe/log_collector.hpp"

using tether::LogCollector;
using tether::LogEntry;
using tether::LogSeverity;
using tether::LogStreamProfile;
using tether::testing::shellCommand;

namespace {

LogStreamProfile logcatProfile(const QString &script)
{
    LogStreamProfile profile;
    profile.stream = shellCommand(script);
    profile.flavor = tether::LogFlavor::Logcat;
    profile.bannerPrefix = QStringLiteral("--------- beginning of");
    return profile;
}

// Waits until the collector buffered `count` entries or the timeout passed.
bool waitForEntries(const LogCollector &collector, std::size_t count, int timeoutMs = 5000)
{
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < until) {
        if (collector.recent(count).size() >= count) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

} // namespace

class LogCollectorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testFatalAndNormalLines();
    void testBannerAndBlankLinesSkipped();
    void testRingBufferDropsOldest();
    void testDrainEmptiesBuffer();
    void testStreamingSubprocess();
    void testClearCommandRunsFirst();
    void testStopTerminatesStream();
    void testStopWhenNeverStarted();
    void testSpawnFailureLeavesStopped();
    void testSave();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void LogCollectorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    tether::logging::initLogging(QStringLiteral("tether-test"), false);
}

void LogCollectorTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void LogCollectorTests::testFatalAndNormalLines()
{
    LogCollector collector(logcatProfile(QStringLiteral("true")));
    collector.ingestLine(QStringLiteral("E/AndroidRuntime: FATAL EXCEPTION"));
    collector.ingestLine(QStringLiteral("I/System: normal"));

    const std::vector<LogEntry> entries = collector.drain();
    int crashes = 0;
    int infos = 0;
    for (const auto &entry : entries) {
        crashes += entry.severity == LogSeverity::Crash ? 1 : 0;
        infos += entry.severity == LogSeverity::Info ? 1 : 0;
    }
    QCOMPARE(crashes, 1);
    QCOMPARE(infos, 0);
    QCOMPARE(entries.size(), std::size_t(1));
}

void LogCollectorTests::testBannerAndBlankLinesSkipped()
{
    LogCollector collector(logcatProfile(QStringLiteral("true")));
    collector.ingestLine(QStringLiteral("--------- beginning of crash"));
    collector.ingestLine(QStringLiteral(""));
    collector.ingestLine(QStringLiteral("   \r\n"));
    collector.ingestLine(QStringLiteral("I/ReactNativeJS: ready   \r\n"));

    const auto entries = collector.drain();
    QCOMPARE(entries.size(), std::size_t(1));
    QCOMPARE(QString::fromStdString(entries.front().line), QStringLiteral("I/ReactNativeJS: ready"));
    QCOMPARE(entries.front().severity, LogSeverity::Info);
}

void LogCollectorTests::testRingBufferDropsOldest()
{
    LogCollector collector(logcatProfile(QStringLiteral("true")), QString(), 3);
    for (int i = 1; i <= 5; ++i) {
        collector.ingestLine(QStringLiteral("I/ReactNativeJS: line %1").arg(i));
    }

    const auto recent = collector.recent(10);
    QCOMPARE(recent.size(), std::size_t(3));
    QCOMPARE(QString::fromStdString(recent.front().line), QStringLiteral("I/ReactNativeJS: line 3"));
    QCOMPARE(QString::fromStdString(recent.back().line), QStringLiteral("I/ReactNativeJS: line 5"));

    const auto lastTwo = collector.recent(2);
    QCOMPARE(lastTwo.size(), std::size_t(2));
    QCOMPARE(QString::fromStdString(lastTwo.front().line), QStringLiteral("I/ReactNativeJS: line 4"));

    // recent() does not consume.
    QCOMPARE(collector.drain().size(), std::size_t(3));
}

void LogCollectorTests::testDrainEmptiesBuffer()
{
    LogCollector collector(logcatProfile(QStringLiteral("true")), QStringLiteral("com.example.app"));
    collector.ingestLine(QStringLiteral("I/Activity: com.example.app resumed"));

    QCOMPARE(collector.drain().size(), std::size_t(1));
    QVERIFY(collector.drain().empty());
    QVERIFY(collector.recent().empty());
}

void LogCollectorTests::testStreamingSubprocess()
{
    LogCollector collector(logcatProfile(QStringLiteral(
        "echo '--------- beginning of main'; "
        "echo 'E/AndroidRuntime: FATAL EXCEPTION: main'; "
        "echo 'I/System: normal'; "
        "echo 'E/Storage: Error opening db'; "
        "sleep 30")));
    QVERIFY(collector.start());
    QVERIFY(collector.isRunning());
    // Idempotent while running.
    QVERIFY(collector.start());

    QVERIFY(waitForEntries(collector, 2));
    const auto entries = collector.drain();
    QCOMPARE(entries.size(), std::size_t(2));
    QCOMPARE(entries.at(0).severity, LogSeverity::Crash);
    QCOMPARE(entries.at(1).severity, LogSeverity::Error);

    collector.stop();
    QVERIFY(!collector.isRunning());
}

void LogCollectorTests::testClearCommandRunsFirst()
{
    const QString marker = m_tempDir.filePath(QStringLiteral("cleared"));
    LogStreamProfile profile = logcatProfile(QStringLiteral("sleep 30"));
    profile.clearCommand = shellCommand(QStringLiteral("touch '%1'").arg(marker));

    LogCollector collector(profile);
    QVERIFY(collector.start());
    QVERIFY(QFile::exists(marker));
    collector.stop();
}

void LogCollectorTests::testStopTerminatesStream()
{
    LogCollector collector(logcatProfile(QStringLiteral("trap '' TERM; while true; do sleep 1; done")));
    QVERIFY(collector.start());

    const auto started = std::chrono::steady_clock::now();
    collector.stop();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    // A process ignoring SIGTERM is killed once the grace period runs out.
    QVERIFY(!collector.isRunning());
    QVERIFY(elapsed < std::chrono::seconds(10));
    collector.stop();
}

void LogCollectorTests::testStopWhenNeverStarted()
{
    LogCollector collector(logcatProfile(QStringLiteral("sleep 30")));
    collector.stop();
    collector.stop();
    QVERIFY(!collector.isRunning());
    QVERIFY(collector.drain().empty());
}

void LogCollectorTests::testSpawnFailureLeavesStopped()
{
    LogStreamProfile profile;
    profile.stream = tether::ProcessCommand{QStringLiteral("/nonexistent/tether-log-stream"), {}};
    LogCollector collector(profile);

    QVERIFY(!collector.start());
    QVERIFY(!collector.isRunning());
    QVERIFY(collector.drain().empty());
    collector.stop();
}

void LogCollectorTests::testSave()
{
    LogCollector collector(logcatProfile(QStringLiteral("true")));
    collector.ingestLine(QStringLiteral("E/AndroidRuntime: FATAL EXCEPTION"));

    const QString path = m_tempDir.filePath(QStringLiteral("logs.json"));
    QVERIFY(collector.save(path));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto saved = nlohmann::json::parse(file.readAll().toStdString());
    QVERIFY(saved.is_array());
    QCOMPARE(saved.size(), std::size_t(1));
    QCOMPARE(QString::fromStdString(saved.at(0).value("severity", "")), QStringLiteral("crash"));
}

QTEST_MAIN(LogCollectorTests)
#include "test_log_collector.moc"
