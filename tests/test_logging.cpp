#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugSkippedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testSnapshotScopeTagsEvents();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
    static QList<QByteArray> readLines(const QString &path);
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/tether/logs/tether-test" + suffix;
}

QList<QByteArray> LoggingTests::readLines(const QString &path)
{
    QList<QByteArray> lines;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return lines;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

void LoggingTests::testLogEventWrites()
{
    tether::logging::initLogging(QStringLiteral("tether-test"), false);

    tether::logging::logEvent(tether::logging::LogLevel::Info,
                              QStringLiteral("tether-test"),
                              QStringLiteral("Test"),
                              QStringLiteral("testLogEventWrites"),
                              QStringLiteral("test_log"),
                              QStringLiteral("unit_test"),
                              QStringLiteral("direct_call"),
                              tether::logging::defaultWho(),
                              QStringLiteral("corr-1"),
                              nlohmann::json{{"key", "value"}});

    const QString path = logPath(QStringLiteral(".log"));
    QVERIFY(QFile::exists(path));
    const QList<QByteArray> lines = readLines(path);
    QVERIFY(!lines.isEmpty());

    const auto parsed = nlohmann::json::parse(lines.last().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.at("context").value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugSkippedWithoutTrace()
{
    tether::logging::initLogging(QStringLiteral("tether-test"), false);
    QVERIFY(!tether::logging::isTraceEnabled());
    const int before = readLines(logPath(QStringLiteral(".log"))).size();

    TLOG_DEBUG(QStringLiteral("Test"),
               QStringLiteral("testDebugSkippedWithoutTrace"),
               QStringLiteral("test_debug_hidden"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               tether::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    QCOMPARE(readLines(logPath(QStringLiteral(".log"))).size(), before);
}

void LoggingTests::testTraceWrites()
{
    tether::logging::initLogging(QStringLiteral("tether-test"), true);
    QVERIFY(tether::logging::isTraceEnabled());

    tether::logging::logEvent(tether::logging::LogLevel::Debug,
                              QStringLiteral("tether-test"),
                              QStringLiteral("Test"),
                              QStringLiteral("testTraceWrites"),
                              QStringLiteral("test_trace"),
                              QStringLiteral("unit_test"),
                              QStringLiteral("direct_call"),
                              tether::logging::defaultWho(),
                              QStringLiteral("corr-2"),
                              nlohmann::json::object());

    const QList<QByteArray> lines = readLines(logPath(QStringLiteral("-trace.log")));
    QVERIFY(!lines.isEmpty());
    const auto parsed = nlohmann::json::parse(lines.last().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("DEBUG"));

    tether::logging::initLogging(QStringLiteral("tether-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    tether::logging::setCorrelationId(QString());
    {
        tether::logging::CorrelationScope outer(QStringLiteral("session-a"));
        QCOMPARE(tether::logging::currentCorrelationId(), QStringLiteral("session-a"));
        {
            tether::logging::CorrelationScope inner(QStringLiteral("session-b"));
            QCOMPARE(tether::logging::currentCorrelationId(), QStringLiteral("session-b"));
        }
        QCOMPARE(tether::logging::currentCorrelationId(), QStringLiteral("session-a"));
    }
    QVERIFY(tether::logging::currentCorrelationId().isEmpty());
}

void LoggingTests::testSnapshotScopeTagsEvents()
{
    tether::logging::initLogging(QStringLiteral("tether-test"), false);
    const QString path = logPath(QStringLiteral(".log"));

    {
        tether::logging::SnapshotScope scope(7);
        QCOMPARE(tether::logging::currentSnapshot(), 7);
        TLOG_INFO(QStringLiteral("Test"),
                  QStringLiteral("testSnapshotScopeTagsEvents"),
                  QStringLiteral("test_in_snapshot"),
                  QStringLiteral("unit_test"),
                  QStringLiteral("macro"),
                  tether::logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
        const auto tagged = nlohmann::json::parse(readLines(path).last().toStdString());
        QCOMPARE(tagged.value("snapshot", 0), 7);
    }
    QCOMPARE(tether::logging::currentSnapshot(), 0);

    TLOG_INFO(QStringLiteral("Test"),
              QStringLiteral("testSnapshotScopeTagsEvents"),
              QStringLiteral("test_outside_snapshot"),
              QStringLiteral("unit_test"),
              QStringLiteral("macro"),
              tether::logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    const auto untagged = nlohmann::json::parse(readLines(path).last().toStdString());
    QVERIFY(!untagged.contains("snapshot"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
