#include <QtTest/QtTest>

#include "observe/severity_classifier.hpp"

using tether::LogFlavor;
using tether::LogInterestFilter;
using tether::LogSeverity;
using tether::SeverityClassifier;

Q_DECLARE_METATYPE(tether::LogSeverity)
Q_DECLARE_METATYPE(tether::LogFlavor)

class SeverityClassifierTests : public QObject
{
    Q_OBJECT
private slots:
    void testClassify_data();
    void testClassify();
    void testLogcatInterest();
    void testAppIdMatchesAnyLine();
    void testUnifiedLogInterest();
    void testPrefilteredAcceptsEverything();
};

void SeverityClassifierTests::testClassify_data()
{
    QTest::addColumn<QString>("line");
    QTest::addColumn<LogFlavor>("flavor");
    QTest::addColumn<LogSeverity>("expected");

    QTest::newRow("fatal exception")
        << QStringLiteral("E/AndroidRuntime: FATAL EXCEPTION: main")
        << LogFlavor::Logcat << LogSeverity::Crash;
    QTest::newRow("anr")
        << QStringLiteral("I/ActivityManager: ANR in com.example.app")
        << LogFlavor::Logcat << LogSeverity::Crash;
    QTest::newRow("lowercase crash")
        << QStringLiteral("W/Thing: app did crash on resume")
        << LogFlavor::Logcat << LogSeverity::Crash;
    QTest::newRow("error tag")
        << QStringLiteral("E/Network: socket closed")
        << LogFlavor::Logcat << LogSeverity::Error;
    QTest::newRow("exception word")
        << QStringLiteral("W/ReactNativeJS: TypeError exception thrown")
        << LogFlavor::Logcat << LogSeverity::Error;
    QTest::newRow("plain info")
        << QStringLiteral("I/ReactNativeJS: rendering home")
        << LogFlavor::Logcat << LogSeverity::Info;
    QTest::newRow("ios fault")
        << QStringLiteral("12:00:01.000 Df MyApp[123:456] fault in layout")
        << LogFlavor::UnifiedLog << LogSeverity::Crash;
    QTest::newRow("ios bad access")
        << QStringLiteral("Exception Type: EXC_BAD_ACCESS (SIGSEGV)")
        << LogFlavor::UnifiedLog << LogSeverity::Crash;
    QTest::newRow("ios error")
        << QStringLiteral("12:00:01.000 E MyApp: Error loading profile")
        << LogFlavor::UnifiedLog << LogSeverity::Error;
    QTest::newRow("ios info")
        << QStringLiteral("12:00:01.000 Df MyApp: view did appear")
        << LogFlavor::UnifiedLog << LogSeverity::Info;
    // "E/" is a logcat convention only.
    QTest::newRow("ios ignores logcat tag")
        << QStringLiteral("E/Something: nothing special")
        << LogFlavor::UnifiedLog << LogSeverity::Info;
}

void SeverityClassifierTests::testClassify()
{
    QFETCH(QString, line);
    QFETCH(LogFlavor, flavor);
    QFETCH(LogSeverity, expected);

    QCOMPARE(SeverityClassifier::classify(line, flavor), expected);
}

void SeverityClassifierTests::testLogcatInterest()
{
    const LogInterestFilter filter(LogFlavor::Logcat, QString());

    QVERIFY(filter.matches(QStringLiteral("E/AndroidRuntime: FATAL EXCEPTION")));
    QVERIFY(filter.matches(QStringLiteral("I/ReactNativeJS: hello")));
    QVERIFY(filter.matches(QStringLiteral("E/AndroidRuntime: java.lang.IllegalStateException")));
    QVERIFY(filter.matches(QStringLiteral("D/maestro: tapping")));
    QVERIFY(filter.matches(QStringLiteral("E/Storage: Error opening db")));

    QVERIFY(!filter.matches(QStringLiteral("I/System: normal")));
    QVERIFY(!filter.matches(QStringLiteral("D/Choreographer: skipped 30 frames")));
}

void SeverityClassifierTests::testAppIdMatchesAnyLine()
{
    const LogInterestFilter withApp(LogFlavor::Logcat, QStringLiteral("com.example.app"));
    QVERIFY(withApp.matches(QStringLiteral("I/ActivityTaskManager: Displayed com.example.app/.Main")));

    const LogInterestFilter withoutApp(LogFlavor::Logcat, QString());
    QVERIFY(!withoutApp.matches(QStringLiteral("I/ActivityTaskManager: Displayed com.example.app/.Main")));
}

void SeverityClassifierTests::testUnifiedLogInterest()
{
    const LogInterestFilter filter(LogFlavor::UnifiedLog, QString());
    QVERIFY(filter.matches(QStringLiteral("MyApp: fault while drawing")));
    QVERIFY(filter.matches(QStringLiteral("MyApp: network error")));
    QVERIFY(!filter.matches(QStringLiteral("MyApp: view did appear")));
}

void SeverityClassifierTests::testPrefilteredAcceptsEverything()
{
    const LogInterestFilter filter(LogFlavor::UnifiedLog, QString(), true);
    QVERIFY(filter.matches(QStringLiteral("MyApp: view did appear")));
}

QTEST_MAIN(SeverityClassifierTests)
#include "test_severity_classifier.moc"
