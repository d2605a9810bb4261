#include "observe/severity_classifier.hpp"

#include <QRegularExpression>

#include <utility>
#include <vector>

namespace tether {

namespace {

QRegularExpression caseless(const QString &pattern)
{
    return QRegularExpression(pattern, QRegularExpression::CaseInsensitiveOption);
}

const QRegularExpression &logcatCrashPattern()
{
    static const QRegularExpression pattern =
        caseless(QStringLiteral("FATAL|ANR|CRASH|AndroidRuntime"));
    return pattern;
}

const QRegularExpression &logcatErrorPattern()
{
    static const QRegularExpression pattern =
        caseless(QStringLiteral("Error|Exception|E/"));
    return pattern;
}

const QRegularExpression &unifiedCrashPattern()
{
    static const QRegularExpression pattern =
        caseless(QStringLiteral("fault|crash|SIGABRT|EXC_BAD_ACCESS"));
    return pattern;
}

const QRegularExpression &unifiedErrorPattern()
{
    static const QRegularExpression pattern =
        caseless(QStringLiteral("error|exception"));
    return pattern;
}

// React Native JS console, fatal/ANR/crash markers, runtime exceptions,
// the test driver, and error-level tags that name an error.
const std::vector<QRegularExpression> &logcatInterestPatterns()
{
    static const std::vector<QRegularExpression> patterns = {
        caseless(QStringLiteral("ReactNativeJS")),
        caseless(QStringLiteral("FATAL|ANR|CRASH")),
        caseless(QStringLiteral("AndroidRuntime.*Exception")),
        caseless(QStringLiteral("maestro")),
        caseless(QStringLiteral("E/\\S+\\s*:\\s*(?:Error|Exception|Fatal|Crash)")),
    };
    return patterns;
}

} // namespace

LogSeverity SeverityClassifier::classify(const QString &line, LogFlavor flavor)
{
    const bool logcat = flavor == LogFlavor::Logcat;
    const QRegularExpression &crash = logcat ? logcatCrashPattern() : unifiedCrashPattern();
    const QRegularExpression &error = logcat ? logcatErrorPattern() : unifiedErrorPattern();

    if (crash.match(line).hasMatch()) {
        return LogSeverity::Crash;
    }
    if (error.match(line).hasMatch()) {
        return LogSeverity::Error;
    }
    return LogSeverity::Info;
}

LogInterestFilter::LogInterestFilter(LogFlavor flavor, QString appId, bool prefiltered)
    : m_flavor(flavor)
    , m_appId(std::move(appId))
    , m_prefiltered(prefiltered)
{
}

bool LogInterestFilter::matches(const QString &line) const
{
    if (m_prefiltered) {
        return true;
    }
    if (!m_appId.isEmpty() && line.contains(m_appId)) {
        return true;
    }
    if (m_flavor == LogFlavor::UnifiedLog) {
        return unifiedCrashPattern().match(line).hasMatch()
            || unifiedErrorPattern().match(line).hasMatch();
    }
    for (const auto &pattern : logcatInterestPatterns()) {
        if (pattern.match(line).hasMatch()) {
            return true;
        }
    }
    return false;
}

} // namespace tether
