#include "platform/android_platform.hpp"

#include <QSaveFile>
#include <QStringList>

#include "common/logging.hpp"

namespace tether {

namespace {

constexpr int kProbeTimeoutMs = 5000;
constexpr int kDumpTimeoutMs = 10000;
constexpr int kReadDumpTimeoutMs = 5000;
constexpr int kOneShotLogTimeoutMs = 10000;
// screencap returns a short error text instead of a PNG when it fails.
constexpr int kMinScreenshotBytes = 1000;

const QString kAdb = QStringLiteral("adb");
const QString kDumpPath = QStringLiteral("/sdcard/ui.xml");

} // namespace

AndroidPlatform::AndroidPlatform(const TetherConfig &config)
    : m_avd(config.avd)
    , m_screenshotTimeoutMs(config.timeoutScreenshotSeconds * 1000)
    , m_normalizer(config.androidFilters)
{
}

PlatformKind AndroidPlatform::kind() const
{
    return PlatformKind::Android;
}

QString AndroidPlatform::deviceLabel() const
{
    return m_avd;
}

ProbeResult AndroidPlatform::probe()
{
    ProbeResult result;
    const CommandResult devices = runCommand({kAdb, {QStringLiteral("devices")}}, kProbeTimeoutMs);
    if (!devices.succeeded()) {
        result.message = "adb failed";
        return result;
    }

    // First line is the "List of devices attached" header.
    const QStringList lines = QString::fromUtf8(devices.standardOutput)
                                  .split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (int i = 1; i < lines.size(); ++i) {
        const QStringList columns = lines.at(i).simplified().split(QLatin1Char(' '));
        if (columns.size() >= 2 && columns.at(1) == QStringLiteral("device")) {
            result.available = true;
            result.message = columns.at(0).toStdString();
            return result;
        }
    }
    result.message = "not running";
    return result;
}

bool AndroidPlatform::screenshot(const QString &outputPath)
{
    const CommandResult capture = runCommand(
        {kAdb, {QStringLiteral("exec-out"), QStringLiteral("screencap"), QStringLiteral("-p")}},
        m_screenshotTimeoutMs);
    if (!capture.succeeded() || capture.standardOutput.size() <= kMinScreenshotBytes) {
        TLOG_DEBUG(QStringLiteral("AndroidPlatform"),
                   QStringLiteral("screenshot"),
                   QStringLiteral("screenshot_failed"),
                   QStringLiteral("screencap_output_invalid"),
                   QStringLiteral("adb_exec_out"),
                   tether::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"bytes", capture.standardOutput.size()},
                                   {"timedOut", capture.timedOut}}));
        return false;
    }

    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    file.write(capture.standardOutput);
    return file.commit();
}

QString AndroidPlatform::dumpRawTree()
{
    const CommandResult dumped = runCommand(
        {kAdb, {QStringLiteral("shell"), QStringLiteral("uiautomator"),
                QStringLiteral("dump"), kDumpPath}},
        kDumpTimeoutMs);
    if (!dumped.started || dumped.timedOut) {
        return QString();
    }

    const CommandResult read = runCommand(
        {kAdb, {QStringLiteral("shell"), QStringLiteral("cat"), kDumpPath}},
        kReadDumpTimeoutMs);
    if (!read.succeeded()) {
        return QString();
    }
    return QString::fromUtf8(read.standardOutput);
}

std::vector<Element> AndroidPlatform::parseTree(const QString &rawTree, bool assignRefs) const
{
    return m_normalizer.normalize(rawTree, assignRefs);
}

LogStreamProfile AndroidPlatform::logStreamProfile() const
{
    LogStreamProfile profile;
    profile.stream = {kAdb, {QStringLiteral("logcat"), QStringLiteral("-v"), QStringLiteral("time")}};
    profile.clearCommand = ProcessCommand{kAdb, {QStringLiteral("logcat"), QStringLiteral("-c")}};
    profile.flavor = LogFlavor::Logcat;
    profile.bannerPrefix = QStringLiteral("--------- beginning of");
    return profile;
}

std::optional<ProcessCommand> AndroidPlatform::eventStreamCommand() const
{
    return ProcessCommand{kAdb, {QStringLiteral("shell"), QStringLiteral("uiautomator"),
                                 QStringLiteral("events")}};
}

QString AndroidPlatform::oneShotLogs(int lines)
{
    const CommandResult logs = runCommand(
        {kAdb, {QStringLiteral("logcat"), QStringLiteral("-d"), QStringLiteral("-v"),
                QStringLiteral("time"), QStringLiteral("-t"), QString::number(lines * 10)}},
        kOneShotLogTimeoutMs);
    if (!logs.succeeded()) {
        return QString();
    }
    return QString::fromUtf8(logs.standardOutput);
}

} // namespace tether
