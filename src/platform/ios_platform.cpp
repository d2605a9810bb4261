#include "platform/ios_platform.hpp"

#include <QFileInfo>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace tether {

namespace {

constexpr int kSimctlTimeoutMs = 5000;
constexpr int kDescribeTimeoutMs = 10000;
constexpr int kLogShowTimeoutMs = 20000;
constexpr qint64 kMinScreenshotBytes = 1000;

const QString kXcrun = QStringLiteral("xcrun");
const QString kAxe = QStringLiteral("axe");
const QString kBooted = QStringLiteral("booted");

bool screenshotWritten(const QString &path)
{
    const QFileInfo info(path);
    return info.exists() && info.size() > kMinScreenshotBytes;
}

QString logPredicate(const QString &appId)
{
    QString predicate = QStringLiteral(
        "subsystem == \"com.apple.UIKit\" OR "
        "messageType == 21 OR "
        "subsystem CONTAINS \"ReactNative\" OR "
        "process == \"maestro\"");
    if (!appId.isEmpty()) {
        predicate += QStringLiteral(" OR (processImagePath CONTAINS \"%1\" AND messageType >= 16)")
                         .arg(appId);
    }
    return predicate;
}

} // namespace

IosPlatform::IosPlatform(const TetherConfig &config)
    : m_simulator(config.simulatorTarget())
    , m_appId(config.appId)
    , m_screenshotTimeoutMs(config.timeoutScreenshotSeconds * 1000)
    , m_normalizer(config.iosFilters)
{
}

PlatformKind IosPlatform::kind() const
{
    return PlatformKind::Ios;
}

QString IosPlatform::deviceLabel() const
{
    return m_simulator;
}

ProbeResult IosPlatform::probe()
{
    ProbeResult result;
    const CommandResult listed = runCommand(
        {kXcrun, {QStringLiteral("simctl"), QStringLiteral("list"),
                  QStringLiteral("devices"), kBooted}},
        kSimctlTimeoutMs);
    if (!listed.succeeded()) {
        result.message = "simctl failed";
        return result;
    }

    const QString output = QString::fromUtf8(listed.standardOutput);
    if (m_simulator == kBooted) {
        if (output.contains(QStringLiteral("Booted"))) {
            result.available = true;
            result.message = "yes";
            return result;
        }
    } else {
        const QStringList lines = output.split(QLatin1Char('\n'));
        for (const QString &line : lines) {
            if (line.contains(m_simulator) && line.contains(QStringLiteral("Booted"))) {
                result.available = true;
                result.message = m_simulator.toStdString();
                return result;
            }
        }
    }
    result.message = "not running";
    return result;
}

QString IosPlatform::resolveUdid() const
{
    if (m_simulator != kBooted) {
        return m_simulator;
    }

    const CommandResult listed = runCommand(
        {kXcrun, {QStringLiteral("simctl"), QStringLiteral("list"), QStringLiteral("devices"),
                  kBooted, QStringLiteral("-j")}},
        kSimctlTimeoutMs);
    if (!listed.succeeded()) {
        return QString();
    }

    try {
        const auto data = nlohmann::json::parse(listed.standardOutput.toStdString());
        const auto devices = data.value("devices", nlohmann::json::object());
        for (const auto &runtime : devices.items()) {
            if (!runtime.value().is_array()) {
                continue;
            }
            for (const auto &device : runtime.value()) {
                if (device.value("state", "") == "Booted") {
                    return QString::fromStdString(device.value("udid", ""));
                }
            }
        }
    } catch (const nlohmann::json::exception &error) {
        TLOG_DEBUG(QStringLiteral("IosPlatform"),
                   QStringLiteral("resolveUdid"),
                   QStringLiteral("simctl_json_invalid"),
                   QStringLiteral("parse_error"),
                   QStringLiteral("nlohmann_json"),
                   tether::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", error.what()}}));
    }
    return QString();
}

bool IosPlatform::screenshot(const QString &outputPath)
{
    // AXe first: it matches the element dump's coordinate space.
    if (!findExecutable(kAxe).isEmpty()) {
        const QString udid = resolveUdid();
        if (!udid.isEmpty()) {
            const CommandResult captured = runCommand(
                {kAxe, {QStringLiteral("screenshot"), QStringLiteral("--output"), outputPath,
                        QStringLiteral("--udid"), udid}},
                m_screenshotTimeoutMs);
            if (captured.succeeded() && screenshotWritten(outputPath)) {
                return true;
            }
        }
    }

    const CommandResult captured = runCommand(
        {kXcrun, {QStringLiteral("simctl"), QStringLiteral("io"), m_simulator,
                  QStringLiteral("screenshot"), outputPath}},
        m_screenshotTimeoutMs);
    return captured.succeeded() && screenshotWritten(outputPath);
}

QString IosPlatform::dumpRawTree()
{
    if (findExecutable(kAxe).isEmpty()) {
        return QString();
    }
    const QString udid = resolveUdid();
    if (udid.isEmpty()) {
        return QString();
    }
    const CommandResult described = runCommand(
        {kAxe, {QStringLiteral("describe-ui"), QStringLiteral("--udid"), udid}},
        kDescribeTimeoutMs);
    if (!described.succeeded()) {
        return QString();
    }
    return QString::fromUtf8(described.standardOutput);
}

std::vector<Element> IosPlatform::parseTree(const QString &rawTree, bool assignRefs) const
{
    return m_normalizer.normalize(rawTree, assignRefs);
}

LogStreamProfile IosPlatform::logStreamProfile() const
{
    LogStreamProfile profile;
    profile.stream = {kXcrun, {QStringLiteral("simctl"), QStringLiteral("spawn"), m_simulator,
                               QStringLiteral("log"), QStringLiteral("stream"),
                               QStringLiteral("--style"), QStringLiteral("compact"),
                               QStringLiteral("--predicate"), logPredicate(m_appId)}};
    profile.flavor = LogFlavor::UnifiedLog;
    profile.bannerPrefix = QStringLiteral("Filtering the log data");
    // The predicate already narrows the stream to interesting subsystems.
    profile.prefiltered = true;
    return profile;
}

QString IosPlatform::oneShotLogs(int lines)
{
    Q_UNUSED(lines);
    const CommandResult shown = runCommand(
        {kXcrun, {QStringLiteral("simctl"), QStringLiteral("spawn"), m_simulator,
                  QStringLiteral("log"), QStringLiteral("show"), QStringLiteral("--style"),
                  QStringLiteral("compact"), QStringLiteral("--last"), QStringLiteral("30s")}},
        kLogShowTimeoutMs);
    if (!shown.succeeded()) {
        return QString();
    }
    return QString::fromUtf8(shown.standardOutput);
}

} // namespace tether
