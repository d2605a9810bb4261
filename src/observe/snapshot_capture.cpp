#include "observe/snapshot_capture.hpp"

#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <chrono>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "observe/log_collector.hpp"
#include "platform/device_platform.hpp"

namespace tether {

namespace {

const QString kPendingScreen = QStringLiteral(".pending-screen.png");

bool writeFileAtomically(const QString &path, const QByteArray &data)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

bool isTitleType(const std::string &type)
{
    return type == "TextView" || type == "StaticText";
}

bool looksLikeTitle(const std::string &text)
{
    if (text.size() < 2) {
        return false;
    }
    const QString value = QString::fromStdString(text);
    return !value.isEmpty() && value.at(0).isUpper();
}

} // namespace

bool isSettleTrigger(const std::string &trigger)
{
    return trigger == kTriggerInitial || trigger == kTriggerWindowState;
}

ScreenSummary summarizeScreen(const std::vector<Element> &elements)
{
    ScreenSummary summary;
    for (const auto &element : elements) {
        if (element.selected && element.type == "View") {
            summary.selectedTab = element.id;
        }
        if (summary.screenTitle.empty() && isTitleType(element.type)
            && looksLikeTitle(element.text)) {
            summary.screenTitle = element.text;
        }
        if (element.clickable) {
            ++summary.clickableCount;
        }
    }
    return summary;
}

std::string elementsFingerprint(const QByteArray &serializedElements)
{
    if (serializedElements.isEmpty()) {
        return std::string();
    }
    return QCryptographicHash::hash(serializedElements, QCryptographicHash::Sha256)
        .toHex()
        .toStdString();
}

SnapshotCapture::SnapshotCapture(DevicePlatform &platform,
                                 LogCollector *logs,
                                 CaptureTargets targets,
                                 OutputFormat format,
                                 std::ostream &out)
    : m_platform(platform)
    , m_logs(logs)
    , m_targets(std::move(targets))
    , m_format(format)
    , m_out(out)
{
}

bool SnapshotCapture::resetOutput()
{
    m_entries.clear();
    m_lastFingerprint.clear();

    QDir dir(m_targets.outputDir);
    if (dir.exists() && !dir.removeRecursively()) {
        qWarning().noquote() << "could not clear" << m_targets.outputDir;
        return false;
    }
    if (!QDir().mkpath(m_targets.outputDir)) {
        qWarning().noquote() << "could not create" << m_targets.outputDir;
        TLOG_ERROR(QStringLiteral("SnapshotCapture"),
                   QStringLiteral("resetOutput"),
                   QStringLiteral("output_dir_create_failed"),
                   QStringLiteral("watch_start"),
                   QStringLiteral("mkpath"),
                   tether::logging::defaultWho(),
                   tether::logging::currentCorrelationId(),
                   (nlohmann::json{{"dir", m_targets.outputDir.toStdString()}}));
        return false;
    }
    return true;
}

CaptureResult SnapshotCapture::capture(const std::string &trigger, int sequence)
{
    SnapshotManifestEntry entry;
    entry.sequence = sequence;
    entry.timestamp = std::chrono::system_clock::now();
    entry.trigger = trigger;

    const QDir outDir(m_targets.outputDir);
    const QString pendingScreen = outDir.filePath(kPendingScreen);
    QFile::remove(pendingScreen);
    const bool haveScreen = m_platform.screenshot(pendingScreen);
    if (!haveScreen) {
        qWarning().noquote() << "screenshot failed";
        TLOG_WARN(QStringLiteral("SnapshotCapture"),
                  QStringLiteral("capture"),
                  QStringLiteral("screenshot_failed"),
                  QStringLiteral("screenshot_provider"),
                  QStringLiteral("partial_snapshot"),
                  tether::logging::defaultWho(),
                  tether::logging::currentCorrelationId(),
                  (nlohmann::json{{"snapshot", sequence}, {"trigger", trigger}}));
    }

    std::vector<Element> elements;
    QByteArray elementsJson;
    const QString raw = m_platform.dumpRawTree();
    if (raw.isEmpty()) {
        qWarning().noquote() << "ui dump skipped";
    } else {
        elements = m_platform.parseTree(raw);
        entry.elementCount = static_cast<int>(elements.size());
        const OrderedJson payload = elements;
        elementsJson = QByteArray::fromStdString(payload.dump(2));
        if (!m_targets.latestElementsPath.isEmpty()
            && !writeFileAtomically(m_targets.latestElementsPath, elementsJson)) {
            qWarning().noquote() << "could not write" << m_targets.latestElementsPath;
        }
    }

    const std::string fingerprint = elementsFingerprint(elementsJson);
    if (!isSettleTrigger(trigger) && !fingerprint.empty()
        && fingerprint == m_lastFingerprint) {
        QFile::remove(pendingScreen);
        TLOG_DEBUG(QStringLiteral("SnapshotCapture"),
                   QStringLiteral("capture"),
                   QStringLiteral("snapshot_skipped_duplicate"),
                   QStringLiteral("fingerprint_match"),
                   QStringLiteral("sha256"),
                   tether::logging::defaultWho(),
                   tether::logging::currentCorrelationId(),
                   (nlohmann::json{{"snapshot", sequence}, {"trigger", trigger}}));
        return CaptureResult::SkippedDuplicate;
    }
    if (!fingerprint.empty()) {
        m_lastFingerprint = fingerprint;
    }

    entry.files.screen = sequencedPath(sequence, QStringLiteral("screen.png")).toStdString();
    entry.files.elements = sequencedPath(sequence, QStringLiteral("elements.json")).toStdString();

    if (haveScreen) {
        const QString screenPath = QString::fromStdString(entry.files.screen);
        QFile::remove(screenPath);
        if (!QFile::rename(pendingScreen, screenPath)) {
            qWarning().noquote() << "could not move screenshot to" << screenPath;
        }
    }
    if (!elementsJson.isEmpty()
        && !writeFileAtomically(QString::fromStdString(entry.files.elements), elementsJson)) {
        qWarning().noquote() << "could not write" << QString::fromStdString(entry.files.elements);
    }

    // Logs are drained only for persisted snapshots so skipped captures do
    // not lose lines; they roll into the next snapshot instead.
    std::vector<LogEntry> logEntries;
    if (m_logs) {
        logEntries = m_logs->drain();
    }
    entry.logLineCount = static_cast<int>(logEntries.size());
    for (const auto &logEntry : logEntries) {
        if (logEntry.severity == LogSeverity::Crash) {
            entry.crashLines.push_back(logEntry.line);
        }
    }
    if (!logEntries.empty()) {
        const QString logPath = sequencedPath(sequence, QStringLiteral("logcat.json"));
        const OrderedJson payload = logEntries;
        if (writeFileAtomically(logPath, QByteArray::fromStdString(payload.dump(2)))) {
            entry.files.logcat = logPath.toStdString();
        } else {
            qWarning().noquote() << "could not write" << logPath;
        }
    }

    entry.summary = summarizeScreen(elements);
    m_entries.push_back(entry);

    if (!writeManifest()) {
        qWarning().noquote() << "manifest write failed:" << m_targets.manifestPath;
        TLOG_ERROR(QStringLiteral("SnapshotCapture"),
                   QStringLiteral("capture"),
                   QStringLiteral("manifest_write_failed"),
                   QStringLiteral("save_file_commit"),
                   QStringLiteral("qsavefile"),
                   tether::logging::defaultWho(),
                   tether::logging::currentCorrelationId(),
                   (nlohmann::json{{"path", m_targets.manifestPath.toStdString()}}));
    }

    TLOG_INFO(QStringLiteral("SnapshotCapture"),
              QStringLiteral("capture"),
              QStringLiteral("snapshot_captured"),
              QStringLiteral("watch_trigger"),
              QStringLiteral("screenshot_dump_drain"),
              tether::logging::defaultWho(),
              tether::logging::currentCorrelationId(),
              (nlohmann::json{{"snapshot", sequence},
                              {"trigger", trigger},
                              {"elements", entry.elementCount},
                              {"logLines", entry.logLineCount},
                              {"crashes", entry.crashLines.size()}}));

    emitLine(entry);
    return CaptureResult::Captured;
}

const std::vector<SnapshotManifestEntry> &SnapshotCapture::entries() const
{
    return m_entries;
}

const CaptureTargets &SnapshotCapture::targets() const
{
    return m_targets;
}

QString SnapshotCapture::sequencedPath(int sequence, const QString &suffix) const
{
    return QDir(m_targets.outputDir)
        .filePath(QStringLiteral("%1-%2").arg(sequence, 3, 10, QLatin1Char('0')).arg(suffix));
}

bool SnapshotCapture::writeManifest() const
{
    const QFileInfo info(m_targets.manifestPath);
    if (!QDir().mkpath(info.absolutePath())) {
        return false;
    }
    // QSaveFile writes a sibling temp file and renames it over the manifest,
    // so readers only ever see a complete document.
    const OrderedJson manifest = m_entries;
    return writeFileAtomically(m_targets.manifestPath,
                               QByteArray::fromStdString(manifest.dump(2)));
}

void SnapshotCapture::emitLine(const SnapshotManifestEntry &entry) const
{
    if (m_format == OutputFormat::Json) {
        const OrderedJson line = entry;
        m_out << line.dump() << std::endl;
        return;
    }

    m_out << "[" << toClockString(entry.timestamp) << "] #" << entry.sequence
          << " (" << entry.trigger << ") " << entry.elementCount << " elements";
    if (!entry.summary.selectedTab.empty()) {
        m_out << " [" << entry.summary.selectedTab << "]";
    }
    if (!entry.summary.screenTitle.empty()) {
        m_out << " " << entry.summary.screenTitle;
    }
    m_out << std::endl;
}

} // namespace tether
