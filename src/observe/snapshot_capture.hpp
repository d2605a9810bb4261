#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <QByteArray>
#include <QString>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace tether {

class DevicePlatform;
class LogCollector;

inline constexpr char kTriggerInitial[] = "INITIAL";
inline constexpr char kTriggerPoll[] = "POLL";
inline constexpr char kTriggerWindowState[] = "TYPE_WINDOW_STATE_CHANGED";
inline constexpr char kTriggerWindowContent[] = "TYPE_WINDOW_CONTENT_CHANGED";

enum class CaptureResult {
    Captured,
    SkippedDuplicate
};

// Settle triggers mark a real screen transition and are never deduplicated.
bool isSettleTrigger(const std::string &trigger);

ScreenSummary summarizeScreen(const std::vector<Element> &elements);

// sha256 of the serialized element list; empty string when there is nothing
// to compare (a failed dump), which never matches.
std::string elementsFingerprint(const QByteArray &serializedElements);

struct CaptureTargets {
    QString outputDir;
    QString manifestPath;
    // Rolling copy of the newest element list, rewritten on every capture.
    QString latestElementsPath;
};

/**
 * One observation of the device: screenshot, element dump and drained logs,
 * persisted under a sequence number and recorded in the session manifest.
 *
 * The manifest entries and last fingerprint belong to the capturing thread;
 * the object is not meant to be shared.
 */
class SnapshotCapture
{
public:
    SnapshotCapture(DevicePlatform &platform,
                    LogCollector *logs,
                    CaptureTargets targets,
                    OutputFormat format,
                    std::ostream &out);

    // Removes any previous session output and recreates the directory.
    bool resetOutput();

    CaptureResult capture(const std::string &trigger, int sequence);

    const std::vector<SnapshotManifestEntry> &entries() const;
    const CaptureTargets &targets() const;

private:
    QString sequencedPath(int sequence, const QString &suffix) const;
    bool writeManifest() const;
    void emitLine(const SnapshotManifestEntry &entry) const;

    DevicePlatform &m_platform;
    LogCollector *m_logs;
    CaptureTargets m_targets;
    OutputFormat m_format;
    std::ostream &m_out;

    std::vector<SnapshotManifestEntry> m_entries;
    std::string m_lastFingerprint;
};

} // namespace tether
