#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <QString>

#include "common/config.hpp"
#include "common/models.hpp"
#include "common/process_utils.hpp"
#include "observe/log_collector.hpp"

namespace tether {

/**
 * Everything the observer needs from one mobile OS: availability, a
 * screenshot, the raw accessibility dump and how to read it, and the live
 * log / UI-event streams. Watch and capture code depends only on this
 * interface.
 */
class DevicePlatform
{
public:
    virtual ~DevicePlatform() = default;

    virtual PlatformKind kind() const = 0;
    // AVD name or simulator identifier, for status output.
    virtual QString deviceLabel() const = 0;

    virtual ProbeResult probe() = 0;
    // Writes an image to outputPath. Returns false if nothing usable was captured.
    virtual bool screenshot(const QString &outputPath) = 0;
    // Raw tree text, empty on failure.
    virtual QString dumpRawTree() = 0;
    virtual std::vector<Element> parseTree(const QString &rawTree,
                                           bool assignRefs = true) const = 0;

    virtual LogStreamProfile logStreamProfile() const = 0;
    // Command printing one line per UI change event, or nullopt when the
    // platform has no such stream and watch must poll.
    virtual std::optional<ProcessCommand> eventStreamCommand() const
    {
        return std::nullopt;
    }
    // Recent log output captured in one shot, empty on failure.
    virtual QString oneShotLogs(int lines) = 0;
};

std::unique_ptr<DevicePlatform> makePlatform(const TetherConfig &config);

// Collector for the platform's log stream, configured from tether.json.
std::unique_ptr<LogCollector> makeLogCollector(const DevicePlatform &platform,
                                               const TetherConfig &config);

} // namespace tether
