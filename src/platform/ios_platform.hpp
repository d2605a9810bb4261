#pragma once

#include "observe/element_normalizer.hpp"
#include "platform/device_platform.hpp"

namespace tether {

// iOS simulator reached through xcrun simctl and the AXe accessibility tool.
// There is no UI event stream, so watch falls back to polling.
class IosPlatform : public DevicePlatform
{
public:
    explicit IosPlatform(const TetherConfig &config);

    PlatformKind kind() const override;
    QString deviceLabel() const override;

    ProbeResult probe() override;
    bool screenshot(const QString &outputPath) override;
    QString dumpRawTree() override;
    std::vector<Element> parseTree(const QString &rawTree,
                                   bool assignRefs = true) const override;

    LogStreamProfile logStreamProfile() const override;
    QString oneShotLogs(int lines) override;

private:
    // AXe needs a concrete UDID; resolves "booted" through simctl.
    QString resolveUdid() const;

    QString m_simulator;
    QString m_appId;
    int m_screenshotTimeoutMs;
    AxTreeNormalizer m_normalizer;
};

} // namespace tether
