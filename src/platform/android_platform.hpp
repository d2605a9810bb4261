#pragma once

#include "observe/element_normalizer.hpp"
#include "platform/device_platform.hpp"

namespace tether {

// Android emulator or device reached through adb and uiautomator.
class AndroidPlatform : public DevicePlatform
{
public:
    explicit AndroidPlatform(const TetherConfig &config);

    PlatformKind kind() const override;
    QString deviceLabel() const override;

    ProbeResult probe() override;
    bool screenshot(const QString &outputPath) override;
    QString dumpRawTree() override;
    std::vector<Element> parseTree(const QString &rawTree,
                                   bool assignRefs = true) const override;

    LogStreamProfile logStreamProfile() const override;
    std::optional<ProcessCommand> eventStreamCommand() const override;
    QString oneShotLogs(int lines) override;

private:
    QString m_avd;
    int m_screenshotTimeoutMs;
    UiAutomatorNormalizer m_normalizer;
};

} // namespace tether
