#pragma once

#include <QFile>

#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

#include "observe/element_normalizer.hpp"
#include "platform/device_platform.hpp"

namespace tether::testing {

// Scripted DevicePlatform: serves a fixed raw tree, writes a fake PNG and
// records when each dump was taken.
class FakePlatform : public DevicePlatform
{
public:
    using Clock = std::chrono::steady_clock;

    PlatformKind kind() const override
    {
        return PlatformKind::Android;
    }

    QString deviceLabel() const override
    {
        return QStringLiteral("fake-device");
    }

    ProbeResult probe() override
    {
        ProbeResult result;
        result.available = available;
        result.message = available ? "yes" : "not running";
        return result;
    }

    bool screenshot(const QString &outputPath) override
    {
        if (!screenshotWorks) {
            return false;
        }
        QFile file(outputPath);
        if (!file.open(QIODevice::WriteOnly)) {
            return false;
        }
        file.write(QByteArray(2048, 'p'));
        return true;
    }

    QString dumpRawTree() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_dumpTimes.push_back(Clock::now());
        return rawTree;
    }

    std::vector<Element> parseTree(const QString &raw, bool assignRefs = true) const override
    {
        return m_normalizer.normalize(raw, assignRefs);
    }

    LogStreamProfile logStreamProfile() const override
    {
        return logProfile;
    }

    std::optional<ProcessCommand> eventStreamCommand() const override
    {
        return eventCommand;
    }

    QString oneShotLogs(int lines) override
    {
        Q_UNUSED(lines);
        return QString();
    }

    std::vector<Clock::time_point> dumpTimes() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dumpTimes;
    }

    bool available = true;
    bool screenshotWorks = true;
    QString rawTree;
    LogStreamProfile logProfile;
    std::optional<ProcessCommand> eventCommand;

private:
    UiAutomatorNormalizer m_normalizer;
    mutable std::mutex m_mutex;
    std::vector<Clock::time_point> m_dumpTimes;
};

inline ProcessCommand shellCommand(const QString &script)
{
    return ProcessCommand{QStringLiteral("/bin/sh"), {QStringLiteral("-c"), script}};
}

inline QString loginScreenXml()
{
    return QStringLiteral(
        "<?xml version='1.0' encoding='UTF-8' standalone='yes' ?>"
        "<hierarchy rotation=\"0\">"
        "<node class=\"android.widget.FrameLayout\" text=\"\" resource-id=\"\" "
        "content-desc=\"\" clickable=\"false\" bounds=\"[0,0][1080,1920]\">"
        "<node class=\"android.widget.TextView\" text=\"Welcome\" resource-id=\"\" "
        "content-desc=\"\" clickable=\"false\" bounds=\"[50,100][600,160]\" />"
        "<node class=\"android.widget.Button\" text=\"Login\" resource-id=\"\" "
        "content-desc=\"\" clickable=\"true\" bounds=\"[50,200][300,260]\" />"
        "</node>"
        "</hierarchy>");
}

inline QString settingsScreenXml()
{
    return QStringLiteral(
        "<hierarchy rotation=\"0\">"
        "<node class=\"android.widget.TextView\" text=\"Settings\" clickable=\"false\" "
        "bounds=\"[0,0][500,80]\" />"
        "<node class=\"android.view.View\" content-desc=\"settings-tab\" clickable=\"true\" "
        "selected=\"true\" bounds=\"[0,1800][270,1920]\" />"
        "</hierarchy>");
}

} // namespace tether::testing
