#pragma once

#include <atomic>
#include <memory>

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace tether {

class DevicePlatform;

class TetherCli
{
public:
    // interrupted is raised by the SIGINT/SIGTERM handler; long-running
    // commands poll it and wind down their subprocesses.
    TetherCli(TetherConfig config, const std::atomic<bool> &interrupted);
    ~TetherCli();

    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runStatus();
    int runScreen(const QStringList &args);
    int runElements(const QStringList &args);
    int runInspect();
    int runLogcat(const QStringList &args);
    int runWatch(const QStringList &args);

    // Prints the standard message and returns false when no device is up.
    bool requireDevice();

    TetherConfig m_config;
    const std::atomic<bool> &m_interrupted;
    std::unique_ptr<DevicePlatform> m_platform;
};

} // namespace tether
