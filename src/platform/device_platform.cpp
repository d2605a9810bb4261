#include "platform/device_platform.hpp"

#include "platform/android_platform.hpp"
#include "platform/ios_platform.hpp"

namespace tether {

std::unique_ptr<DevicePlatform> makePlatform(const TetherConfig &config)
{
    if (config.platform == PlatformKind::Ios) {
        return std::make_unique<IosPlatform>(config);
    }
    return std::make_unique<AndroidPlatform>(config);
}

std::unique_ptr<LogCollector> makeLogCollector(const DevicePlatform &platform,
                                               const TetherConfig &config)
{
    return std::make_unique<LogCollector>(platform.logStreamProfile(),
                                          config.appId,
                                          config.logMaxLines);
}

} // namespace tether
