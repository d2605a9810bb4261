#pragma once

#include <optional>

#include <QString>

#include "common/enums.hpp"
#include "observe/element_filters.hpp"

namespace tether {

struct WatchSettings {
    double debounceSeconds = 1.0;
    int maxRetries = 3;
    double retryDelaySeconds = 2.0;
    double pollFloorSeconds = 2.0;
    QString outputDir = QStringLiteral("/tmp/tether-watch");
    QString manifestPath = QStringLiteral("/tmp/tether-watch.json");

    // latest-elements.json, next to the manifest.
    QString latestElementsPath() const;
};

struct TetherConfig {
    PlatformKind platform = PlatformKind::Android;
    QString avd = QStringLiteral("Pixel_XL_API_29");
    QString appId;
    QString simulator;

    int timeoutScreenshotSeconds = 10;

    WatchSettings watch;
    int logMaxLines = 200;

    ElementFilters androidFilters = ElementFilters::androidDefaults();
    ElementFilters iosFilters = ElementFilters::iosDefaults();

    // tether.json that contributed to this config, empty when none was found.
    QString sourcePath;

    // Simulator UDID or name, falling back to whatever simctl considers booted.
    QString simulatorTarget() const
    {
        return simulator.isEmpty() ? QStringLiteral("booted") : simulator;
    }
};

// Walk up from startDir looking for tether.json.
std::optional<QString> findConfigFile(const QString &startDir);

// Priority: environment > tether.json > built-in defaults.
TetherConfig loadConfig(const QString &startDir);

} // namespace tether
