#include "common/config.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <algorithm>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace tether {

namespace {

constexpr double kMaxSeconds = 3600.0;
constexpr int kMaxRetriesLimit = 1000;
constexpr int kMaxLogLinesLimit = 100000;

QString jsonString(const nlohmann::json &obj, const char *key, const QString &fallback)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return fallback;
    }
    return QString::fromStdString(it->get<std::string>());
}

double jsonNumber(const nlohmann::json &obj, const char *key, double fallback)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<double>();
}

// Clamped before any narrowing so oversized values cannot overflow.
double jsonSeconds(const nlohmann::json &obj, const char *key, double fallback)
{
    return std::clamp(jsonNumber(obj, key, fallback), 0.0, kMaxSeconds);
}

int jsonInt(const nlohmann::json &obj, const char *key, int fallback, int low, int high)
{
    const double value = jsonNumber(obj, key, fallback);
    return static_cast<int>(std::clamp(value, static_cast<double>(low), static_cast<double>(high)));
}

// A list present in the file replaces the built-in list entirely.
void applyList(const nlohmann::json &obj, const char *key, QSet<QString> &target)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) {
        return;
    }
    QSet<QString> values;
    for (const auto &item : *it) {
        if (item.is_string()) {
            values.insert(QString::fromStdString(item.get<std::string>()));
        }
    }
    target = values;
}

void applyConfigFile(const QString &path, TetherConfig &config)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return;
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &error) {
        TLOG_WARN(QStringLiteral("Config"),
                  QStringLiteral("applyConfigFile"),
                  QStringLiteral("config_parse_failed"),
                  QStringLiteral("invalid_json"),
                  QStringLiteral("keep_defaults"),
                  tether::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", path.toStdString()},
                                  {"error", error.what()}}));
        return;
    }
    if (!data.is_object()) {
        return;
    }
    config.sourcePath = path;

    if (data.contains("platform") && data.at("platform").is_string()) {
        config.platform = data.at("platform").get<std::string>() == "ios"
            ? PlatformKind::Ios
            : PlatformKind::Android;
    }
    config.avd = jsonString(data, "avd", config.avd);
    config.appId = jsonString(data, "appId", config.appId);
    config.simulator = jsonString(data, "simulator", config.simulator);

    if (data.contains("timeouts") && data.at("timeouts").is_object()) {
        const auto &timeouts = data.at("timeouts");
        config.timeoutScreenshotSeconds = jsonInt(
            timeouts, "screenshot", config.timeoutScreenshotSeconds, 1, static_cast<int>(kMaxSeconds));
    }

    if (data.contains("watch") && data.at("watch").is_object()) {
        const auto &watch = data.at("watch");
        config.watch.debounceSeconds =
            jsonSeconds(watch, "debounce", config.watch.debounceSeconds);
        config.watch.maxRetries =
            jsonInt(watch, "maxRetries", config.watch.maxRetries, 1, kMaxRetriesLimit);
        config.watch.retryDelaySeconds =
            jsonSeconds(watch, "retryDelay", config.watch.retryDelaySeconds);
        config.watch.pollFloorSeconds =
            jsonSeconds(watch, "pollFloor", config.watch.pollFloorSeconds);
        config.watch.outputDir = jsonString(watch, "outputDir", config.watch.outputDir);
        config.watch.manifestPath = jsonString(watch, "manifest", config.watch.manifestPath);
    }

    if (data.contains("logs") && data.at("logs").is_object()) {
        config.logMaxLines =
            jsonInt(data.at("logs"), "maxLines", config.logMaxLines, 1, kMaxLogLinesLimit);
    }

    if (data.contains("filters") && data.at("filters").is_object()) {
        const auto &filters = data.at("filters");
        applyList(filters, "noiseClasses", config.androidFilters.noiseTypes);
        applyList(filters, "systemResourceIds", config.androidFilters.reservedIds);
        applyList(filters, "iosNoiseRoles", config.iosFilters.noiseTypes);
        applyList(filters, "iosReservedIds", config.iosFilters.reservedIds);
    }
}

} // namespace

QString WatchSettings::latestElementsPath() const
{
    return QFileInfo(manifestPath).dir().filePath(QStringLiteral("latest-elements.json"));
}

std::optional<QString> findConfigFile(const QString &startDir)
{
    QDir dir(startDir);
    while (true) {
        const QString candidate = dir.absoluteFilePath(QStringLiteral("tether.json"));
        if (QFileInfo(candidate).isFile()) {
            return candidate;
        }
        if (!dir.cdUp()) {
            return std::nullopt;
        }
    }
}

TetherConfig loadConfig(const QString &startDir)
{
    TetherConfig config;

    if (const auto path = findConfigFile(startDir)) {
        applyConfigFile(*path, config);
    }

    const QString envPlatform = qEnvironmentVariable("TETHER_PLATFORM");
    if (!envPlatform.isEmpty()) {
        config.platform = envPlatform == QStringLiteral("ios")
            ? PlatformKind::Ios
            : PlatformKind::Android;
    }
    const QString envAvd = qEnvironmentVariable("TETHER_AVD");
    if (!envAvd.isEmpty()) {
        config.avd = envAvd;
    }
    const QString envSimulator = qEnvironmentVariable("TETHER_SIMULATOR");
    if (!envSimulator.isEmpty()) {
        config.simulator = envSimulator;
    }
    const QString envAppId = qEnvironmentVariable("TETHER_APP_ID");
    if (!envAppId.isEmpty()) {
        config.appId = envAppId;
    }
    return config;
}

} // namespace tether
