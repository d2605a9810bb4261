#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tether {

// Output documents keep insertion order so identical element sets always
// serialize (and therefore fingerprint) identically.
using OrderedJson = nlohmann::ordered_json;

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

// Local wall-clock HH:MM:SS, used for streaming watch lines.
inline std::string toClockString(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%H:%M:%S");
    return out.str();
}

inline std::string toSeverityString(LogSeverity severity)
{
    switch (severity) {
    case LogSeverity::Info:
        return "info";
    case LogSeverity::Error:
        return "error";
    case LogSeverity::Crash:
        return "crash";
    }
    return "info";
}

inline LogSeverity parseSeverityString(const std::string &value)
{
    if (value == "crash") {
        return LogSeverity::Crash;
    }
    if (value == "error") {
        return LogSeverity::Error;
    }
    return LogSeverity::Info;
}

inline std::string toPlatformString(PlatformKind kind)
{
    switch (kind) {
    case PlatformKind::Android:
        return "android";
    case PlatformKind::Ios:
        return "ios";
    }
    return "android";
}

inline PlatformKind parsePlatformString(const std::string &value)
{
    if (value == "ios") {
        return PlatformKind::Ios;
    }
    return PlatformKind::Android;
}

inline void to_json(OrderedJson &j, const Element &element)
{
    j = OrderedJson::object();
    if (!element.ref.empty()) {
        j["ref"] = element.ref;
    }
    if (!element.type.empty()) {
        j["type"] = element.type;
    }
    if (!element.name.empty()) {
        j["name"] = element.name;
    }
    if (!element.text.empty()) {
        j["text"] = element.text;
    }
    if (!element.title.empty()) {
        j["title"] = element.title;
    }
    if (!element.id.empty()) {
        j["id"] = element.id;
    }
    if (!element.resourceId.empty()) {
        j["resourceId"] = element.resourceId;
    }
    if (!element.value.empty()) {
        j["value"] = element.value;
    }
    if (element.clickable) {
        j["clickable"] = true;
    }
    if (!element.enabled) {
        j["enabled"] = false;
    }
    if (element.checked) {
        j["checked"] = true;
    }
    if (element.selected) {
        j["selected"] = true;
    }
    if (element.scrollable) {
        j["scrollable"] = true;
    }
    if (!element.bounds.empty()) {
        j["bounds"] = element.bounds;
    }
}

inline void from_json(const OrderedJson &j, Element &element)
{
    element = Element{};
    if (!j.is_object()) {
        return;
    }
    element.ref = j.value("ref", "");
    element.type = j.value("type", "");
    element.name = j.value("name", "");
    element.text = j.value("text", "");
    element.title = j.value("title", "");
    element.id = j.value("id", "");
    element.resourceId = j.value("resourceId", "");
    element.value = j.value("value", "");
    element.clickable = j.value("clickable", false);
    element.enabled = j.value("enabled", true);
    element.checked = j.value("checked", false);
    element.selected = j.value("selected", false);
    element.scrollable = j.value("scrollable", false);
    element.bounds = j.value("bounds", "");
}

inline void to_json(OrderedJson &j, const LogEntry &entry)
{
    j = OrderedJson{
        {"line", entry.line},
        {"ts", toIso8601Utc(entry.timestamp)},
        {"severity", toSeverityString(entry.severity)}
    };
}

inline void from_json(const OrderedJson &j, LogEntry &entry)
{
    entry.line = j.value("line", "");
    entry.timestamp = fromIso8601Utc(j.value("ts", ""));
    entry.severity = parseSeverityString(j.value("severity", "info"));
}

inline void to_json(OrderedJson &j, const SnapshotManifestEntry &entry)
{
    j = OrderedJson{
        {"snapshot", entry.sequence},
        {"timestamp", toIso8601Utc(entry.timestamp)},
        {"event_type", entry.trigger},
        {"elements_count", entry.elementCount},
        {"screen_title", entry.summary.screenTitle},
        {"selected_tab", entry.summary.selectedTab},
        {"clickable_count", entry.summary.clickableCount},
        {"log_lines", entry.logLineCount}
    };
    if (!entry.crashLines.empty()) {
        j["crashes"] = entry.crashLines;
    }

    OrderedJson files = OrderedJson{
        {"screen", entry.files.screen},
        {"elements", entry.files.elements}
    };
    if (!entry.files.logcat.empty()) {
        files["logcat"] = entry.files.logcat;
    }
    j["files"] = std::move(files);
}

inline void from_json(const OrderedJson &j, SnapshotManifestEntry &entry)
{
    entry.sequence = j.value("snapshot", 0);
    entry.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    entry.trigger = j.value("event_type", "");
    entry.elementCount = j.value("elements_count", -1);
    entry.summary.screenTitle = j.value("screen_title", "");
    entry.summary.selectedTab = j.value("selected_tab", "");
    entry.summary.clickableCount = j.value("clickable_count", 0);
    entry.logLineCount = j.value("log_lines", 0);
    if (j.contains("crashes") && j.at("crashes").is_array()) {
        entry.crashLines = j.at("crashes").get<std::vector<std::string>>();
    } else {
        entry.crashLines.clear();
    }
    if (j.contains("files") && j.at("files").is_object()) {
        const auto &files = j.at("files");
        entry.files.screen = files.value("screen", "");
        entry.files.elements = files.value("elements", "");
        entry.files.logcat = files.value("logcat", "");
    } else {
        entry.files = SnapshotFiles{};
    }
}

} // namespace tether
