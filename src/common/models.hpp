#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace tether {

// One on-screen UI node after filtering. Optional strings are omitted from
// serialized output when empty; boolean flags are omitted when false, except
// `enabled`, which is only written when false.
struct Element {
    std::string ref;
    std::string type;
    std::string text;
    std::string name;
    std::string title;
    std::string id;
    std::string resourceId;
    std::string value;

    bool clickable = false;
    bool enabled = true;
    bool checked = false;
    bool selected = false;
    bool scrollable = false;

    std::string bounds;

    bool hasContent() const
    {
        return !text.empty() || !name.empty() || !id.empty()
            || !resourceId.empty() || !value.empty() || !title.empty();
    }

    bool isInteractive() const
    {
        return clickable || scrollable;
    }
};

struct LogEntry {
    std::string line;
    std::chrono::system_clock::time_point timestamp;
    LogSeverity severity = LogSeverity::Info;
};

struct ScreenSummary {
    std::string screenTitle;
    std::string selectedTab;
    int clickableCount = 0;
};

struct SnapshotFiles {
    std::string screen;
    std::string elements;
    std::string logcat;
};

struct SnapshotManifestEntry {
    int sequence = 0;
    std::chrono::system_clock::time_point timestamp;
    std::string trigger;
    int elementCount = -1;
    ScreenSummary summary;
    int logLineCount = 0;
    std::vector<std::string> crashLines;
    SnapshotFiles files;
};

struct ProbeResult {
    bool available = false;
    std::string message;
};

} // namespace tether
