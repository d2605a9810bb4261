#pragma once

namespace tether {

enum class PlatformKind {
    Android,
    Ios
};

enum class LogSeverity {
    Info,
    Error,
    Crash
};

// Which OS log dialect a line comes from. Severity patterns differ per dialect.
enum class LogFlavor {
    Logcat,
    UnifiedLog
};

enum class OutputFormat {
    Human,
    Json
};

} // namespace tether
