#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace tether::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking the events of one watch session.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Tags events on this thread with the watch snapshot being captured.
// Zero means no snapshot and omits the field.
int currentSnapshot();

class SnapshotScope {
public:
    explicit SnapshotScope(int sequence);
    ~SnapshotScope();

private:
    int m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();
QString logsDirPath();

} // namespace tether::logging

#define TLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::tether::logging::logEvent(::tether::logging::LogLevel::Debug, \
                                ::tether::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::tether::logging::logEvent(::tether::logging::LogLevel::Info, \
                                ::tether::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::tether::logging::logEvent(::tether::logging::LogLevel::Warn, \
                                ::tether::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::tether::logging::logEvent(::tether::logging::LogLevel::Error, \
                                ::tether::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
