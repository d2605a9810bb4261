#pragma once

#include <QString>

#include "common/enums.hpp"

namespace tether {

class SeverityClassifier
{
public:
    // Crash beats error beats info. Matching is case-insensitive.
    static LogSeverity classify(const QString &line, LogFlavor flavor);
};

// Decides which lines of a log stream are worth buffering at all.
class LogInterestFilter
{
public:
    // A prefiltered stream was already narrowed by the producer (for example
    // a log predicate); every line except the banner is of interest.
    LogInterestFilter(LogFlavor flavor, QString appId, bool prefiltered = false);

    bool matches(const QString &line) const;

private:
    LogFlavor m_flavor;
    QString m_appId;
    bool m_prefiltered;
};

} // namespace tether
