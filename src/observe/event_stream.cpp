#include "observe/event_stream.hpp"

#include <utility>

#include "observe/snapshot_capture.hpp"

namespace tether {

std::optional<std::string> parseEventLine(const QString &line)
{
    for (const char *eventType : {kTriggerWindowState, kTriggerWindowContent}) {
        if (line.contains(QLatin1String(eventType))) {
            return std::string(eventType);
        }
    }
    return std::nullopt;
}

EventStreamReader::EventStreamReader(ProcessCommand command)
    : m_command(std::move(command))
{
}

EventStreamReader::~EventStreamReader()
{
    stop();
}

bool EventStreamReader::start()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pendingEvent.reset();
    }
    return m_process.start(m_command, [this](const QString &line) {
        recordLine(line);
    });
}

void EventStreamReader::stop()
{
    m_process.stop();
}

bool EventStreamReader::isConnected() const
{
    return m_process.isRunning();
}

std::optional<std::string> EventStreamReader::takeSettledEvent(std::chrono::milliseconds debounce)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_pendingEvent || Clock::now() - m_lastEventAt < debounce) {
        return std::nullopt;
    }
    std::optional<std::string> settled = std::move(m_pendingEvent);
    m_pendingEvent.reset();
    return settled;
}

void EventStreamReader::recordLine(const QString &line)
{
    std::optional<std::string> eventType = parseEventLine(line);
    if (!eventType) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pendingEvent = std::move(eventType);
    m_lastEventAt = Clock::now();
}

} // namespace tether
