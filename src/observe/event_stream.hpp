#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include <QString>

#include "common/process_utils.hpp"
#include "common/streaming_process.hpp"

namespace tether {

// Recognized UI change event in one line of event-stream output, if any.
// Window state changes win over content changes when both appear.
std::optional<std::string> parseEventLine(const QString &line);

/**
 * Tails a UI event stream and remembers the most recent recognized event
 * and when it arrived. The watch loop polls takeSettledEvent() to decide
 * when the screen has been quiet for long enough to capture.
 */
class EventStreamReader
{
public:
    using Clock = std::chrono::steady_clock;

    explicit EventStreamReader(ProcessCommand command);
    ~EventStreamReader();

    EventStreamReader(const EventStreamReader &) = delete;
    EventStreamReader &operator=(const EventStreamReader &) = delete;

    // Spawns the stream and forgets any event seen by a previous connection.
    bool start();
    void stop();
    // False once the stream exited on its own or was stopped.
    bool isConnected() const;

    // Returns and clears the pending event once no newer event has arrived
    // for at least `debounce`. Check and clear happen under one lock.
    std::optional<std::string> takeSettledEvent(std::chrono::milliseconds debounce);

    void recordLine(const QString &line);

private:
    ProcessCommand m_command;

    mutable std::mutex m_mutex;
    std::optional<std::string> m_pendingEvent;
    Clock::time_point m_lastEventAt;

    // Last member: its reader thread writes to the state above.
    StreamingProcess m_process;
};

} // namespace tether
