#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

#include <QString>

#include "common/process_utils.hpp"

namespace tether {

/**
 * StreamingProcess runs one long-lived subprocess and tails its stdout.
 *
 * A dedicated reader thread owns the QProcess for its whole lifetime: it spawns
 * it, blocks on output, hands every complete line to the line handler and
 * finally terminates it (graceful, then forced). The handler is invoked on the
 * reader thread, so it must only touch state the caller synchronizes.
 */
class StreamingProcess
{
public:
    using LineHandler = std::function<void(const QString &line)>;

    StreamingProcess() = default;
    ~StreamingProcess();

    StreamingProcess(const StreamingProcess &) = delete;
    StreamingProcess &operator=(const StreamingProcess &) = delete;

    // Blocks until the subprocess has started or failed to start.
    // Returns false (and leaves the object stopped) on spawn failure.
    bool start(const ProcessCommand &command, LineHandler handler);

    // Idempotent. Terminates the subprocess and joins the reader thread.
    void stop();

    // False once the subprocess has exited on its own or stop() was called.
    bool isRunning() const;

private:
    void readerLoop(ProcessCommand command, LineHandler handler,
                    std::promise<bool> *started);

    mutable std::mutex m_lifecycleMutex;
    std::thread m_reader;
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_running{false};
};

} // namespace tether
