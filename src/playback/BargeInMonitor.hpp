// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <detection/ConfirmationPolicy.hpp>
#include <detection/DetectionSource.hpp>
#include <playback/PlaybackSession.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace bargein
{

/// @brief Configuration for the barge-in monitor.
struct MonitorConfig
{
    /// @brief Longest time the monitor waits for a detection event before
    ///        re-checking the session. Clamped to MaxMonitorPollInterval.
    std::chrono::milliseconds pollInterval { 10 };
};

constexpr auto MaxMonitorPollInterval = std::chrono::milliseconds { 10 };

/// @brief Watches the detection stream during playback and requests a stop on confirmed barge-in.
///
/// Runs on its own thread for exactly one session. It never touches the audio
/// sink: confirmation only lands in the shared session state, which the
/// playback driver is waiting on.
class BargeInMonitor
{
  public:
    BargeInMonitor(DetectionSource& source, ConfirmationPolicy& policy, MonitorConfig config = {});
    ~BargeInMonitor();

    BargeInMonitor(const BargeInMonitor&) = delete;
    BargeInMonitor& operator=(const BargeInMonitor&) = delete;

    /// @brief Opens the detection source for @p session and starts monitoring.
    ///
    /// The source is opened and the policy reset on the calling thread, so any
    /// event pushed after start() returns belongs to this session.
    /// The previous session's monitor must have been joined.
    /// @return Success, or the DetectionSourceError from opening the source.
    [[nodiscard]] auto start(std::shared_ptr<PlaybackSession> session) -> VoidResult;

    /// @brief Asks the monitor to exit at its next step. Does not block.
    void cancel();

    /// @brief Like cancel(), but only if the monitor is watching session @p sessionId.
    /// @return True if this call requested the stop.
    auto cancel(SessionId sessionId) -> bool;

    /// @brief Blocks until the monitor thread has exited.
    void join();

    /// @brief Returns true while the monitor thread is consuming events.
    [[nodiscard]] auto running() const noexcept -> bool { return _running.load(); }

  private:
    void run(const std::stop_token& stopToken, const std::shared_ptr<PlaybackSession>& session);
    [[nodiscard]] auto pollSource() -> Result<std::optional<DetectionEvent>>;

    DetectionSource& _source;
    ConfirmationPolicy& _policy;
    MonitorConfig _config;
    std::atomic<bool> _running { false };

    std::mutex _workerMutex; // guards _worker and _sessionId across caller threads
    std::optional<SessionId> _sessionId;
    std::jthread _worker;
};

} // namespace bargein
