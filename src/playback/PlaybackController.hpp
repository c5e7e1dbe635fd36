// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSink.hpp>
#include <core/Error.hpp>
#include <detection/ConfirmationPolicy.hpp>
#include <detection/DetectionSource.hpp>
#include <playback/BargeInMonitor.hpp>
#include <playback/PlaybackDriver.hpp>
#include <playback/PlaybackSession.hpp>
#include <playback/PlaybackState.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

namespace bargein
{

/// @brief Configuration for the playback controller.
struct ControllerConfig
{
    /// @brief Poll interval of the playback driver (bounds natural-end detection).
    std::chrono::milliseconds pollInterval { 10 };

    /// @brief Poll interval of the barge-in monitor (at most 10 ms).
    std::chrono::milliseconds monitorPollInterval { 10 };

    /// @brief Default for PlaybackOptions::bargeInEnabled.
    bool bargeInEnabled = true;
};

/// @brief Per-playback options.
struct PlaybackOptions
{
    /// @brief Whether the barge-in monitor runs for this playback (defaults to the controller config).
    std::optional<bool> bargeInEnabled;

    /// @brief If a session is still playing, cancel it and wait for it instead of failing with AlreadyPlaying.
    bool preemptActive = false;
};

/// @brief Caller-side reference to a playback session.
///
/// Keeps the session alive, so waiting on a handle is valid even after a newer
/// session has begun.
class SessionHandle
{
  public:
    [[nodiscard]] auto id() const -> SessionId { return _session->id(); }

    /// @brief Returns a copy of the session's current state.
    [[nodiscard]] auto snapshot() const -> SessionSnapshot { return _session->snapshot(); }

  private:
    friend class PlaybackController;

    explicit SessionHandle(std::shared_ptr<PlaybackSession> session): _session(std::move(session)) {}

    std::shared_ptr<PlaybackSession> _session;
};

/// @brief Result reported to completion waiters.
struct PlaybackResult
{
    SessionId sessionId = 0;
    PlaybackOutcome outcome = PlaybackOutcome::Completed;

    /// @brief Sink failure recorded for diagnostics; never raised to the waiter.
    std::optional<Error> error;
};

/// @brief Coordinates audio playback with concurrent barge-in detection.
///
/// Explicitly constructed and passed around; there is no global instance. The
/// sink and detection source are external collaborators that must outlive the
/// controller. At most one session plays at a time.
class PlaybackController
{
  public:
    PlaybackController(AudioSink& sink,
                       DetectionSource& detectionSource,
                       std::unique_ptr<ConfirmationPolicy> policy,
                       ControllerConfig config = {});
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    /// @brief Begins playing @p source and, unless disabled, starts the barge-in monitor.
    /// @return A handle to the new session, or AlreadyPlaying / SinkStartError.
    [[nodiscard]] auto beginPlayback(AudioSource source, PlaybackOptions options = {}) -> Result<SessionHandle>;

    /// @brief Programmatically cancels the session (not logged as a user interruption).
    /// @return True if the request changed the session state.
    auto requestInterrupt(const SessionHandle& handle) -> bool;

    /// @brief Blocks until the session has finished and reports how it ended.
    ///
    /// Returns immediately if the session already finished.
    [[nodiscard]] auto waitForCompletion(const SessionHandle& handle) const -> PlaybackResult;

    /// @brief Like waitForCompletion(), giving up after @p timeout.
    /// @return The result, or std::nullopt if the session is still playing.
    [[nodiscard]] auto waitForCompletionFor(const SessionHandle& handle, std::chrono::milliseconds timeout) const
        -> std::optional<PlaybackResult>;

    /// @brief Cooperatively stops the barge-in monitor of the session behind @p handle.
    ///
    /// Has no effect once a newer session owns the monitor.
    /// @return True if the monitor was asked to stop.
    auto cancelMonitor(const SessionHandle& handle) -> bool;

    /// @brief Returns true while a session is playing.
    [[nodiscard]] auto isPlaying() const -> bool;

    /// @brief Returns a snapshot of the most recent session, if any was begun.
    [[nodiscard]] auto currentSession() const -> std::optional<SessionSnapshot>;

    /// @brief Returns the driver's state for the most recent session.
    [[nodiscard]] auto driverState() const -> DriverState { return _driver.state(); }

    /// @brief Returns true while the barge-in monitor is consuming events.
    [[nodiscard]] auto monitorRunning() const -> bool { return _monitor.running(); }

    /// @brief Cancels any active session and joins the driver and monitor threads.
    void shutdown();

  private:
    [[nodiscard]] static auto toResult(const SessionSnapshot& snapshot) -> PlaybackResult;

    ControllerConfig _config;
    std::unique_ptr<ConfirmationPolicy> _policy;
    PlaybackState _state;
    PlaybackDriver _driver;
    BargeInMonitor _monitor;

    std::mutex _mutex; // serializes beginPlayback() and shutdown()
    bool _shutdown = false;
};

} // namespace bargein
