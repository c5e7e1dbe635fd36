// SPDX-License-Identifier: Apache-2.0
#include "PlaybackController.hpp"

#include <core/Log.hpp>

namespace bargein
{

PlaybackController::PlaybackController(AudioSink& sink,
                                       DetectionSource& detectionSource,
                                       std::unique_ptr<ConfirmationPolicy> policy,
                                       ControllerConfig config):
    _config(config),
    _policy(policy ? std::move(policy) : std::make_unique<ConsecutiveConfirmationPolicy>()),
    _driver(sink, DriverConfig { .pollInterval = config.pollInterval }),
    _monitor(detectionSource, *_policy, MonitorConfig { .pollInterval = config.monitorPollInterval })
{
}

PlaybackController::~PlaybackController()
{
    shutdown();
}

auto PlaybackController::beginPlayback(AudioSource source, PlaybackOptions options) -> Result<SessionHandle>
{
    auto lock = std::lock_guard(_mutex);

    if (_shutdown)
        return makeError(ErrorCode::InvalidArgument, "Playback controller is shut down");

    if (options.preemptActive)
    {
        if (auto previous = _state.current(); previous && previous->snapshot().isPlaying)
        {
            log::info("Stopping session {} before new playback", previous->id());
            previous->requestStop(false);
            [[maybe_unused]] auto const finished = previous->waitUntilFinished();
        }
    }

    auto session = _state.beginSession();
    if (!session)
    {
        log::warning("Cannot begin playback: {}", session.error().message);
        return std::unexpected(session.error());
    }

    // The previous session has finished, so both loops exit within one step.
    _monitor.cancel();
    _monitor.join();
    _driver.join();

    log::info("Session {}: starting playback ({} ms of audio)", (*session)->id(), source.duration().count());

    if (auto result = _driver.start(*session, std::move(source)); !result)
        return std::unexpected(result.error());

    if (options.bargeInEnabled.value_or(_config.bargeInEnabled))
    {
        // A missing detection source leaves the session playing, just uninterruptible.
        [[maybe_unused]] auto const monitorStarted = _monitor.start(*session);
    }
    else
    {
        log::debug("Session {}: barge-in disabled", (*session)->id());
    }

    return SessionHandle(std::move(*session));
}

auto PlaybackController::requestInterrupt(const SessionHandle& handle) -> bool
{
    if (!handle._session->requestStop(false))
        return false;

    log::info("Session {}: playback cancelled", handle.id());
    return true;
}

auto PlaybackController::waitForCompletion(const SessionHandle& handle) const -> PlaybackResult
{
    return toResult(handle._session->waitUntilFinished());
}

auto PlaybackController::waitForCompletionFor(const SessionHandle& handle, std::chrono::milliseconds timeout) const
    -> std::optional<PlaybackResult>
{
    auto snapshot = handle._session->waitUntilFinishedFor(timeout);
    if (!snapshot)
        return std::nullopt;
    return toResult(*snapshot);
}

auto PlaybackController::cancelMonitor(const SessionHandle& handle) -> bool
{
    if (!_monitor.cancel(handle.id()))
        return false;

    log::debug("Session {}: barge-in monitor cancelled", handle.id());
    return true;
}

auto PlaybackController::isPlaying() const -> bool
{
    auto const session = _state.current();
    return session && session->snapshot().isPlaying;
}

auto PlaybackController::currentSession() const -> std::optional<SessionSnapshot>
{
    if (auto const session = _state.current())
        return session->snapshot();
    return std::nullopt;
}

void PlaybackController::shutdown()
{
    auto lock = std::lock_guard(_mutex);
    if (_shutdown)
        return;
    _shutdown = true;

    if (auto session = _state.current(); session && session->requestStop(false))
        log::info("Session {}: cancelled by shutdown", session->id());

    _monitor.cancel();
    _monitor.join();
    _driver.join();
}

auto PlaybackController::toResult(const SessionSnapshot& snapshot) -> PlaybackResult
{
    return PlaybackResult {
        .sessionId = snapshot.id,
        .outcome = snapshot.outcome(),
        .error = snapshot.error,
    };
}

} // namespace bargein
