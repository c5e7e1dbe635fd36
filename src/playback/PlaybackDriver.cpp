// SPDX-License-Identifier: Apache-2.0
#include "PlaybackDriver.hpp"

#include <core/Log.hpp>

#include <exception>
#include <format>

namespace bargein
{

namespace
{
    auto elapsedMs(SessionClock::time_point since) -> long long
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(SessionClock::now() - since).count();
    }
} // namespace

PlaybackDriver::PlaybackDriver(AudioSink& sink, DriverConfig config): _sink(sink), _config(config)
{
    if (_config.pollInterval <= std::chrono::milliseconds::zero())
        _config.pollInterval = std::chrono::milliseconds { 1 };
}

PlaybackDriver::~PlaybackDriver()
{
    // A session still playing at teardown is cancelled, not waited out.
    _worker.request_stop();
    join();
}

auto PlaybackDriver::start(std::shared_ptr<PlaybackSession> session, AudioSource source) -> VoidResult
{
    transition(DriverState::Starting);

    auto startResult = VoidResult {};
    try
    {
        startResult = _sink.start(std::move(source));
    }
    catch (const std::exception& e)
    {
        startResult = makeError(ErrorCode::SinkStartError, std::format("Sink threw on start: {}", e.what()));
    }

    if (!startResult)
    {
        auto error = Error { ErrorCode::SinkStartError, startResult.error().message };
        log::error("Session {}: failed to start playback: {}", session->id(), error.message);
        finish(*session, error);
        return std::unexpected(std::move(error));
    }

    transition(DriverState::Playing);
    _worker = std::jthread([this, session = std::move(session)](const std::stop_token& token) {
        run(token, session);
    });
    return {};
}

void PlaybackDriver::join()
{
    if (_worker.joinable())
        _worker.join();
}

void PlaybackDriver::run(const std::stop_token& stopToken, const std::shared_ptr<PlaybackSession>& session)
{
    auto error = std::optional<Error> {};
    auto stopRequested = false;

    try
    {
        while (true)
        {
            // Woken immediately by requestStop(); otherwise re-checks the sink each interval.
            auto const snapshot = session->waitForStopRequest(_config.pollInterval);
            if (snapshot.stopRequested)
            {
                stopRequested = true;
                break;
            }

            if (stopToken.stop_requested())
            {
                session->requestStop(false);
                stopRequested = true;
                break;
            }

            if (!_sink.isPlaying())
                break;
        }
    }
    catch (const std::exception& e)
    {
        log::error("Session {}: sink status query failed: {}", session->id(), e.what());
        error = Error { ErrorCode::AudioError, std::format("Sink status query failed: {}", e.what()) };
    }

    transition(DriverState::Stopping);

    if (stopRequested)
    {
        if (auto stopError = stopSink())
            error = std::move(stopError);

        if (auto const requestedAt = session->snapshot().stopRequestedAt)
            log::debug("Session {}: sink stopped {} ms after stop request", session->id(), elapsedMs(*requestedAt));
    }

    finish(*session, std::move(error));
}

auto PlaybackDriver::stopSink() -> std::optional<Error>
{
    try
    {
        auto result = _sink.stop();
        if (result)
            return std::nullopt;
        log::warning("Sink stop failed: {}", result.error().message);
        return Error { ErrorCode::SinkStopError, result.error().message };
    }
    catch (const std::exception& e)
    {
        log::warning("Sink threw on stop: {}", e.what());
        return Error { ErrorCode::SinkStopError, e.what() };
    }
}

void PlaybackDriver::finish(PlaybackSession& session, std::optional<Error> error)
{
    transition(DriverState::Finished);

    if (!session.markFinished(std::move(error)))
        return;

    auto const snapshot = session.snapshot();
    if (snapshot.error)
        log::info("Session {} finished ({}, {}) after {} ms",
                  snapshot.id,
                  outcomeName(snapshot.outcome()),
                  *snapshot.error,
                  elapsedMs(session.startedAt()));
    else
        log::info("Session {} finished ({}) after {} ms",
                  snapshot.id,
                  outcomeName(snapshot.outcome()),
                  elapsedMs(session.startedAt()));
}

void PlaybackDriver::transition(DriverState next)
{
    auto const previous = _state.exchange(next);
    log::trace("Driver: {} -> {}", driverStateName(previous), driverStateName(next));
}

} // namespace bargein
