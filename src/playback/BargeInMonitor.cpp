// SPDX-License-Identifier: Apache-2.0
#include "BargeInMonitor.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <exception>
#include <format>

namespace bargein
{

BargeInMonitor::BargeInMonitor(DetectionSource& source, ConfirmationPolicy& policy, MonitorConfig config):
    _source(source), _policy(policy), _config(config)
{
    _config.pollInterval =
        std::clamp(_config.pollInterval, std::chrono::milliseconds { 1 }, MaxMonitorPollInterval);
}

BargeInMonitor::~BargeInMonitor()
{
    cancel();
    join();
}

auto BargeInMonitor::start(std::shared_ptr<PlaybackSession> session) -> VoidResult
{
    auto openResult = VoidResult {};
    try
    {
        openResult = _source.open();
    }
    catch (const std::exception& e)
    {
        openResult = makeError(ErrorCode::DetectionSourceError, e.what());
    }

    if (!openResult)
    {
        log::warning("Session {}: detection source unavailable, barge-in disabled: {}",
                     session->id(),
                     openResult.error().message);
        return std::unexpected(Error { ErrorCode::DetectionSourceError, openResult.error().message });
    }

    _policy.reset(session->startedAt());
    _running = true;

    auto lock = std::lock_guard(_workerMutex);
    _sessionId = session->id();
    _worker = std::jthread([this, session = std::move(session)](const std::stop_token& token) {
        run(token, session);
    });
    return {};
}

void BargeInMonitor::cancel()
{
    auto lock = std::lock_guard(_workerMutex);
    if (_worker.joinable())
        _worker.request_stop();
}

auto BargeInMonitor::cancel(SessionId sessionId) -> bool
{
    auto lock = std::lock_guard(_workerMutex);
    if (!_worker.joinable() || _sessionId != sessionId)
        return false;
    return _worker.request_stop();
}

void BargeInMonitor::join()
{
    // The worker never takes _workerMutex, so joining under it cannot deadlock.
    auto lock = std::lock_guard(_workerMutex);
    if (_worker.joinable())
        _worker.join();
}

auto BargeInMonitor::pollSource() -> Result<std::optional<DetectionEvent>>
{
    try
    {
        return _source.next(_config.pollInterval);
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::DetectionSourceError, std::format("Detection source threw: {}", e.what()));
    }
}

void BargeInMonitor::run(const std::stop_token& stopToken, const std::shared_ptr<PlaybackSession>& session)
{
    log::debug("Session {}: barge-in monitor active", session->id());

    auto events = 0;
    while (!stopToken.stop_requested())
    {
        auto const snapshot = session->snapshot();
        if (!snapshot.isPlaying || snapshot.stopRequested)
            break;

        auto event = pollSource();
        if (!event)
        {
            log::warning("Session {}: detection source failed, playback continues uninterruptible: {}",
                         session->id(),
                         event.error());
            break;
        }

        if (!*event)
            continue;

        ++events;
        auto confirmed = false;
        try
        {
            confirmed = _policy.observe(**event);
        }
        catch (const std::exception& e)
        {
            log::warning("Session {}: confirmation policy threw, playback continues uninterruptible: {}",
                         session->id(),
                         e.what());
            break;
        }
        if (!confirmed)
            continue;

        // Only lands in shared state; the driver is woken and stops the sink on its own thread.
        if (session->requestStop(true))
            log::info("Session {}: user interruption confirmed after {} detection event(s)", session->id(), events);
        break;
    }

    try
    {
        _source.close();
    }
    catch (const std::exception& e)
    {
        log::warning("Session {}: closing the detection source failed: {}", session->id(), e.what());
    }
    _running = false;
    log::debug("Session {}: barge-in monitor stopped", session->id());
}

} // namespace bargein
