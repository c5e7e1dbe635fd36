// SPDX-License-Identifier: Apache-2.0
#include "PlaybackSession.hpp"

namespace bargein
{

PlaybackSession::PlaybackSession(SessionId id): _id(id), _startedAt(SessionClock::now())
{
}

auto PlaybackSession::requestStop(bool dueToBargeIn) -> bool
{
    {
        auto lock = std::lock_guard(_mutex);
        if (!_isPlaying)
            return false;

        auto const changed = !_stopRequested || (dueToBargeIn && !_bargeInConfirmed);
        if (!changed)
            return false;

        if (!_stopRequested)
            _stopRequestedAt = SessionClock::now();
        _stopRequested = true;
        _bargeInConfirmed = _bargeInConfirmed || dueToBargeIn;
    }

    _cv.notify_all();
    return true;
}

auto PlaybackSession::markFinished(std::optional<Error> error) -> bool
{
    {
        auto lock = std::lock_guard(_mutex);
        if (!_isPlaying)
            return false;

        _isPlaying = false;
        _error = std::move(error);
    }

    _cv.notify_all();
    return true;
}

auto PlaybackSession::snapshot() const -> SessionSnapshot
{
    auto lock = std::lock_guard(_mutex);
    return snapshotLocked();
}

auto PlaybackSession::waitForStopRequest(std::chrono::milliseconds timeout) const -> SessionSnapshot
{
    auto lock = std::unique_lock(_mutex);
    _cv.wait_for(lock, timeout, [this] { return _stopRequested || !_isPlaying; });
    return snapshotLocked();
}

auto PlaybackSession::waitUntilFinished() const -> SessionSnapshot
{
    auto lock = std::unique_lock(_mutex);
    _cv.wait(lock, [this] { return !_isPlaying; });
    return snapshotLocked();
}

auto PlaybackSession::waitUntilFinishedFor(std::chrono::milliseconds timeout) const
    -> std::optional<SessionSnapshot>
{
    auto lock = std::unique_lock(_mutex);
    if (!_cv.wait_for(lock, timeout, [this] { return !_isPlaying; }))
        return std::nullopt;
    return snapshotLocked();
}

auto PlaybackSession::snapshotLocked() const -> SessionSnapshot
{
    return SessionSnapshot {
        .id = _id,
        .isPlaying = _isPlaying,
        .stopRequested = _stopRequested,
        .bargeInConfirmed = _bargeInConfirmed,
        .error = _error,
        .stopRequestedAt = _stopRequestedAt,
    };
}

} // namespace bargein
