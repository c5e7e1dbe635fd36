// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

namespace bargein
{

using SessionId = std::uint64_t;
using SessionClock = std::chrono::steady_clock;

/// @brief How a playback session ended, as reported to waiters.
enum class PlaybackOutcome : std::uint8_t
{
    /// The sink drained the audio source without any stop request.
    Completed,
    /// The barge-in monitor confirmed that the user started speaking.
    Interrupted,
    /// Playback was stopped programmatically, not by the user.
    Cancelled,
};

[[nodiscard]] constexpr auto outcomeName(PlaybackOutcome outcome) -> std::string_view
{
    switch (outcome)
    {
        case PlaybackOutcome::Completed: return "completed";
        case PlaybackOutcome::Interrupted: return "interrupted";
        case PlaybackOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

/// @brief Immutable copy of a session's state, taken under the state lock.
struct SessionSnapshot
{
    SessionId id = 0;
    bool isPlaying = false;
    bool stopRequested = false;
    bool bargeInConfirmed = false;

    /// @brief Sink failure recorded when the session finished, for diagnostics.
    std::optional<Error> error;

    /// @brief Time of the first stop request, if any.
    std::optional<SessionClock::time_point> stopRequestedAt;

    /// @brief Derives the waiter-facing outcome. Only meaningful once !isPlaying.
    [[nodiscard]] auto outcome() const -> PlaybackOutcome
    {
        if (bargeInConfirmed)
            return PlaybackOutcome::Interrupted;
        if (stopRequested)
            return PlaybackOutcome::Cancelled;
        return PlaybackOutcome::Completed;
    }
};

/// @brief Shared state of one synthesis-and-playback cycle.
///
/// All fields are guarded by a single mutex (the state lock); every mutation
/// notifies the companion condition variable, which is what the playback
/// driver's poll wait and completion waiters block on.
///
/// Invariants:
///  - bargeInConfirmed implies stopRequested.
///  - stopRequested and bargeInConfirmed only ever go false -> true.
///  - isPlaying starts true and, once false, stays false. A new cycle is a new
///    PlaybackSession instance.
///
/// Write ownership: only the playback driver calls markFinished(); the
/// barge-in monitor and programmatic callers only call requestStop().
class PlaybackSession
{
  public:
    explicit PlaybackSession(SessionId id);

    PlaybackSession(const PlaybackSession&) = delete;
    PlaybackSession& operator=(const PlaybackSession&) = delete;

    [[nodiscard]] auto id() const noexcept -> SessionId { return _id; }
    [[nodiscard]] auto startedAt() const noexcept -> SessionClock::time_point { return _startedAt; }

    /// @brief Requests playback to stop.
    ///
    /// Sets stopRequested, and bargeInConfirmed if @p dueToBargeIn. Never
    /// blocks beyond the state lock and never fails; requests against a
    /// finished session are ignored.
    /// @return True if this call changed the state.
    auto requestStop(bool dueToBargeIn) -> bool;

    /// @brief Marks playback as finished and wakes all waiters.
    /// @param error Sink failure to record for diagnostics, if any.
    /// @return True on the first call, false if the session was already finished.
    auto markFinished(std::optional<Error> error = std::nullopt) -> bool;

    /// @brief Returns a copy of the current state.
    [[nodiscard]] auto snapshot() const -> SessionSnapshot;

    /// @brief Blocks up to @p timeout until a stop is requested or the session finishes.
    /// @return The snapshot observed on wake-up.
    [[nodiscard]] auto waitForStopRequest(std::chrono::milliseconds timeout) const -> SessionSnapshot;

    /// @brief Blocks until the session has finished. Returns immediately if it already has.
    [[nodiscard]] auto waitUntilFinished() const -> SessionSnapshot;

    /// @brief Like waitUntilFinished(), giving up after @p timeout.
    /// @return The final snapshot, or std::nullopt on timeout.
    [[nodiscard]] auto waitUntilFinishedFor(std::chrono::milliseconds timeout) const
        -> std::optional<SessionSnapshot>;

  private:
    [[nodiscard]] auto snapshotLocked() const -> SessionSnapshot;

    SessionId const _id;
    SessionClock::time_point const _startedAt;

    mutable std::mutex _mutex;
    mutable std::condition_variable _cv;
    bool _isPlaying = true;
    bool _stopRequested = false;
    bool _bargeInConfirmed = false;
    std::optional<Error> _error;
    std::optional<SessionClock::time_point> _stopRequestedAt;
};

} // namespace bargein
