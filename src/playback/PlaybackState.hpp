// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <playback/PlaybackSession.hpp>

#include <memory>
#include <mutex>

namespace bargein
{

/// @brief Owns the current PlaybackSession and hands out new ones.
///
/// Sessions never overlap: a new one can only begin once the current one has
/// finished. Older sessions stay alive for as long as someone holds them.
class PlaybackState
{
  public:
    /// @brief Begins a new session {isPlaying=true, stopRequested=false, bargeInConfirmed=false}.
    /// @return The new session, or AlreadyPlaying if the current session is still playing.
    [[nodiscard]] auto beginSession() -> Result<std::shared_ptr<PlaybackSession>>;

    /// @brief Returns the most recent session, or nullptr if none was started yet.
    [[nodiscard]] auto current() const -> std::shared_ptr<PlaybackSession>;

  private:
    mutable std::mutex _mutex;
    std::shared_ptr<PlaybackSession> _current;
    SessionId _nextId = 1;
};

} // namespace bargein
