// SPDX-License-Identifier: Apache-2.0
#include "PlaybackState.hpp"

#include <format>

namespace bargein
{

auto PlaybackState::beginSession() -> Result<std::shared_ptr<PlaybackSession>>
{
    auto lock = std::lock_guard(_mutex);

    if (_current && _current->snapshot().isPlaying)
        return makeError(ErrorCode::AlreadyPlaying,
                         std::format("Session {} is still playing", _current->id()));

    _current = std::make_shared<PlaybackSession>(_nextId++);
    return _current;
}

auto PlaybackState::current() const -> std::shared_ptr<PlaybackSession>
{
    auto lock = std::lock_guard(_mutex);
    return _current;
}

} // namespace bargein
