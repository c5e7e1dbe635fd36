// SPDX-License-Identifier: Apache-2.0
#include "QueueDetectionSource.hpp"

namespace bargein
{

auto QueueDetectionSource::open() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    _queue.clear();
    _failure.reset();
    _open = true;
    return {};
}

auto QueueDetectionSource::next(std::chrono::milliseconds timeout) -> Result<std::optional<DetectionEvent>>
{
    auto lock = std::unique_lock(_mutex);
    _cv.wait_for(lock, timeout, [this] { return !_queue.empty() || _failure || !_open; });

    if (!_queue.empty())
    {
        auto event = _queue.front();
        _queue.pop_front();
        return event;
    }

    if (_failure)
        return std::unexpected(*_failure);

    if (!_open)
        return makeError(ErrorCode::DetectionSourceError, "Detection source is closed");

    return std::nullopt;
}

void QueueDetectionSource::close()
{
    {
        auto lock = std::lock_guard(_mutex);
        _open = false;
        _queue.clear();
    }
    _cv.notify_all();
}

void QueueDetectionSource::push(DetectionEvent event)
{
    {
        auto lock = std::lock_guard(_mutex);
        if (!_open)
            return;
        _queue.push_back(event);
    }
    _cv.notify_one();
}

void QueueDetectionSource::fail(Error error)
{
    {
        auto lock = std::lock_guard(_mutex);
        _failure = std::move(error);
    }
    _cv.notify_all();
}

auto QueueDetectionSource::pending() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _queue.size();
}

} // namespace bargein
