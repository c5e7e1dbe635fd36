// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <detection/DetectionSource.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>

namespace bargein
{

/// @brief Thread-safe push-based DetectionSource.
///
/// Producers (a VAD callback, a speech engine binding, tests) call push() from
/// any thread; the barge-in monitor pulls with next(). push() never blocks the
/// producer beyond a short critical section.
class QueueDetectionSource: public DetectionSource
{
  public:
    [[nodiscard]] auto open() -> VoidResult override;
    [[nodiscard]] auto next(std::chrono::milliseconds timeout) -> Result<std::optional<DetectionEvent>> override;
    void close() override;

    /// @brief Enqueues an event. Events pushed while the source is closed are dropped.
    void push(DetectionEvent event);

    /// @brief Puts the source into a failed state; the next call to next() reports @p error.
    void fail(Error error);

    /// @brief Returns the number of buffered events.
    [[nodiscard]] auto pending() const -> std::size_t;

  private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<DetectionEvent> _queue;
    std::optional<Error> _failure;
    bool _open = false;
};

} // namespace bargein
