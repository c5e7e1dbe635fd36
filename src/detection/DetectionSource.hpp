// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <optional>

namespace bargein
{

using DetectionClock = std::chrono::steady_clock;

/// @brief A single "speech likely present" signal from the speech detector.
struct DetectionEvent
{
    DetectionClock::time_point timestamp = DetectionClock::now();
    bool speechPresent = false;

    /// @brief Detector confidence in [0, 1], if the detector provides one.
    std::optional<float> confidence;
};

/// @brief Lazy, unbounded stream of detection events consumed by the barge-in monitor.
///
/// The stream is restartable: open() begins a fresh consumption for a new
/// playback session and discards anything buffered before it.
class DetectionSource
{
  public:
    virtual ~DetectionSource() = default;

    /// @brief Starts (or restarts) consumption for a new session.
    [[nodiscard]] virtual auto open() -> VoidResult = 0;

    /// @brief Waits at most @p timeout for the next event.
    /// @return The event, std::nullopt if none arrived in time, or an error if the source failed.
    [[nodiscard]] virtual auto next(std::chrono::milliseconds timeout) -> Result<std::optional<DetectionEvent>> = 0;

    /// @brief Ends consumption for the current session.
    virtual void close() = 0;
};

} // namespace bargein
