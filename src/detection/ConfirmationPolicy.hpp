// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <detection/DetectionSource.hpp>

#include <chrono>

namespace bargein
{

/// @brief Decides when a run of detection events amounts to a confirmed barge-in.
///
/// A policy instance is used by one monitor at a time and is reset at the
/// start of every playback session. observe() returns true exactly once per
/// session, for the event that confirmed the barge-in.
class ConfirmationPolicy
{
  public:
    virtual ~ConfirmationPolicy() = default;

    /// @brief Clears all counters for a new session that started at @p sessionStart.
    virtual void reset(DetectionClock::time_point sessionStart) = 0;

    /// @brief Feeds one event into the policy.
    /// @return True if this event confirmed the barge-in.
    [[nodiscard]] virtual auto observe(const DetectionEvent& event) -> bool = 0;

    /// @brief Returns true once the policy has fired for the current session.
    [[nodiscard]] virtual auto confirmed() const -> bool = 0;
};

/// @brief Parameters of ConsecutiveConfirmationPolicy.
struct ConsecutivePolicyConfig
{
    /// @brief Number of consecutive positive events required to confirm.
    int threshold = 3;

    /// @brief Minimum confidence for an event to count as positive (ignored if the event has none).
    float minConfidence = 0.5f;

    /// @brief If true a negative event decrements the run by one, otherwise it resets the run.
    bool decayOnNegative = true;

    /// @brief Events within this window after the session start are ignored.
    ///
    /// Masks the onset of the agent's own speech leaking into the microphone.
    std::chrono::milliseconds startupGrace { 150 };
};

/// @brief Confirms a barge-in after N consecutive positive detections.
class ConsecutiveConfirmationPolicy final: public ConfirmationPolicy
{
  public:
    explicit ConsecutiveConfirmationPolicy(ConsecutivePolicyConfig config = {});

    void reset(DetectionClock::time_point sessionStart) override;
    [[nodiscard]] auto observe(const DetectionEvent& event) -> bool override;
    [[nodiscard]] auto confirmed() const -> bool override { return _confirmed; }

    /// @brief Current length of the positive run.
    [[nodiscard]] auto count() const -> int { return _count; }

    [[nodiscard]] auto config() const -> const ConsecutivePolicyConfig& { return _config; }

  private:
    [[nodiscard]] auto isPositive(const DetectionEvent& event) const -> bool;

    ConsecutivePolicyConfig _config;
    DetectionClock::time_point _sessionStart {};
    int _count = 0;
    bool _confirmed = false;
};

} // namespace bargein
