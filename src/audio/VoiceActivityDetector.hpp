// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <span>

namespace bargein
{

/// @brief Energy-based voice activity detection.
///
/// Maps the RMS energy of a chunk to a speech probability in [0, 1]. The
/// result only feeds the barge-in confirmation policy; it is not meant to be
/// an accurate speech model.
class VoiceActivityDetector
{
  public:
    /// @param energyThreshold RMS energy that maps to a probability of 0.5.
    explicit VoiceActivityDetector(float energyThreshold = 0.01f);

    /// @brief Processes audio samples and returns the speech probability (0.0 to 1.0).
    [[nodiscard]] auto process(std::span<const float> samples) const -> float;

    /// @brief Returns true if @p probability is at or above @p threshold.
    [[nodiscard]] static auto isSpeech(float probability, float threshold = 0.5f) -> bool;

    [[nodiscard]] auto energyThreshold() const -> float { return _energyThreshold; }

  private:
    float _energyThreshold;
};

} // namespace bargein
