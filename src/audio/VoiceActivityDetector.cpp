// SPDX-License-Identifier: Apache-2.0
#include "VoiceActivityDetector.hpp"

#include <algorithm>
#include <cmath>

namespace bargein
{

VoiceActivityDetector::VoiceActivityDetector(float energyThreshold):
    _energyThreshold(energyThreshold > 0.0f ? energyThreshold : 0.01f)
{
}

auto VoiceActivityDetector::process(std::span<const float> samples) const -> float
{
    if (samples.empty())
        return 0.0f;

    auto energy = 0.0f;
    for (auto const sample: samples)
        energy += sample * sample;
    energy = std::sqrt(energy / static_cast<float>(samples.size()));

    return std::min(1.0f, energy / (_energyThreshold * 2.0f));
}

auto VoiceActivityDetector::isSpeech(float probability, float threshold) -> bool
{
    return probability >= threshold;
}

} // namespace bargein
