// SPDX-License-Identifier: Apache-2.0
#include "ToneGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

namespace bargein
{

auto generateTone(const ToneSpec& spec) -> AudioSource
{
    auto const frames = static_cast<std::size_t>(spec.duration.count()) * spec.sampleRate / 1000;
    auto const fadeFrames = std::min(frames / 2, static_cast<std::size_t>(spec.fade.count()) * spec.sampleRate / 1000);
    auto const step = 2.0 * std::numbers::pi * spec.frequency / spec.sampleRate;

    auto samples = std::vector<float>(frames * spec.channels);
    for (auto frame = std::size_t { 0 }; frame < frames; ++frame)
    {
        auto gain = 1.0f;
        if (fadeFrames > 0)
        {
            auto const edge = std::min(frame, frames - 1 - frame);
            if (edge < fadeFrames)
                gain = static_cast<float>(edge) / static_cast<float>(fadeFrames);
        }

        auto const value = spec.amplitude * gain * static_cast<float>(std::sin(step * static_cast<double>(frame)));
        std::fill_n(samples.begin() + static_cast<std::ptrdiff_t>(frame * spec.channels), spec.channels, value);
    }

    return makeAudioSource(std::move(samples), spec.sampleRate, spec.channels);
}

} // namespace bargein
