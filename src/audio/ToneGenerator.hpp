// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSink.hpp>

#include <chrono>

namespace bargein
{

/// @brief Parameters of a generated sine tone.
struct ToneSpec
{
    float frequency = 440.0f;
    float amplitude = 0.2f;
    std::chrono::milliseconds duration { 3000 };
    unsigned sampleRate = 22050;
    unsigned channels = 1;

    /// @brief Linear fade-in/out length, avoids clicks at the edges.
    std::chrono::milliseconds fade { 20 };
};

/// @brief Generates a sine tone as a playable AudioSource.
[[nodiscard]] auto generateTone(const ToneSpec& spec) -> AudioSource;

} // namespace bargein
