// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <memory>
#include <vector>

namespace bargein
{

/// @brief Raw float32 PCM audio to be played back during one session.
///
/// Samples are interleaved when channels > 1. The buffer is shared so that a
/// sink can keep reading it from its device callback while the caller moves on.
struct AudioSource
{
    std::shared_ptr<const std::vector<float>> samples;
    unsigned sampleRate = 22050;
    unsigned channels = 1;

    /// @brief Returns the number of frames in the source.
    [[nodiscard]] auto frames() const -> std::size_t
    {
        return samples && channels > 0 ? samples->size() / channels : 0;
    }

    /// @brief Returns the playback duration of the source.
    [[nodiscard]] auto duration() const -> std::chrono::milliseconds
    {
        if (sampleRate == 0)
            return std::chrono::milliseconds { 0 };
        return std::chrono::milliseconds { frames() * 1000 / sampleRate };
    }
};

/// @brief Creates an AudioSource taking ownership of the given samples.
[[nodiscard]] inline auto makeAudioSource(std::vector<float> samples, unsigned sampleRate, unsigned channels)
    -> AudioSource
{
    return AudioSource {
        .samples = std::make_shared<const std::vector<float>>(std::move(samples)),
        .sampleRate = sampleRate,
        .channels = channels,
    };
}

/// @brief Audio output device as seen by the playback driver.
///
/// A sink is owned and driven by exactly one PlaybackDriver. start() must not
/// block for the duration of playback; completion is observed by polling
/// isPlaying(), which has no push-based signal.
class AudioSink
{
  public:
    virtual ~AudioSink() = default;

    /// @brief Begins streaming the given source to the device.
    /// @return Success, or an error (reported as SinkStartError by the driver).
    [[nodiscard]] virtual auto start(AudioSource source) -> VoidResult = 0;

    /// @brief Halts playback immediately, discarding any unplayed samples.
    /// @return Success, or an error (logged and recorded, never propagated).
    [[nodiscard]] virtual auto stop() -> VoidResult = 0;

    /// @brief Returns true while the device still has samples of the current source to play.
    [[nodiscard]] virtual auto isPlaying() const -> bool = 0;
};

} // namespace bargein
