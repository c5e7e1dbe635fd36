// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <memory>
#include <span>
#include <string_view>

namespace bargein
{

/// @brief Sample rate used for microphone capture (Hz).
constexpr auto CaptureSampleRate = 16000u;

/// @brief Callback invoked from the capture device thread with audio chunks.
/// @param samples Float32 PCM samples at CaptureSampleRate, mono.
using CaptureCallback = std::function<void(std::span<const float> samples)>;

/// @brief Captures audio from the microphone using miniaudio.
///
/// Used as the input of the barge-in detection path: it runs for the whole
/// lifetime of the controller, independently of playback.
class AudioCapture
{
  public:
    AudioCapture();
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /// @brief Initializes the audio capture device.
    /// @param callback Called with audio chunks from the capture thread.
    /// @param deviceName Optional substring to match against capture device names (case-insensitive).
    ///                   If empty, the first non-monitor capture device is used.
    /// @return Success or an error.
    [[nodiscard]] auto initialize(CaptureCallback callback, std::string_view deviceName = {}) -> VoidResult;

    /// @brief Starts capturing audio.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops capturing audio.
    void stop();

    /// @brief Returns true if currently capturing.
    [[nodiscard]] auto isCapturing() const -> bool;

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace bargein
