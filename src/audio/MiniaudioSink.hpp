// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSink.hpp>

#include <memory>

namespace bargein
{

/// @brief Plays raw PCM audio through the default playback device using miniaudio.
///
/// Uses PIMPL to isolate miniaudio headers from consumers. Unlike a blocking
/// player, start() returns as soon as the device runs; the device callback
/// drains the source and isPlaying() turns false once every sample was consumed.
/// The device is (re)initialized lazily whenever the source format changes.
class MiniaudioSink final: public AudioSink
{
  public:
    MiniaudioSink();
    ~MiniaudioSink() override;

    MiniaudioSink(const MiniaudioSink&) = delete;
    MiniaudioSink& operator=(const MiniaudioSink&) = delete;

    [[nodiscard]] auto start(AudioSource source) -> VoidResult override;
    [[nodiscard]] auto stop() -> VoidResult override;
    [[nodiscard]] auto isPlaying() const -> bool override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace bargein
