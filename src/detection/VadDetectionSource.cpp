// SPDX-License-Identifier: Apache-2.0
#include "VadDetectionSource.hpp"

#include <audio/AudioCapture.hpp>
#include <audio/VoiceActivityDetector.hpp>
#include <core/Log.hpp>
#include <detection/QueueDetectionSource.hpp>

namespace bargein
{

struct VadDetectionSource::Impl
{
    VadSourceConfig config;
    AudioCapture capture;
    VoiceActivityDetector vad;
    QueueDetectionSource queue;
    bool initialized = false;

    void handleAudioData(std::span<const float> samples)
    {
        auto const probability = vad.process(samples);
        queue.push(DetectionEvent {
            .timestamp = DetectionClock::now(),
            .speechPresent = VoiceActivityDetector::isSpeech(probability, config.vadThreshold),
            .confidence = probability,
        });
    }
};

VadDetectionSource::VadDetectionSource(): _impl(std::make_unique<Impl>())
{
}

VadDetectionSource::~VadDetectionSource()
{
    _impl->capture.stop();
}

auto VadDetectionSource::initialize(const VadSourceConfig& config) -> VoidResult
{
    _impl->config = config;
    _impl->vad = VoiceActivityDetector(config.energyThreshold);

    auto result = _impl->capture.initialize(
        [this](std::span<const float> samples) { _impl->handleAudioData(samples); }, config.deviceName);
    if (!result)
        return makeError(ErrorCode::DetectionSourceError, result.error().message);

    _impl->initialized = true;
    log::info("VAD detection source initialized (threshold: {}, energy: {})",
              config.vadThreshold,
              _impl->vad.energyThreshold());
    return {};
}

auto VadDetectionSource::open() -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::DetectionSourceError, "VAD detection source not initialized");

    if (!_impl->capture.isCapturing())
    {
        if (auto result = _impl->capture.start(); !result)
            return makeError(ErrorCode::DetectionSourceError, result.error().message);
        log::info("Microphone capture started for barge-in detection");
    }

    return _impl->queue.open();
}

auto VadDetectionSource::next(std::chrono::milliseconds timeout) -> Result<std::optional<DetectionEvent>>
{
    return _impl->queue.next(timeout);
}

void VadDetectionSource::close()
{
    _impl->queue.close();
}

} // namespace bargein
