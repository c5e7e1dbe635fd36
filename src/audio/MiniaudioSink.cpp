// SPDX-License-Identifier: Apache-2.0
#include "MiniaudioSink.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <format>
#include <mutex>

namespace bargein
{

struct MiniaudioSink::Impl
{
    ma_device device {};
    bool initialized = false;
    unsigned sampleRate = 0;
    unsigned channels = 0;

    // Buffer state, shared with the device callback thread
    mutable std::mutex mutex;
    AudioSource source;
    std::size_t readPos = 0;
    bool active = false;

    [[nodiscard]] auto ensureDevice(unsigned rate, unsigned channelCount) -> VoidResult;
    void uninit();
};

namespace
{

    void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* impl = static_cast<MiniaudioSink::Impl*>(device->pUserData);
        auto* out = static_cast<float*>(output);
        auto const totalSamples = static_cast<std::size_t>(frameCount) * device->playback.channels;

        auto lock = std::lock_guard(impl->mutex);
        auto toCopy = std::size_t { 0 };

        if (impl->active && impl->source.samples)
        {
            auto const& samples = *impl->source.samples;
            toCopy = std::min(totalSamples, samples.size() - impl->readPos);
            std::copy_n(samples.data() + impl->readPos, toCopy, out);
            impl->readPos += toCopy;

            if (impl->readPos >= samples.size())
                impl->active = false;
        }

        // Zero-fill any remaining output frames
        if (toCopy < totalSamples)
            std::fill_n(out + toCopy, totalSamples - toCopy, 0.0f);
    }

} // namespace

auto MiniaudioSink::Impl::ensureDevice(unsigned rate, unsigned channelCount) -> VoidResult
{
    if (initialized && sampleRate == rate && channels == channelCount)
        return {};

    uninit();

    auto config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = channelCount;
    config.sampleRate = rate;
    config.dataCallback = playbackDataCallback;
    config.pUserData = this;

    auto const result = ma_device_init(nullptr, &config, &device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::SinkStartError,
                         std::format("Failed to initialize playback device: {}", static_cast<int>(result)));

    initialized = true;
    sampleRate = rate;
    channels = channelCount;
    log::info("Audio playback initialized ({}Hz, {} channel(s), f32)", rate, channelCount);
    return {};
}

void MiniaudioSink::Impl::uninit()
{
    if (!initialized)
        return;
    ma_device_uninit(&device);
    initialized = false;
}

MiniaudioSink::MiniaudioSink(): _impl(std::make_unique<Impl>())
{
}

MiniaudioSink::~MiniaudioSink()
{
    if (_impl->initialized)
        ma_device_stop(&_impl->device);
    _impl->uninit();
}

auto MiniaudioSink::start(AudioSource source) -> VoidResult
{
    if (!source.samples || source.channels == 0 || source.sampleRate == 0)
        return makeError(ErrorCode::SinkStartError, "Audio source is empty or has an invalid format");

    if (auto result = _impl->ensureDevice(source.sampleRate, source.channels); !result)
        return result;

    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->source = std::move(source);
        _impl->readPos = 0;
        _impl->active = !_impl->source.samples->empty();
    }

    if (ma_device_is_started(&_impl->device))
        return {};

    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->active = false;
        return makeError(ErrorCode::SinkStartError,
                         std::format("Failed to start playback: {}", static_cast<int>(result)));
    }

    return {};
}

auto MiniaudioSink::stop() -> VoidResult
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->active = false;
    }

    if (!_impl->initialized)
        return {};

    // ma_device_stop blocks until the callback has returned, so no samples are
    // written after this call.
    auto const result = ma_device_stop(&_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::SinkStopError,
                         std::format("Failed to stop playback: {}", static_cast<int>(result)));
    return {};
}

auto MiniaudioSink::isPlaying() const -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->active;
}

} // namespace bargein
