// SPDX-License-Identifier: Apache-2.0

#include "AudioCapture.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <optional>
#include <string>

namespace bargein
{

struct AudioCapture::Impl
{
    ma_context context {};
    ma_device device {};
    CaptureCallback callback;
    bool contextInitialized = false;
    bool initialized = false;
    std::atomic<bool> capturing { false };
};

namespace
{

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(device->pUserData);
        if (impl && impl->callback && input)
            impl->callback(std::span<const float>(static_cast<const float*>(input), frameCount));
    }

    auto toLower(std::string_view text) -> std::string
    {
        auto s = std::string(text);
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    /// @brief Picks a capture device: the first name containing @p filter, else the first non-monitor device.
    auto selectCaptureDevice(std::span<const ma_device_info> devices, std::string_view filter)
        -> std::optional<ma_device_id>
    {
        log::debug("Available capture devices:");
        for (auto const& info: devices)
            log::debug("  {}", info.name);

        if (!filter.empty())
        {
            auto const lowerFilter = toLower(filter);
            for (auto const& info: devices)
            {
                if (toLower(info.name).find(lowerFilter) != std::string::npos)
                {
                    log::info("Matched capture device '{}' for filter '{}'", info.name, filter);
                    return info.id;
                }
            }
            log::warning("No capture device matching '{}' found, falling back to auto-select", filter);
        }

        // Monitors are loopback sources; listening to them would hear our own playback.
        for (auto const& info: devices)
        {
            if (!toLower(info.name).starts_with("monitor"))
                return info.id;
        }

        return std::nullopt;
    }

} // namespace

AudioCapture::AudioCapture(): _impl(std::make_unique<Impl>())
{
}

AudioCapture::~AudioCapture()
{
    stop();
    if (_impl->initialized)
        ma_device_uninit(&_impl->device);
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto AudioCapture::initialize(CaptureCallback callback, std::string_view deviceName) -> VoidResult
{
    _impl->callback = std::move(callback);

    // The context must outlive the device
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    ma_device_info* captureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult =
        ma_context_get_devices(&_impl->context, nullptr, nullptr, &captureDevices, &captureCount);

    auto selectedDevice = std::optional<ma_device_id> {};
    if (enumResult == MA_SUCCESS)
        selectedDevice = selectCaptureDevice(std::span(captureDevices, captureCount), deviceName);
    else
        log::warning("Failed to enumerate capture devices (code: {}), using default",
                     static_cast<int>(enumResult));

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = CaptureSampleRate;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.pUserData = _impl.get();

    if (selectedDevice)
        deviceConfig.capture.pDeviceID = &*selectedDevice;

    auto const result = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize capture device: {}", static_cast<int>(result)));

    _impl->initialized = true;
    log::info("Audio capture initialized on '{}' ({}Hz, mono, float32)",
              _impl->device.capture.name,
              CaptureSampleRate);
    return {};
}

auto AudioCapture::start() -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::AudioError, "Capture device not initialized");

    if (_impl->capturing)
        return {};

    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to start audio capture: {}", static_cast<int>(result)));

    _impl->capturing = true;
    log::debug("Audio capture started");
    return {};
}

void AudioCapture::stop()
{
    if (!_impl->capturing.exchange(false))
        return;

    ma_device_stop(&_impl->device);
    log::debug("Audio capture stopped");
}

auto AudioCapture::isCapturing() const -> bool
{
    return _impl->capturing;
}

} // namespace bargein
