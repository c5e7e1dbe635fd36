// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <string>
#include <string_view>

namespace bargein
{

/// @brief Playback controller section.
struct ControllerSection
{
    int pollIntervalMs = 10;
    int monitorPollIntervalMs = 10;
    bool bargeInEnabled = true;
};

/// @brief Barge-in confirmation policy section.
struct PolicySection
{
    int threshold = 3;
    float minConfidence = 0.5f;
    bool decayOnNegative = true;
    int startupGraceMs = 150;
};

/// @brief Audio devices section.
struct AudioSection
{
    unsigned sampleRate = 22050;
    unsigned channels = 1;

    /// @brief Substring of the microphone name to use; empty picks the first non-monitor device.
    std::string captureDeviceName;

    float vadThreshold = 0.5f;
    float vadEnergyThreshold = 0.01f;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ControllerSection controller;
    PolicySection policy;
    AudioSection audio;
    log::Level logLevel = log::Level::Info;
};

/// @brief Loads the configuration from the default config path, or defaults if there is none.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
///
/// Missing sections and fields keep their defaults. The result is validated.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the configuration to a file, creating parent directories as needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Rejects values the controller cannot work with.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace bargein
