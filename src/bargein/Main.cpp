// SPDX-License-Identifier: Apache-2.0
#include <audio/MiniaudioSink.hpp>
#include <audio/ToneGenerator.hpp>
#include <bargein/Config.hpp>
#include <core/Log.hpp>
#include <detection/ConfirmationPolicy.hpp>
#include <detection/VadDetectionSource.hpp>
#include <playback/PlaybackController.hpp>

#include <CLI/CLI.hpp>

#include <print>

using namespace bargein;

int main(int argc, char** argv)
{
    auto app = CLI::App { "bargein: plays a tone and stops it as soon as you start speaking" };

    auto configPath = std::string {};
    auto writeConfigPath = std::string {};
    auto durationSeconds = 5.0;
    auto frequency = 440.0f;
    auto threshold = 0;
    auto pollInterval = 0;
    auto noBargeIn = false;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--duration", durationSeconds, "Tone duration in seconds")->check(CLI::PositiveNumber);
    app.add_option("--frequency", frequency, "Tone frequency in Hz")->check(CLI::PositiveNumber);
    app.add_option("--threshold", threshold, "Consecutive speech detections required to confirm a barge-in");
    app.add_option("--poll-interval", pollInterval, "Playback driver poll interval in milliseconds");
    app.add_flag("--no-barge-in", noBargeIn, "Play without listening for barge-in");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--write-config", writeConfigPath, "Write the effective configuration to a file and exit");

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? loadConfig() : loadConfigFromFile(configPath);
    if (!configResult)
    {
        log::error("Failed to load config: {}", configResult.error());
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (threshold > 0)
        config.policy.threshold = threshold;
    if (pollInterval > 0)
        config.controller.pollIntervalMs = pollInterval;
    if (noBargeIn)
        config.controller.bargeInEnabled = false;
    if (verbose)
        config.logLevel = log::Level::Debug;

    log::setLevel(config.logLevel);

    if (auto valid = validateConfig(config); !valid)
    {
        log::error("Invalid configuration: {}", valid.error());
        return 1;
    }

    if (!writeConfigPath.empty())
    {
        if (auto saved = saveConfigToFile(writeConfigPath, config); !saved)
        {
            log::error("{}", saved.error());
            return 1;
        }
        std::println("Configuration written to {}", writeConfigPath);
        return 0;
    }

    auto detectionSource = VadDetectionSource {};
    if (config.controller.bargeInEnabled)
    {
        auto initResult = detectionSource.initialize(VadSourceConfig {
            .deviceName = config.audio.captureDeviceName,
            .vadThreshold = config.audio.vadThreshold,
            .energyThreshold = config.audio.vadEnergyThreshold,
        });
        if (!initResult)
            log::warning("Microphone unavailable, playing without barge-in: {}", initResult.error());
    }

    auto sink = MiniaudioSink {};
    auto controller = PlaybackController(
        sink,
        detectionSource,
        std::make_unique<ConsecutiveConfirmationPolicy>(ConsecutivePolicyConfig {
            .threshold = config.policy.threshold,
            .minConfidence = config.policy.minConfidence,
            .decayOnNegative = config.policy.decayOnNegative,
            .startupGrace = std::chrono::milliseconds { config.policy.startupGraceMs },
        }),
        ControllerConfig {
            .pollInterval = std::chrono::milliseconds { config.controller.pollIntervalMs },
            .monitorPollInterval = std::chrono::milliseconds { config.controller.monitorPollIntervalMs },
            .bargeInEnabled = config.controller.bargeInEnabled,
        });

    auto tone = generateTone(ToneSpec {
        .frequency = frequency,
        .duration = std::chrono::milliseconds { static_cast<long long>(durationSeconds * 1000.0) },
        .sampleRate = config.audio.sampleRate,
        .channels = config.audio.channels,
    });

    auto handle = controller.beginPlayback(std::move(tone));
    if (!handle)
    {
        log::error("Playback failed: {}", handle.error());
        return 1;
    }

    auto const result = controller.waitForCompletion(*handle);
    std::println("Playback {}", outcomeName(result.outcome));
    if (result.error)
        std::println("Sink reported: {}", *result.error);

    return result.outcome == PlaybackOutcome::Cancelled ? 2 : 0;
}
