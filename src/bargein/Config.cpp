// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace bargein
{

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\bargein";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/bargein";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/bargein";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/bargein";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    if (config.controller.pollIntervalMs <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("controller.pollIntervalMs must be positive (got {})",
                                     config.controller.pollIntervalMs));
    if (config.controller.monitorPollIntervalMs <= 0 || config.controller.monitorPollIntervalMs > 10)
        return makeError(ErrorCode::ConfigError,
                         std::format("controller.monitorPollIntervalMs must be within 1..10 (got {})",
                                     config.controller.monitorPollIntervalMs));
    if (config.policy.threshold <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("policy.threshold must be positive (got {})", config.policy.threshold));
    if (config.policy.minConfidence < 0.0f || config.policy.minConfidence > 1.0f)
        return makeError(ErrorCode::ConfigError,
                         std::format("policy.minConfidence must be within 0..1 (got {})",
                                     config.policy.minConfidence));
    if (config.policy.startupGraceMs < 0)
        return makeError(ErrorCode::ConfigError, "policy.startupGraceMs must not be negative");
    if (config.audio.sampleRate == 0 || config.audio.channels == 0)
        return makeError(ErrorCode::ConfigError, "audio.sampleRate and audio.channels must be positive");
    return {};
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config root must be an object: {}", path));

    auto config = AppConfig {};

    auto const controller = json::sectionOf(root, "controller");
    config.controller.pollIntervalMs = json::getIntOr(controller, "pollIntervalMs", 10);
    config.controller.monitorPollIntervalMs = json::getIntOr(controller, "monitorPollIntervalMs", 10);
    config.controller.bargeInEnabled = json::getBoolOr(controller, "bargeInEnabled", true);

    auto const policy = json::sectionOf(root, "policy");
    config.policy.threshold = json::getIntOr(policy, "threshold", 3);
    config.policy.minConfidence = json::getFloatOr(policy, "minConfidence", 0.5f);
    config.policy.decayOnNegative = json::getBoolOr(policy, "decayOnNegative", true);
    config.policy.startupGraceMs = json::getIntOr(policy, "startupGraceMs", 150);

    auto const audio = json::sectionOf(root, "audio");
    config.audio.sampleRate = static_cast<unsigned>(json::getIntOr(audio, "sampleRate", 22050));
    config.audio.channels = static_cast<unsigned>(json::getIntOr(audio, "channels", 1));
    config.audio.captureDeviceName = json::getStringOr(audio, "captureDeviceName", "");
    config.audio.vadThreshold = json::getFloatOr(audio, "vadThreshold", 0.5f);
    config.audio.vadEnergyThreshold = json::getFloatOr(audio, "vadEnergyThreshold", 0.01f);

    auto const logSection = json::sectionOf(root, "log");
    auto const levelName = json::getStringOr(logSection, "level", "info");
    auto const level = log::levelFromString(levelName);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", levelName));
    config.logLevel = *level;

    if (auto valid = validateConfig(config); !valid)
        return std::unexpected(valid.error());

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["controller"] = {
        { "pollIntervalMs", config.controller.pollIntervalMs },
        { "monitorPollIntervalMs", config.controller.monitorPollIntervalMs },
        { "bargeInEnabled", config.controller.bargeInEnabled },
    };

    root["policy"] = {
        { "threshold", config.policy.threshold },
        { "minConfidence", config.policy.minConfidence },
        { "decayOnNegative", config.policy.decayOnNegative },
        { "startupGraceMs", config.policy.startupGraceMs },
    };

    auto audio = nlohmann::json::object();
    audio["sampleRate"] = config.audio.sampleRate;
    audio["channels"] = config.audio.channels;
    if (!config.audio.captureDeviceName.empty())
        audio["captureDeviceName"] = config.audio.captureDeviceName;
    audio["vadThreshold"] = config.audio.vadThreshold;
    audio["vadEnergyThreshold"] = config.audio.vadEnergyThreshold;
    root["audio"] = std::move(audio);

    root["log"] = { { "level", std::string(log::levelToString(config.logLevel)) } };

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace bargein
