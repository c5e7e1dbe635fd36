// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <detection/DetectionSource.hpp>

#include <memory>
#include <string>

namespace bargein
{

/// @brief Configuration for the microphone-backed detection source.
struct VadSourceConfig
{
    std::string deviceName;
    float vadThreshold = 0.5f;
    float energyThreshold = 0.01f;
};

/// @brief DetectionSource fed by the microphone through the energy VAD.
///
/// Every captured chunk becomes one DetectionEvent carrying the VAD
/// probability as its confidence. Capture starts on the first open() and keeps
/// running between sessions; events are only buffered while a session is open.
class VadDetectionSource final: public DetectionSource
{
  public:
    VadDetectionSource();
    ~VadDetectionSource() override;

    VadDetectionSource(const VadDetectionSource&) = delete;
    VadDetectionSource& operator=(const VadDetectionSource&) = delete;

    /// @brief Initializes the capture device.
    [[nodiscard]] auto initialize(const VadSourceConfig& config) -> VoidResult;

    [[nodiscard]] auto open() -> VoidResult override;
    [[nodiscard]] auto next(std::chrono::milliseconds timeout) -> Result<std::optional<DetectionEvent>> override;
    void close() override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace bargein
