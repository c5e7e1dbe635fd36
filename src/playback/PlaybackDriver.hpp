// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSink.hpp>
#include <core/Error.hpp>
#include <playback/PlaybackSession.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>

namespace bargein
{

/// @brief Lifecycle of one session as seen by the driver.
enum class DriverState : std::uint8_t
{
    Idle,
    Starting,
    Playing,
    Stopping,
    Finished,
};

[[nodiscard]] constexpr auto driverStateName(DriverState state) -> std::string_view
{
    switch (state)
    {
        case DriverState::Idle: return "Idle";
        case DriverState::Starting: return "Starting";
        case DriverState::Playing: return "Playing";
        case DriverState::Stopping: return "Stopping";
        case DriverState::Finished: return "Finished";
    }
    return "?";
}

/// @brief Configuration for the playback driver.
struct DriverConfig
{
    /// @brief Upper bound on how long the poll loop waits between sink status checks.
    ///
    /// Stop requests wake the loop immediately; the interval only bounds how
    /// late a natural end of playback is noticed.
    std::chrono::milliseconds pollInterval { 10 };
};

/// @brief Drives the audio sink for one session at a time and guarantees a bounded-latency stop.
///
/// The sink is owned exclusively by the driver: nothing else calls into it
/// while a session runs. Every path through the driver ends with the session
/// marked finished, so completion waiters can never hang on a broken sink.
class PlaybackDriver
{
  public:
    explicit PlaybackDriver(AudioSink& sink, DriverConfig config = {});
    ~PlaybackDriver();

    PlaybackDriver(const PlaybackDriver&) = delete;
    PlaybackDriver& operator=(const PlaybackDriver&) = delete;

    /// @brief Starts the sink for @p session and launches the poll loop.
    ///
    /// The sink is started on the calling thread. If it fails the session is
    /// finished immediately with the error recorded, and the error is returned.
    /// The previous session's loop must have been joined.
    /// @return Success, or a SinkStartError.
    [[nodiscard]] auto start(std::shared_ptr<PlaybackSession> session, AudioSource source) -> VoidResult;

    /// @brief Blocks until the poll loop of the current session has exited.
    void join();

    [[nodiscard]] auto state() const noexcept -> DriverState { return _state.load(); }

    [[nodiscard]] auto config() const noexcept -> const DriverConfig& { return _config; }

  private:
    void run(const std::stop_token& stopToken, const std::shared_ptr<PlaybackSession>& session);
    [[nodiscard]] auto stopSink() -> std::optional<Error>;
    void finish(PlaybackSession& session, std::optional<Error> error);
    void transition(DriverState next);

    AudioSink& _sink;
    DriverConfig _config;
    std::atomic<DriverState> _state { DriverState::Idle };
    std::jthread _worker;
};

} // namespace bargein
