// SPDX-License-Identifier: Apache-2.0
#include <detection/ConfirmationPolicy.hpp>
#include <detection/QueueDetectionSource.hpp>
#include <playback/BargeInMonitor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>

#include "Fakes.hpp"

using namespace bargein;
using namespace bargein::test;
using namespace std::chrono_literals;

namespace
{

auto immediatePolicy(int threshold) -> ConsecutiveConfirmationPolicy
{
    return ConsecutiveConfirmationPolicy(ConsecutivePolicyConfig {
        .threshold = threshold,
        .startupGrace = 0ms,
    });
}

/// @brief Waits until the monitor thread has left its loop.
void waitUntilStopped(const BargeInMonitor& monitor)
{
    for (auto i = 0; i < 500 && monitor.running(); ++i)
        std::this_thread::sleep_for(1ms);
}

} // namespace

TEST_CASE("Monitor requests a barge-in stop once the policy confirms", "[monitor]")
{
    auto source = QueueDetectionSource();
    auto policy = immediatePolicy(3);
    auto monitor = BargeInMonitor(source, policy);
    auto session = std::make_shared<PlaybackSession>(1);

    REQUIRE(monitor.start(session).has_value());
    for (auto i = 0; i < 5; ++i)
        source.push(speech());

    auto const snapshot = session->waitForStopRequest(2000ms);
    CHECK(snapshot.stopRequested);
    CHECK(snapshot.bargeInConfirmed);
    CHECK(snapshot.isPlaying); // the monitor never finishes the session itself

    monitor.join();
    CHECK(!monitor.running());
}

TEST_CASE("Monitor ignores detections that do not satisfy the policy", "[monitor]")
{
    auto source = QueueDetectionSource();
    auto policy = immediatePolicy(3);
    auto monitor = BargeInMonitor(source, policy);
    auto session = std::make_shared<PlaybackSession>(1);

    REQUIRE(monitor.start(session).has_value());
    source.push(speech());
    source.push(silence());
    source.push(speech());
    source.push(silence());

    CHECK(!session->waitForStopRequest(100ms).stopRequested);

    session->markFinished();
    monitor.join();
    CHECK(!session->snapshot().bargeInConfirmed);
}

TEST_CASE("Monitor exits when the session finishes", "[monitor]")
{
    auto source = QueueDetectionSource();
    auto policy = immediatePolicy(3);
    auto monitor = BargeInMonitor(source, policy);
    auto session = std::make_shared<PlaybackSession>(1);

    REQUIRE(monitor.start(session).has_value());
    CHECK(monitor.running());

    session->markFinished();
    waitUntilStopped(monitor);
    CHECK(!monitor.running());
}

TEST_CASE("Monitor exits after a programmatic stop without confirming barge-in", "[monitor]")
{
    auto source = QueueDetectionSource();
    auto policy = immediatePolicy(1);
    auto monitor = BargeInMonitor(source, policy);
    auto session = std::make_shared<PlaybackSession>(1);

    REQUIRE(monitor.start(session).has_value());
    session->requestStop(false);
    waitUntilStopped(monitor);

    CHECK(!monitor.running());
    CHECK(!session->snapshot().bargeInConfirmed);
}

TEST_CASE("Monitor can be cancelled cooperatively", "[monitor]")
{
    auto source = QueueDetectionSource();
    auto policy = immediatePolicy(1);
    auto monitor = BargeInMonitor(source, policy);
    auto session = std::make_shared<PlaybackSession>(1);

    REQUIRE(monitor.start(session).has_value());
    monitor.cancel();
    monitor.join();

    CHECK(!monitor.running());
    CHECK(!session->snapshot().stopRequested);
}

TEST_CASE("Detection source failure leaves the session playing", "[monitor]")
{
    auto source = QueueDetectionSource();
    auto policy = immediatePolicy(1);
    auto monitor = BargeInMonitor(source, policy);
    auto session = std::make_shared<PlaybackSession>(1);

    REQUIRE(monitor.start(session).has_value());
    source.fail(Error { ErrorCode::DetectionSourceError, "speech engine died" });
    monitor.join();

    auto const snapshot = session->snapshot();
    CHECK(snapshot.isPlaying);
    CHECK(!snapshot.stopRequested);
}

TEST_CASE("Monitor reports an unavailable detection source", "[monitor]")
{
    auto source = UnavailableDetectionSource();
    auto policy = immediatePolicy(1);
    auto monitor = BargeInMonitor(source, policy);
    auto session = std::make_shared<PlaybackSession>(1);

    auto result = monitor.start(session);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::DetectionSourceError);
    CHECK(!monitor.running());
}

TEST_CASE("A throwing detection source ends monitoring but not playback", "[monitor]")
{
    auto source = ThrowingDetectionSource();
    auto policy = immediatePolicy(1);
    auto monitor = BargeInMonitor(source, policy);
    auto session = std::make_shared<PlaybackSession>(1);

    REQUIRE(monitor.start(session).has_value());
    monitor.join();

    auto const snapshot = session->snapshot();
    CHECK(!monitor.running());
    CHECK(snapshot.isPlaying);
    CHECK(!snapshot.stopRequested);
    CHECK(source.closeCalls() == 1);
}

TEST_CASE("A detection source that throws on close does not escape the monitor", "[monitor]")
{
    auto source = ThrowingDetectionSource(ThrowingDetectionSource::Options { .throwOnNext = false, .throwOnClose = true });
    auto policy = immediatePolicy(1);
    auto monitor = BargeInMonitor(source, policy);
    auto session = std::make_shared<PlaybackSession>(1);

    REQUIRE(monitor.start(session).has_value());
    session->markFinished();
    monitor.join();

    CHECK(!monitor.running());
    CHECK(source.closeCalls() == 1);
}

TEST_CASE("A throwing confirmation policy leaves the session playing", "[monitor]")
{
    auto source = QueueDetectionSource();
    auto policy = ThrowingConfirmationPolicy();
    auto monitor = BargeInMonitor(source, policy);
    auto session = std::make_shared<PlaybackSession>(1);

    REQUIRE(monitor.start(session).has_value());
    source.push(speech());
    monitor.join();

    auto const snapshot = session->snapshot();
    CHECK(snapshot.isPlaying);
    CHECK(!snapshot.stopRequested);
}

TEST_CASE("Cancelling by session id only affects the watched session", "[monitor]")
{
    auto source = QueueDetectionSource();
    auto policy = immediatePolicy(1);
    auto monitor = BargeInMonitor(source, policy);
    auto session = std::make_shared<PlaybackSession>(7);

    REQUIRE(monitor.start(session).has_value());
    CHECK(!monitor.cancel(SessionId { 6 }));
    CHECK(monitor.running());

    CHECK(monitor.cancel(SessionId { 7 }));
    monitor.join();
    CHECK(!monitor.running());
    CHECK(!session->snapshot().stopRequested);
}

TEST_CASE("Cancel from another thread races safely with restarts", "[monitor]")
{
    auto source = QueueDetectionSource();
    auto policy = immediatePolicy(1);
    auto monitor = BargeInMonitor(source, policy);

    auto cancelling = std::atomic<bool> { true };
    auto canceller = std::jthread([&] {
        while (cancelling.load())
            monitor.cancel(SessionId { 1 });
    });

    for (auto id = SessionId { 1 }; id <= 50; ++id)
    {
        auto session = std::make_shared<PlaybackSession>(id);
        REQUIRE(monitor.start(session).has_value());
        session->markFinished();
        monitor.join();
    }

    cancelling = false;
    canceller.join();
    CHECK(!monitor.running());
}
