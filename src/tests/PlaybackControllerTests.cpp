// SPDX-License-Identifier: Apache-2.0
#include <detection/QueueDetectionSource.hpp>
#include <playback/PlaybackController.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <thread>
#include <vector>

#include "Fakes.hpp"

using namespace bargein;
using namespace bargein::test;
using namespace std::chrono_literals;

namespace
{

auto policyWithThreshold(int threshold) -> std::unique_ptr<ConfirmationPolicy>
{
    return std::make_unique<ConsecutiveConfirmationPolicy>(ConsecutivePolicyConfig {
        .threshold = threshold,
        .startupGrace = 0ms,
    });
}

} // namespace

TEST_CASE("Five positive detections with threshold three interrupt playback", "[controller]")
{
    auto sink = FakeAudioSink();
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(3));

    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(handle.has_value());
    CHECK(controller.isPlaying());

    for (auto i = 0; i < 5; ++i)
        source.push(speech());

    auto const result = controller.waitForCompletion(*handle);
    CHECK(result.outcome == PlaybackOutcome::Interrupted);
    CHECK(result.sessionId == handle->id());
    CHECK(!result.error);

    auto const snapshot = handle->snapshot();
    CHECK(snapshot.stopRequested);
    CHECK(snapshot.bargeInConfirmed);
    CHECK(!snapshot.isPlaying);
    CHECK(sink.stopCalls() == 1);
    CHECK(!controller.isPlaying());
}

TEST_CASE("Playback without detections completes naturally", "[controller]")
{
    auto sink = FakeAudioSink(FakeAudioSink::Options { .naturalDuration = 40ms });
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(3));

    CHECK(!controller.currentSession());

    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(handle.has_value());

    auto const result = controller.waitForCompletion(*handle);
    CHECK(result.outcome == PlaybackOutcome::Completed);
    CHECK(!result.error);
    CHECK(sink.stopCalls() == 0);
    CHECK(controller.driverState() == DriverState::Finished);

    auto const current = controller.currentSession();
    REQUIRE(current.has_value());
    CHECK(current->id == handle->id());
    CHECK(!current->isPlaying);
    CHECK(!current->stopRequested);
}

TEST_CASE("A failing sink stop still ends the turn as interrupted", "[controller]")
{
    auto sink = FakeAudioSink(FakeAudioSink::Options { .throwOnStop = true });
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(3));

    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(handle.has_value());
    for (auto i = 0; i < 3; ++i)
        source.push(speech());

    auto const result = controller.waitForCompletion(*handle);
    CHECK(result.outcome == PlaybackOutcome::Interrupted);
    REQUIRE(result.error.has_value());
    CHECK(result.error->code == ErrorCode::SinkStopError);
    CHECK(!controller.isPlaying());
}

TEST_CASE("requestInterrupt reports a programmatic cancel", "[controller]")
{
    auto sink = FakeAudioSink();
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(3));

    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(handle.has_value());

    CHECK(controller.requestInterrupt(*handle));
    CHECK(!controller.requestInterrupt(*handle));

    auto const result = controller.waitForCompletion(*handle);
    CHECK(result.outcome == PlaybackOutcome::Cancelled);
    CHECK(sink.stopCalls() == 1);

    // Late interrupts of a finished session have no effect.
    CHECK(!controller.requestInterrupt(*handle));
    CHECK(controller.waitForCompletion(*handle).outcome == PlaybackOutcome::Cancelled);
}

TEST_CASE("Overlapping playback is rejected", "[controller]")
{
    auto sink = FakeAudioSink();
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(3));

    auto first = controller.beginPlayback(dummySource());
    REQUIRE(first.has_value());

    auto second = controller.beginPlayback(dummySource());
    REQUIRE(!second.has_value());
    CHECK(second.error().code == ErrorCode::AlreadyPlaying);
    CHECK(sink.startCalls() == 1);

    controller.requestInterrupt(*first);
    [[maybe_unused]] auto const done = controller.waitForCompletion(*first);

    auto third = controller.beginPlayback(dummySource());
    REQUIRE(third.has_value());
    CHECK(third->id() == first->id() + 1);
}

TEST_CASE("preemptActive cancels the running session first", "[controller]")
{
    auto sink = FakeAudioSink();
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(3));

    auto first = controller.beginPlayback(dummySource());
    REQUIRE(first.has_value());

    auto second = controller.beginPlayback(dummySource(), PlaybackOptions { .preemptActive = true });
    REQUIRE(second.has_value());

    CHECK(controller.waitForCompletion(*first).outcome == PlaybackOutcome::Cancelled);
    CHECK(second->snapshot().isPlaying);

    controller.requestInterrupt(*second);
    CHECK(controller.waitForCompletion(*second).outcome == PlaybackOutcome::Cancelled);
}

TEST_CASE("Sink start failure is surfaced to the caller", "[controller]")
{
    auto sink = FakeAudioSink(FakeAudioSink::Options {
        .startError = Error { ErrorCode::AudioError, "device unplugged" },
    });
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(3));

    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(!handle.has_value());
    CHECK(handle.error().code == ErrorCode::SinkStartError);
    CHECK(!controller.isPlaying());
    CHECK(!controller.monitorRunning());

    // The failed session does not block the next one.
    auto retry = controller.beginPlayback(dummySource());
    REQUIRE(!retry.has_value());
    CHECK(retry.error().code == ErrorCode::SinkStartError);
}

TEST_CASE("Disabled barge-in ignores detections", "[controller]")
{
    auto sink = FakeAudioSink(FakeAudioSink::Options { .naturalDuration = 100ms });
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(1));

    auto handle = controller.beginPlayback(dummySource(), PlaybackOptions { .bargeInEnabled = false });
    REQUIRE(handle.has_value());
    CHECK(!controller.monitorRunning());

    source.push(speech());
    source.push(speech());

    CHECK(controller.waitForCompletion(*handle).outcome == PlaybackOutcome::Completed);
    CHECK(sink.stopCalls() == 0);
}

TEST_CASE("Unavailable detection source leaves playback uninterruptible", "[controller]")
{
    auto sink = FakeAudioSink(FakeAudioSink::Options { .naturalDuration = 40ms });
    auto source = UnavailableDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(1));

    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(handle.has_value());
    CHECK(controller.waitForCompletion(*handle).outcome == PlaybackOutcome::Completed);
}

TEST_CASE("Detections from before the session are discarded", "[controller]")
{
    auto sink = FakeAudioSink(FakeAudioSink::Options { .naturalDuration = 60ms });
    auto source = QueueDetectionSource();
    REQUIRE(source.open().has_value());
    for (auto i = 0; i < 5; ++i)
        source.push(speech());

    auto controller = PlaybackController(sink, source, policyWithThreshold(3));
    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(handle.has_value());

    CHECK(controller.waitForCompletion(*handle).outcome == PlaybackOutcome::Completed);
}

TEST_CASE("Waiting after completion returns the same result immediately", "[controller]")
{
    auto sink = FakeAudioSink();
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(3));

    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(handle.has_value());
    for (auto i = 0; i < 3; ++i)
        source.push(speech());

    auto const first = controller.waitForCompletion(*handle);

    auto const before = std::chrono::steady_clock::now();
    auto const second = controller.waitForCompletion(*handle);
    CHECK(std::chrono::steady_clock::now() - before < 50ms);
    CHECK(second.outcome == first.outcome);
    CHECK(second.outcome == PlaybackOutcome::Interrupted);
}

TEST_CASE("Several waiters observe the same outcome", "[controller]")
{
    auto sink = FakeAudioSink();
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(2));

    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(handle.has_value());

    auto outcomes = std::array<PlaybackOutcome, 3> {};
    {
        auto waiters = std::vector<std::jthread> {};
        for (auto& outcome: outcomes)
            waiters.emplace_back([&] { outcome = controller.waitForCompletion(*handle).outcome; });

        std::this_thread::sleep_for(10ms);
        source.push(speech());
        source.push(speech());
    }

    for (auto const outcome: outcomes)
        CHECK(outcome == PlaybackOutcome::Interrupted);
    CHECK(sink.stopCalls() == 1);
}

TEST_CASE("waitForCompletionFor lets the caller bound the wait", "[controller]")
{
    auto sink = FakeAudioSink();
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(3));

    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(handle.has_value());

    CHECK(!controller.waitForCompletionFor(*handle, 20ms).has_value());

    controller.requestInterrupt(*handle);
    auto const result = controller.waitForCompletionFor(*handle, 2000ms);
    REQUIRE(result.has_value());
    CHECK(result->outcome == PlaybackOutcome::Cancelled);
}

TEST_CASE("Shutdown cancels the active session", "[controller]")
{
    auto sink = FakeAudioSink();
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(3));

    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(handle.has_value());

    controller.shutdown();
    CHECK(!controller.isPlaying());
    CHECK(controller.waitForCompletion(*handle).outcome == PlaybackOutcome::Cancelled);

    auto after = controller.beginPlayback(dummySource());
    REQUIRE(!after.has_value());
    CHECK(after.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("cancelMonitor stops listening but keeps playing", "[controller]")
{
    auto sink = FakeAudioSink(FakeAudioSink::Options { .naturalDuration = 150ms });
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(1));

    auto handle = controller.beginPlayback(dummySource());
    REQUIRE(handle.has_value());

    CHECK(controller.cancelMonitor(*handle));
    for (auto i = 0; i < 200 && controller.monitorRunning(); ++i)
        std::this_thread::sleep_for(1ms);
    CHECK(!controller.monitorRunning());

    source.push(speech());
    CHECK(controller.waitForCompletion(*handle).outcome == PlaybackOutcome::Completed);
}

TEST_CASE("cancelMonitor with a stale handle leaves the new session interruptible", "[controller]")
{
    auto sink = FakeAudioSink();
    auto source = QueueDetectionSource();
    auto controller = PlaybackController(sink, source, policyWithThreshold(1));

    auto first = controller.beginPlayback(dummySource());
    REQUIRE(first.has_value());
    CHECK(controller.requestInterrupt(*first));
    CHECK(controller.waitForCompletion(*first).outcome == PlaybackOutcome::Cancelled);

    auto second = controller.beginPlayback(dummySource());
    REQUIRE(second.has_value());
    CHECK(!controller.cancelMonitor(*first));
    CHECK(controller.monitorRunning());

    source.push(speech());
    CHECK(controller.waitForCompletion(*second).outcome == PlaybackOutcome::Interrupted);
}
