// SPDX-License-Identifier: Apache-2.0
#include <audio/ToneGenerator.hpp>
#include <audio/VoiceActivityDetector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

using namespace bargein;
using namespace std::chrono_literals;

TEST_CASE("generateTone produces the requested length and format", "[audio]")
{
    auto const source = generateTone(ToneSpec {
        .frequency = 440.0f,
        .amplitude = 0.5f,
        .duration = 500ms,
        .sampleRate = 16000,
        .channels = 2,
    });

    REQUIRE(source.samples);
    CHECK(source.sampleRate == 16000);
    CHECK(source.channels == 2);
    CHECK(source.frames() == 8000);
    CHECK(source.samples->size() == 16000);
    CHECK(source.duration() == 500ms);

    auto const peak = std::ranges::max(*source.samples, {}, [](float s) { return std::abs(s); });
    CHECK(std::abs(peak) <= 0.5f);
    CHECK(std::abs(peak) > 0.4f);

    // Faded edges start silent.
    CHECK(source.samples->front() == 0.0f);
}

TEST_CASE("VoiceActivityDetector separates silence from loud input", "[audio]")
{
    auto const vad = VoiceActivityDetector(0.01f);

    auto const silence = std::vector<float>(512, 0.0f);
    auto const loud = std::vector<float>(512, 0.1f);

    CHECK(vad.process(silence) == 0.0f);
    CHECK(vad.process(loud) == 1.0f);
    CHECK(!VoiceActivityDetector::isSpeech(vad.process(silence)));
    CHECK(VoiceActivityDetector::isSpeech(vad.process(loud)));
    CHECK(vad.process({}) == 0.0f);
}
