/// @file waveform_test.cpp
/// @brief Tests for waveform peak reduction.

#include "core/waveform.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

using namespace keybeat;
using Catch::Matchers::WithinAbs;

TEST_CASE("waveform_peaks block maxima", "[waveform]") {
  std::vector<float> samples(1000, 0.0f);
  samples[10] = -0.9f;   // block 0
  samples[150] = 0.4f;   // block 1
  samples[999] = 1.0f;   // block 9
  SampleBuffer buffer = SampleBuffer::from_vector(samples, 44100);

  std::vector<float> peaks = waveform_peaks(buffer, 10);
  REQUIRE(peaks.size() == 10);
  REQUIRE_THAT(peaks[0], WithinAbs(0.9f, 1e-6f));
  REQUIRE_THAT(peaks[1], WithinAbs(0.4f, 1e-6f));
  REQUIRE_THAT(peaks[5], WithinAbs(0.0f, 1e-6f));
  REQUIRE_THAT(peaks[9], WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("waveform_peaks uses channel 0 only", "[waveform]") {
  std::vector<std::vector<float>> channels = {std::vector<float>(400, 0.2f),
                                              std::vector<float>(400, 0.8f)};
  SampleBuffer buffer = SampleBuffer::from_channels(channels, 44100);
  for (float p : waveform_peaks(buffer, 4)) {
    REQUIRE_THAT(p, WithinAbs(0.2f, 1e-6f));
  }
}

TEST_CASE("waveform_peaks edge cases", "[waveform]") {
  SECTION("trailing samples are ignored") {
    std::vector<float> samples(205, 0.0f);
    samples[204] = 1.0f;
    auto peaks = waveform_peaks(SampleBuffer::from_vector(samples, 8000), 200);
    REQUIRE(peaks.size() == 200);
    for (float p : peaks) REQUIRE(p == 0.0f);
  }

  SECTION("buffer shorter than point count gives zeros") {
    auto peaks = waveform_peaks(SampleBuffer::from_vector({0.5f, -0.5f}, 8000), 200);
    REQUIRE(peaks.size() == 200);
    REQUIRE(peaks[0] == 0.0f);
  }

  SECTION("empty buffer or no points") {
    REQUIRE(waveform_peaks(SampleBuffer(), 200).empty());
    REQUIRE(waveform_peaks(SampleBuffer::from_vector({0.5f}, 8000), 0).empty());
  }

  SECTION("default point count") {
    auto peaks = waveform_peaks(SampleBuffer::from_vector(std::vector<float>(4000, 0.1f), 8000));
    REQUIRE(peaks.size() == static_cast<size_t>(kDefaultWaveformPoints));
  }
}
