/// @file onset_test.cpp
/// @brief Tests for the log-Mel flux onset envelope.

#include "feature/onset.h"

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "core/frames.h"
#include "util/exception.h"
#include "util/test_signals.h"

using namespace keybeat;
using Catch::Matchers::WithinAbs;

TEST_CASE("count_frames", "[onset]") {
  REQUIRE(count_frames(2048, 2048, 512) == 1);
  REQUIRE(count_frames(2047, 2048, 512) == 0);
  REQUIRE(count_frames(4096, 2048, 512) == 5);
  REQUIRE(count_frames(0, 2048, 512) == 0);
}

TEST_CASE("log mel flux of silence", "[onset]") {
  FFT fft;
  std::vector<float> silence(44100, 0.0f);

  std::vector<float> flux = compute_log_mel_flux(silence.data(), silence.size(), 44100, fft);
  REQUIRE(flux.size() == static_cast<size_t>(count_frames(silence.size(), 2048, 512)));
  for (float v : flux) REQUIRE(v == 0.0f);

  std::vector<float> envelope = compute_onset_envelope(silence.data(), silence.size(), 44100, fft);
  REQUIRE(envelope.size() == flux.size());
  for (float v : envelope) REQUIRE(v == 0.0f);
}

TEST_CASE("onset envelope shorter than one frame", "[onset]") {
  FFT fft;
  std::vector<float> tiny(1000, 0.5f);
  REQUIRE(compute_onset_envelope(tiny.data(), tiny.size(), 44100, fft).empty());

  // No frames, so the sample rate is never needed
  REQUIRE(compute_onset_envelope(tiny.data(), tiny.size(), 0, fft).empty());
}

TEST_CASE("onset envelope of a click track", "[onset]") {
  FFT fft;
  SampleBuffer clicks = test::click_track(120.0f, 44100, 5.0f);
  std::vector<float> envelope =
      compute_onset_envelope(clicks.channel(0), clicks.size(), clicks.sample_rate(), fft);

  REQUIRE(envelope.size() == static_cast<size_t>(count_frames(clicks.size(), 2048, 512)));
  REQUIRE(envelope[0] == 0.0f);
  for (float v : envelope) REQUIRE(v >= 0.0f);

  // The click at sample 22050 first enters frame 40 (samples 20480..22527)
  int peak_frame = static_cast<int>(std::max_element(envelope.begin() + 30, envelope.begin() + 60) -
                                    envelope.begin());
  REQUIRE(peak_frame >= 39);
  REQUIRE(peak_frame <= 43);
  REQUIRE(envelope[peak_frame] > 2.0f);

  // Between clicks nothing rises
  for (int t = 50; t < 80; ++t) REQUIRE(envelope[t] == 0.0f);
}

TEST_CASE("onset envelope gates a steady tone", "[onset]") {
  FFT fft;
  std::vector<float> tone = test::sine(110.0f, 48000, 48000 * 5);
  std::vector<float> envelope = compute_onset_envelope(tone.data(), tone.size(), 48000, fft);

  REQUIRE_FALSE(envelope.empty());
  for (float v : envelope) REQUIRE(v == 0.0f);
}

TEST_CASE("onset envelope gates a steady chord", "[onset]") {
  FFT fft;
  // A minor triad; beating between partials ripples the band power a little every frame
  std::vector<float> triad = test::chord({220.0f, 261.63f, 329.63f}, 44100, 44100 * 8, 4);

  std::vector<float> flux = compute_log_mel_flux(triad.data(), triad.size(), 44100, fft);
  REQUIRE_FALSE(flux.empty());
  REQUIRE(*std::max_element(flux.begin(), flux.end()) < tempo_constants::kOnsetThreshold);

  std::vector<float> envelope = compute_onset_envelope(triad.data(), triad.size(), 44100, fft);
  for (float v : envelope) REQUIRE(v == 0.0f);
}

TEST_CASE("onset envelope is independent of the signal level", "[onset]") {
  FFT fft;
  SampleBuffer clicks = test::click_track(120.0f, 44100, 3.0f);
  std::vector<float> quiet(clicks.channel(0), clicks.channel(0) + clicks.size());
  for (float& v : quiet) v *= 0.1f;

  std::vector<float> loud_env = compute_log_mel_flux(clicks.channel(0), clicks.size(), 44100, fft);
  std::vector<float> quiet_env = compute_log_mel_flux(quiet.data(), quiet.size(), 44100, fft);
  REQUIRE(loud_env.size() == quiet_env.size());
  for (size_t t = 0; t < loud_env.size(); ++t) {
    REQUIRE_THAT(quiet_env[t], WithinAbs(loud_env[t], 1e-2f));
  }
}

TEST_CASE("onset envelope configuration errors", "[onset]") {
  FFT fft;
  std::vector<float> samples(8192, 0.1f);

  OnsetConfig zero_hop;
  zero_hop.hop_length = 0;
  REQUIRE_THROWS_AS(compute_onset_envelope(samples.data(), samples.size(), 44100, fft, zero_hop),
                    KeybeatException);

  OnsetConfig long_hop;
  long_hop.hop_length = 4096;
  REQUIRE_THROWS_AS(compute_onset_envelope(samples.data(), samples.size(), 44100, fft, long_hop),
                    KeybeatException);

  OnsetConfig odd_frame;
  odd_frame.frame_size = 1000;
  odd_frame.hop_length = 250;
  REQUIRE_THROWS_AS(compute_onset_envelope(samples.data(), samples.size(), 44100, fft, odd_frame),
                    KeybeatException);

  OnsetConfig no_bands;
  no_bands.n_mels = 0;
  REQUIRE_THROWS_AS(compute_onset_envelope(samples.data(), samples.size(), 44100, fft, no_bands),
                    KeybeatException);

  OnsetConfig negative_threshold;
  negative_threshold.threshold = -1.0f;
  REQUIRE_THROWS_AS(
      compute_onset_envelope(samples.data(), samples.size(), 44100, fft, negative_threshold),
      KeybeatException);

  REQUIRE_THROWS_AS(compute_onset_envelope(samples.data(), samples.size(), 0, fft),
                    KeybeatException);
}

TEST_CASE("onset envelope honours cancellation", "[onset]") {
  FFT fft;
  std::vector<float> samples(44100, 0.1f);
  CancellationToken token;
  token.cancel();

  try {
    compute_onset_envelope(samples.data(), samples.size(), 44100, fft, OnsetConfig(), &token);
    FAIL("expected cancellation");
  } catch (const KeybeatException& e) {
    REQUIRE(e.code() == ErrorCode::Cancelled);
  }
}
