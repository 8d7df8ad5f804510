/// @file chroma_test.cpp
/// @brief Tests for pitch-class folding.

#include "filters/chroma.h"

#include <catch2/catch_test_macros.hpp>
#include <vector>

#include "core/fft.h"
#include "util/exception.h"

using namespace keybeat;

TEST_CASE("hz_to_pitch_class", "[chroma_filter]") {
  REQUIRE(hz_to_pitch_class(261.6256f) == 0);   // C4
  REQUIRE(hz_to_pitch_class(277.1826f) == 1);   // C#4
  REQUIRE(hz_to_pitch_class(440.0f) == 9);      // A4
  REQUIRE(hz_to_pitch_class(110.0f) == 9);      // A2, below the reference
  REQUIRE(hz_to_pitch_class(65.4064f) == 0);    // C2
  REQUIRE(hz_to_pitch_class(493.8833f) == 11);  // B4
  REQUIRE(hz_to_pitch_class(3951.066f) == 11);  // B7

  SECTION("rounds to the nearest semitone") {
    // 40 cents above A4 is still A, 60 cents above is A#
    REQUIRE(hz_to_pitch_class(440.0f * 1.023374f) == 9);
    REQUIRE(hz_to_pitch_class(440.0f * 1.035265f) == 10);
  }

  SECTION("non-positive frequency") {
    REQUIRE(hz_to_pitch_class(0.0f) == -1);
    REQUIRE(hz_to_pitch_class(-440.0f) == -1);
  }

  SECTION("custom reference") {
    REQUIRE(hz_to_pitch_class(440.0f, 440.0f) == 0);
  }
}

TEST_CASE("bin_pitch_class honours frequency limits", "[chroma_filter]") {
  constexpr int sr = 44100;
  constexpr int n_fft = 8192;

  REQUIRE(bin_pitch_class(0, sr, n_fft) == -1);
  // Bin 10 is about 53.8 Hz, below 65 Hz
  REQUIRE(bin_pitch_class(10, sr, n_fft) == -1);
  // Bin 1000 is about 5383 Hz, above 5000 Hz
  REQUIRE(bin_pitch_class(1000, sr, n_fft) == -1);
  // Bin 82 is about 441.4 Hz (A4)
  REQUIRE(bin_pitch_class(82, sr, n_fft) == 9);
}

TEST_CASE("create_chroma_fold_matrix", "[chroma_filter]") {
  constexpr int sr = 48000;
  constexpr int n_fft = 8192;
  constexpr int n_bins = n_fft / 2 + 1;

  std::vector<float> fold = create_chroma_fold_matrix(sr, n_fft);
  REQUIRE(fold.size() == static_cast<size_t>(12 * n_bins));

  for (int k = 0; k < n_bins; ++k) {
    float column = 0.0f;
    for (int pc = 0; pc < 12; ++pc) {
      float v = fold[pc * n_bins + k];
      REQUIRE((v == 0.0f || v == 1.0f));
      column += v;
    }

    int expected_pc = k == 0 ? -1 : bin_pitch_class(k, sr, n_fft);
    if (expected_pc < 0) {
      REQUIRE(column == 0.0f);
    } else {
      REQUIRE(column == 1.0f);
      REQUIRE(fold[expected_pc * n_bins + k] == 1.0f);
    }
  }

  SECTION("every pitch class receives bins") {
    for (int pc = 0; pc < 12; ++pc) {
      float row = 0.0f;
      for (int k = 0; k < n_bins; ++k) row += fold[pc * n_bins + k];
      REQUIRE(row > 0.0f);
    }
  }
}

TEST_CASE("create_chroma_fold_matrix rejects bad parameters", "[chroma_filter]") {
  REQUIRE_THROWS_AS(create_chroma_fold_matrix(0, 1024), KeybeatException);
  REQUIRE_THROWS_AS(create_chroma_fold_matrix(44100, 0), KeybeatException);

  ChromaFoldConfig inverted;
  inverted.fmin = 5000.0f;
  inverted.fmax = 65.0f;
  REQUIRE_THROWS_AS(create_chroma_fold_matrix(44100, 1024, inverted), KeybeatException);
}
