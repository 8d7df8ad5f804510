/// @file fft_reference_test.cpp
/// @brief Cross-checks the radix-2 engine against KissFFT.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <random>
#include <vector>

#include "core/fft.h"
#include "kiss_fft.h"
#include "kiss_fftr.h"

using namespace keybeat;
using Catch::Matchers::WithinAbs;

namespace {

/// @brief Owns a KissFFT real-input configuration.
struct KissRealPlan {
  explicit KissRealPlan(int n) : cfg(kiss_fftr_alloc(n, 0, nullptr, nullptr)) {}
  ~KissRealPlan() { kiss_fft_free(cfg); }
  KissRealPlan(const KissRealPlan&) = delete;
  KissRealPlan& operator=(const KissRealPlan&) = delete;

  kiss_fftr_cfg cfg;
};

std::vector<float> random_signal(int n, unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  std::vector<float> signal(n);
  for (float& v : signal) v = dist(gen);
  return signal;
}

}  // namespace

TEST_CASE("FFT matches KissFFT on random input", "[fft][reference]") {
  FFT fft;

  for (int n : {2, 16, 256, 2048, 8192}) {
    std::vector<float> input = random_signal(n, static_cast<unsigned>(n));

    KissRealPlan kiss(n);
    REQUIRE(kiss.cfg != nullptr);
    std::vector<kiss_fft_cpx> expected(n / 2 + 1);
    kiss_fftr(kiss.cfg, input.data(), expected.data());

    SpectralFrame actual = fft.forward(input);

    // Error grows with log2(n) and the magnitude of the sum
    const float tolerance = 1e-4f * std::sqrt(static_cast<float>(n)) * std::log2(static_cast<float>(n));
    for (int k = 0; k <= n / 2; ++k) {
      REQUIRE_THAT(actual[k].real(), WithinAbs(expected[k].r, tolerance));
      REQUIRE_THAT(actual[k].imag(), WithinAbs(expected[k].i, tolerance));
    }
  }
}

TEST_CASE("FFT magnitudes match KissFFT for a windowed sine", "[fft][reference]") {
  constexpr int n = 2048;
  constexpr float kTwoPi = 6.28318530717958647692f;
  FFT fft;

  std::vector<float> input(n);
  for (int i = 0; i < n; ++i) {
    float w = 0.5f * (1.0f - std::cos(kTwoPi * i / (n - 1)));
    input[i] = w * std::sin(kTwoPi * 440.0f * i / 44100.0f);
  }

  KissRealPlan kiss(n);
  std::vector<kiss_fft_cpx> expected(n / 2 + 1);
  kiss_fftr(kiss.cfg, input.data(), expected.data());

  std::vector<float> mags = fft.forward(input).magnitudes(n / 2 + 1);
  for (int k = 0; k <= n / 2; ++k) {
    float ref = std::hypot(expected[k].r, expected[k].i);
    REQUIRE_THAT(mags[k], WithinAbs(ref, 1e-3f));
  }
}
