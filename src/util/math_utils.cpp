/// @file math_utils.cpp
/// @brief Implementation of math utility functions.

#include "util/math_utils.h"

#include <cmath>

namespace keybeat {

float cosine_similarity(const float* a, const float* b, size_t size) {
  if (size == 0) return 0.0f;

  float dot = 0.0f;
  float norm_a = 0.0f;
  float norm_b = 0.0f;

  for (size_t i = 0; i < size; ++i) {
    dot += a[i] * b[i];
    norm_a += a[i] * a[i];
    norm_b += b[i] * b[i];
  }

  float denom = std::sqrt(norm_a) * std::sqrt(norm_b);
  if (denom < 1e-10f) return 0.0f;
  return dot / denom;
}

float pearson_correlation(const float* a, const float* b, size_t size) {
  if (size < 2) return 0.0f;

  float mean_a = mean(a, size);
  float mean_b = mean(b, size);

  float num = 0.0f;
  float den_a = 0.0f;
  float den_b = 0.0f;

  for (size_t i = 0; i < size; ++i) {
    float da = a[i] - mean_a;
    float db = b[i] - mean_b;
    num += da * db;
    den_a += da * da;
    den_b += db * db;
  }

  // Constant inputs score 0, including those whose float mean is off by rounding
  if (den_a < 1e-10f || den_b < 1e-10f) return 0.0f;
  return num / std::sqrt(den_a * den_b);
}

float parabolic_peak_offset(float left, float center, float right) {
  float denom = left - 2.0f * center + right;
  if (denom >= 0.0f) {
    return 0.0f;
  }
  float offset = 0.5f * (left - right) / denom;
  return std::clamp(offset, -0.5f, 0.5f);
}

}  // namespace keybeat
