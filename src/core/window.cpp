/// @file window.cpp
/// @brief Implementation of window functions.

#include "core/window.h"

#include <cmath>
#include <map>
#include <utility>

#include "util/exception.h"

namespace keybeat {

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

/// @brief Thread-local cache for window functions.
thread_local std::map<std::pair<WindowType, int>, std::vector<float>> g_window_cache;
}  // namespace

float hann(int i, int n) {
  if (n <= 1) return 1.0f;
  return 0.5f * (1.0f - std::cos(kTwoPi * i / (n - 1)));
}

float hamming(int i, int n) {
  if (n <= 1) return 1.0f;
  return 0.54f - 0.46f * std::cos(kTwoPi * i / (n - 1));
}

std::vector<float> create_window(WindowType type, int length) {
  switch (type) {
    case WindowType::Hann:
      return hann_window(length);
    case WindowType::Hamming:
      return hamming_window(length);
  }
  return hann_window(length);
}

const std::vector<float>& get_window_cached(WindowType type, int length) {
  auto key = std::make_pair(type, length);
  auto it = g_window_cache.find(key);
  if (it != g_window_cache.end()) {
    return it->second;
  }

  auto result = g_window_cache.emplace(key, create_window(type, length));
  return result.first->second;
}

std::vector<float> hann_window(int length) {
  KEYBEAT_CHECK(length >= 0, ErrorCode::InvalidParameter);
  std::vector<float> window(length);
  for (int i = 0; i < length; ++i) {
    window[i] = hann(i, length);
  }
  return window;
}

std::vector<float> hamming_window(int length) {
  KEYBEAT_CHECK(length >= 0, ErrorCode::InvalidParameter);
  std::vector<float> window(length);
  for (int i = 0; i < length; ++i) {
    window[i] = hamming(i, length);
  }
  return window;
}

void apply_window(std::vector<float>& block, const std::vector<float>& window) {
  KEYBEAT_CHECK(block.size() == window.size(), ErrorCode::InvalidParameter);
  for (size_t i = 0; i < block.size(); ++i) {
    block[i] *= window[i];
  }
}

}  // namespace keybeat
