#pragma once

/// @file math_utils.h
/// @brief Mathematical utility functions for signal processing.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace keybeat {

/// @brief Returns the index of the maximum element.
/// @details The first occurrence wins on ties.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Index of maximum element (0 if empty)
template <typename T>
size_t argmax(const T* data, size_t size) {
  if (size == 0) return 0;
  return std::distance(data, std::max_element(data, data + size));
}

/// @brief Computes the arithmetic mean.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Mean value (0 if empty)
template <typename T>
T mean(const T* data, size_t size) {
  if (size == 0) return T{0};
  T sum = std::accumulate(data, data + size, T{0});
  return sum / static_cast<T>(size);
}

/// @brief Computes cosine similarity between two vectors.
/// @param a First vector
/// @param b Second vector
/// @param size Number of elements (must be same for both)
/// @return Cosine similarity in [-1, 1], 0 if either vector has zero norm
float cosine_similarity(const float* a, const float* b, size_t size);

/// @brief Computes Pearson correlation coefficient.
/// @param a First vector
/// @param b Second vector
/// @param size Number of elements (must be same for both)
/// @return Correlation coefficient in [-1, 1], 0 if either vector is constant
float pearson_correlation(const float* a, const float* b, size_t size);

/// @brief Sub-sample offset of a peak from three neighbouring values.
/// @details Fits a parabola through (-1, left), (0, center), (1, right).
/// @return Offset in [-0.5, 0.5], or 0 if the points do not form a maximum
float parabolic_peak_offset(float left, float center, float right);

/// @brief Returns true if n is a positive power of two.
inline bool is_power_of_2(int n) { return n > 0 && (n & (n - 1)) == 0; }

/// @brief Returns the smallest power of 2 greater than or equal to n.
/// @param n Input value
/// @return Smallest power of 2 >= n (returns 1 if n <= 0)
inline int next_power_of_2(int n) {
  if (n <= 0) return 1;
  int power = 1;
  while (power < n) {
    power *= 2;
  }
  return power;
}

/// @brief Returns log2(n) for a power of two n.
inline int log2_exact(int n) {
  int bits = 0;
  while ((1 << bits) < n) {
    ++bits;
  }
  return bits;
}

}  // namespace keybeat
