#pragma once

/// @file fft.h
/// @brief Radix-2 FFT engine with a size-keyed plan cache.

#include <complex>
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace keybeat {

/// @brief Complex output of one block transform.
/// @details Holds all N bins. Magnitude and phase are derived on demand.
class SpectralFrame {
 public:
  SpectralFrame() = default;

  /// @brief Wraps transform output.
  /// @param bins Complex bins (will be moved)
  explicit SpectralFrame(std::vector<std::complex<float>> bins) : bins_(std::move(bins)) {}

  /// @brief Returns number of bins (the transform size N).
  int size() const { return static_cast<int>(bins_.size()); }

  /// @brief Returns true if the frame holds no bins.
  bool empty() const { return bins_.empty(); }

  /// @brief Returns bin k.
  const std::complex<float>& operator[](int k) const { return bins_[k]; }

  /// @brief Returns all bins.
  const std::vector<std::complex<float>>& bins() const { return bins_; }

  /// @brief Returns |X[k]|.
  float magnitude(int k) const { return std::abs(bins_[k]); }

  /// @brief Returns arg(X[k]) in radians.
  float phase(int k) const { return std::arg(bins_[k]); }

  /// @brief Returns magnitudes of the first count bins.
  /// @param count Number of bins, clamped to size(); use N/2+1 for real input
  std::vector<float> magnitudes(int count) const;

  /// @brief Returns |X[k]|^2 of the first count bins.
  std::vector<float> powers(int count) const;

  /// @brief Returns sum(|X[k]|^2) / N, equal to the time-domain energy (Parseval).
  float energy() const;

 private:
  std::vector<std::complex<float>> bins_;
};

/// @brief Precomputed twiddle factors and bit-reversal permutation for one size.
/// @details Never mutated after construction, so a plan can be shared freely across threads.
class FftPlan {
 public:
  /// @brief Builds a plan for size n.
  /// @param n Transform size (power of two, >= 1)
  /// @throws KeybeatException(InvalidParameter) if n is not a power of two
  explicit FftPlan(int n);

  /// @brief Returns transform size.
  int size() const { return n_; }

  /// @brief Returns the n/2 roots of unity exp(-2*pi*i*k/n).
  const std::vector<std::complex<float>>& twiddles() const { return twiddles_; }

  /// @brief Returns the bit-reversal permutation table.
  const std::vector<int>& bit_reversal() const { return bit_reversal_; }

  /// @brief Transforms data in place (unscaled).
  /// @param data Array of size() complex values
  /// @param inverse Use conjugate twiddles
  void execute(std::complex<float>* data, bool inverse) const;

 private:
  int n_;
  std::vector<std::complex<float>> twiddles_;
  std::vector<int> bit_reversal_;
};

/// @brief Thread-safe get-or-create cache of FFT plans keyed by size.
/// @details Lookups of an existing plan take a shared lock only. Inserts re-check under
/// the exclusive lock, so concurrent first requests for one size keep the first plan.
/// Entries are never removed while the cache lives.
class FftPlanCache {
 public:
  FftPlanCache() = default;

  FftPlanCache(const FftPlanCache&) = delete;
  FftPlanCache& operator=(const FftPlanCache&) = delete;

  /// @brief Returns the plan for size n, building it on first request.
  /// @throws KeybeatException(InvalidParameter) if n is not a power of two
  std::shared_ptr<const FftPlan> get(int n);

  /// @brief Returns true if a plan for size n has been built.
  bool contains(int n) const;

  /// @brief Returns number of cached plans.
  size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<int, std::shared_ptr<const FftPlan>> plans_;
};

/// @brief FFT engine (O(N log N), iterative radix-2).
/// @details All methods are const and the plan cache is internally synchronized, so one
/// engine may be used from several threads. Engines built from the same cache share plans.
class FFT {
 public:
  /// @brief Constructs an engine with its own plan cache.
  FFT();

  /// @brief Constructs an engine backed by a shared plan cache.
  /// @param cache Plan cache (must not be null)
  explicit FFT(std::shared_ptr<FftPlanCache> cache);

  /// @brief Forward transform of complex input.
  /// @param input N complex values, N a power of two
  /// @return N complex bins
  /// @throws KeybeatException(InvalidParameter) if N is not a power of two
  SpectralFrame transform(const std::vector<std::complex<float>>& input) const;

  /// @brief Forward transform of real input.
  /// @param input N real values, N a power of two
  /// @param n Number of values
  /// @return N complex bins (bins above N/2 mirror the lower half)
  SpectralFrame forward(const float* input, int n) const;

  /// @brief Forward transform of real input.
  SpectralFrame forward(const std::vector<float>& input) const;

  /// @brief Inverse transform, scaled by 1/N.
  /// @param frame Spectral frame of size N
  /// @return N complex time-domain values
  std::vector<std::complex<float>> inverse(const SpectralFrame& frame) const;

  /// @brief Inverse transform keeping only the real part.
  std::vector<float> inverse_real(const SpectralFrame& frame) const;

  /// @brief Returns the (cached) plan for size n.
  std::shared_ptr<const FftPlan> plan(int n) const;

  /// @brief Returns the plan cache backing this engine.
  const std::shared_ptr<FftPlanCache>& cache() const { return cache_; }

 private:
  std::shared_ptr<FftPlanCache> cache_;
};

/// @brief Zero-pads a block to the next power of two.
/// @details Explicit padding policy: samples are never truncated, zeros are appended.
/// @param data Input samples
/// @param size Number of samples
/// @return Padded copy (size unchanged if already a power of two; 1 if size is 0)
std::vector<float> pad_to_power_of_two(const float* data, size_t size);

/// @brief Returns the center frequency of a bin.
/// @param bin Bin index
/// @param n_fft Transform size
/// @param sample_rate Sample rate in Hz
/// @return bin * sample_rate / n_fft
inline float bin_frequency(int bin, int n_fft, int sample_rate) {
  return static_cast<float>(bin) * static_cast<float>(sample_rate) / static_cast<float>(n_fft);
}

}  // namespace keybeat
