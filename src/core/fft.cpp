/// @file fft.cpp
/// @brief Implementation of the radix-2 FFT engine.

#include "core/fft.h"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <string>
#include <utility>

#include "util/exception.h"
#include "util/math_utils.h"

namespace keybeat {

namespace {
constexpr double kPi = 3.14159265358979323846;
}  // namespace

std::vector<float> SpectralFrame::magnitudes(int count) const {
  int n = std::min(std::max(count, 0), size());
  std::vector<float> mags(n);
  for (int k = 0; k < n; ++k) {
    mags[k] = std::abs(bins_[k]);
  }
  return mags;
}

std::vector<float> SpectralFrame::powers(int count) const {
  int n = std::min(std::max(count, 0), size());
  std::vector<float> power(n);
  for (int k = 0; k < n; ++k) {
    power[k] = std::norm(bins_[k]);
  }
  return power;
}

float SpectralFrame::energy() const {
  if (bins_.empty()) {
    return 0.0f;
  }
  double sum = 0.0;
  for (const auto& bin : bins_) {
    sum += std::norm(bin);
  }
  return static_cast<float>(sum / static_cast<double>(bins_.size()));
}

FftPlan::FftPlan(int n) : n_(n) {
  KEYBEAT_CHECK_MSG(is_power_of_2(n), ErrorCode::InvalidParameter,
                    "FFT size must be a power of two, got " + std::to_string(n));

  // Twiddles in double precision, stored as float
  twiddles_.resize(n / 2);
  for (int k = 0; k < n / 2; ++k) {
    double angle = -2.0 * kPi * static_cast<double>(k) / static_cast<double>(n);
    twiddles_[k] = std::complex<float>(static_cast<float>(std::cos(angle)),
                                       static_cast<float>(std::sin(angle)));
  }

  int bits = log2_exact(n);
  bit_reversal_.resize(n);
  for (int i = 0; i < n; ++i) {
    int reversed = 0;
    for (int b = 0; b < bits; ++b) {
      if (i & (1 << b)) {
        reversed |= 1 << (bits - 1 - b);
      }
    }
    bit_reversal_[i] = reversed;
  }
}

void FftPlan::execute(std::complex<float>* data, bool inverse) const {
  for (int i = 0; i < n_; ++i) {
    int j = bit_reversal_[i];
    if (i < j) {
      std::swap(data[i], data[j]);
    }
  }

  // Butterflies: each stage doubles the sub-transform length
  for (int len = 2; len <= n_; len <<= 1) {
    const int half = len / 2;
    const int stride = n_ / len;
    for (int start = 0; start < n_; start += len) {
      for (int k = 0; k < half; ++k) {
        std::complex<float> w = twiddles_[k * stride];
        if (inverse) {
          w = std::conj(w);
        }
        std::complex<float> u = data[start + k];
        std::complex<float> v = data[start + k + half] * w;
        data[start + k] = u + v;
        data[start + k + half] = u - v;
      }
    }
  }
}

std::shared_ptr<const FftPlan> FftPlanCache::get(int n) {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = plans_.find(n);
    if (it != plans_.end()) {
      return it->second;
    }
  }

  // Build outside the lock; a concurrent builder for the same size may win the insert
  std::shared_ptr<const FftPlan> plan = std::make_shared<FftPlan>(n);

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto result = plans_.emplace(n, std::move(plan));
  return result.first->second;
}

bool FftPlanCache::contains(int n) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return plans_.find(n) != plans_.end();
}

size_t FftPlanCache::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return plans_.size();
}

FFT::FFT() : cache_(std::make_shared<FftPlanCache>()) {}

FFT::FFT(std::shared_ptr<FftPlanCache> cache) : cache_(std::move(cache)) {
  KEYBEAT_CHECK(cache_ != nullptr, ErrorCode::InvalidParameter);
}

std::shared_ptr<const FftPlan> FFT::plan(int n) const { return cache_->get(n); }

SpectralFrame FFT::transform(const std::vector<std::complex<float>>& input) const {
  auto p = plan(static_cast<int>(input.size()));
  std::vector<std::complex<float>> bins(input);
  p->execute(bins.data(), false);
  return SpectralFrame(std::move(bins));
}

SpectralFrame FFT::forward(const float* input, int n) const {
  auto p = plan(n);
  std::vector<std::complex<float>> bins(n);
  for (int i = 0; i < n; ++i) {
    bins[i] = std::complex<float>(input[i], 0.0f);
  }
  p->execute(bins.data(), false);
  return SpectralFrame(std::move(bins));
}

SpectralFrame FFT::forward(const std::vector<float>& input) const {
  return forward(input.data(), static_cast<int>(input.size()));
}

std::vector<std::complex<float>> FFT::inverse(const SpectralFrame& frame) const {
  const int n = frame.size();
  auto p = plan(n);
  std::vector<std::complex<float>> output(frame.bins());
  p->execute(output.data(), true);

  float scale = 1.0f / static_cast<float>(n);
  for (auto& v : output) {
    v *= scale;
  }
  return output;
}

std::vector<float> FFT::inverse_real(const SpectralFrame& frame) const {
  std::vector<std::complex<float>> complex_out = inverse(frame);
  std::vector<float> output(complex_out.size());
  for (size_t i = 0; i < complex_out.size(); ++i) {
    output[i] = complex_out[i].real();
  }
  return output;
}

std::vector<float> pad_to_power_of_two(const float* data, size_t size) {
  int padded_size = next_power_of_2(static_cast<int>(size));
  std::vector<float> padded(padded_size, 0.0f);
  if (size > 0) {
    std::copy(data, data + size, padded.begin());
  }
  return padded;
}

}  // namespace keybeat
