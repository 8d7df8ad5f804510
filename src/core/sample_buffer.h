#pragma once

/// @file sample_buffer.h
/// @brief Immutable multi-channel sample buffer with shared ownership.

#include <cstddef>
#include <memory>
#include <vector>

namespace keybeat {

/// @brief Decoded audio samples, one float sequence per channel.
/// @details Immutable once constructed. Copies share the underlying storage, so a buffer
/// can be handed to several concurrent readers without copying the samples.
class SampleBuffer {
 public:
  /// @brief Default constructor creates an empty buffer.
  SampleBuffer();

  /// @brief Creates a mono buffer from a vector of samples.
  /// @param samples Samples (will be moved)
  /// @param sample_rate Sample rate in Hz
  /// @throws KeybeatException if sample_rate <= 0
  static SampleBuffer from_vector(std::vector<float> samples, int sample_rate);

  /// @brief Creates a mono buffer by copying raw samples.
  /// @param samples Pointer to sample data
  /// @param size Number of samples
  /// @param sample_rate Sample rate in Hz
  static SampleBuffer from_buffer(const float* samples, size_t size, int sample_rate);

  /// @brief Creates a buffer from per-channel sample vectors.
  /// @param channels One vector per channel, all of the same length
  /// @param sample_rate Sample rate in Hz
  /// @throws KeybeatException if channel lengths differ or sample_rate <= 0
  static SampleBuffer from_channels(std::vector<std::vector<float>> channels, int sample_rate);

  /// @brief Creates a buffer by de-interleaving frame-ordered samples.
  /// @param data Interleaved samples [frames x channels]
  /// @param frames Number of frames
  /// @param channels Number of channels
  /// @param sample_rate Sample rate in Hz
  static SampleBuffer from_interleaved(const float* data, size_t frames, int channels,
                                       int sample_rate);

  /// @brief Returns pointer to the samples of one channel.
  /// @throws KeybeatException if index is out of range
  const float* channel(int index) const;

  /// @brief Returns number of channels (0 for an empty buffer).
  int channels() const;

  /// @brief Returns number of samples per channel.
  size_t size() const;

  /// @brief Returns sample rate in Hz.
  int sample_rate() const { return sample_rate_; }

  /// @brief Returns duration in seconds (size / sample_rate).
  float duration() const;

  /// @brief Returns true if the buffer holds no samples.
  bool empty() const { return size() == 0; }

  /// @brief Returns the channel average as a new mono sequence.
  std::vector<float> mono_mix() const;

 private:
  using ChannelData = std::vector<std::vector<float>>;

  SampleBuffer(std::shared_ptr<const ChannelData> data, int sample_rate);

  std::shared_ptr<const ChannelData> data_;
  int sample_rate_;
};

}  // namespace keybeat
