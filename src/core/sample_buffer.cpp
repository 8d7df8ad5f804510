#include "core/sample_buffer.h"

#include <string>

#include "util/exception.h"

namespace keybeat {

SampleBuffer::SampleBuffer() : data_(nullptr), sample_rate_(0) {}

SampleBuffer::SampleBuffer(std::shared_ptr<const ChannelData> data, int sample_rate)
    : data_(std::move(data)), sample_rate_(sample_rate) {}

SampleBuffer SampleBuffer::from_vector(std::vector<float> samples, int sample_rate) {
  KEYBEAT_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  auto data = std::make_shared<ChannelData>();
  data->push_back(std::move(samples));
  return SampleBuffer(data, sample_rate);
}

SampleBuffer SampleBuffer::from_buffer(const float* samples, size_t size, int sample_rate) {
  KEYBEAT_CHECK(samples != nullptr || size == 0, ErrorCode::InvalidParameter);
  if (size == 0) {
    return from_vector({}, sample_rate);
  }
  return from_vector(std::vector<float>(samples, samples + size), sample_rate);
}

SampleBuffer SampleBuffer::from_channels(std::vector<std::vector<float>> channels,
                                         int sample_rate) {
  KEYBEAT_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  KEYBEAT_CHECK_MSG(!channels.empty(), ErrorCode::InvalidParameter,
                    "Sample buffer needs at least one channel");
  const size_t length = channels.front().size();
  for (const auto& ch : channels) {
    KEYBEAT_CHECK_MSG(ch.size() == length, ErrorCode::InvalidParameter,
                      "Channel lengths differ: " + std::to_string(ch.size()) + " vs " +
                          std::to_string(length));
  }
  auto data = std::make_shared<ChannelData>(std::move(channels));
  return SampleBuffer(data, sample_rate);
}

SampleBuffer SampleBuffer::from_interleaved(const float* data, size_t frames, int channels,
                                            int sample_rate) {
  KEYBEAT_CHECK(channels > 0, ErrorCode::InvalidParameter);
  KEYBEAT_CHECK(data != nullptr || frames == 0, ErrorCode::InvalidParameter);

  ChannelData split(static_cast<size_t>(channels), std::vector<float>(frames));
  for (size_t i = 0; i < frames; ++i) {
    for (int ch = 0; ch < channels; ++ch) {
      split[ch][i] = data[i * channels + ch];
    }
  }
  return from_channels(std::move(split), sample_rate);
}

const float* SampleBuffer::channel(int index) const {
  KEYBEAT_CHECK(index >= 0 && index < channels(), ErrorCode::InvalidParameter);
  return (*data_)[index].data();
}

int SampleBuffer::channels() const {
  if (!data_) {
    return 0;
  }
  return static_cast<int>(data_->size());
}

size_t SampleBuffer::size() const {
  if (!data_ || data_->empty()) {
    return 0;
  }
  return data_->front().size();
}

float SampleBuffer::duration() const {
  if (sample_rate_ == 0) {
    return 0.0f;
  }
  return static_cast<float>(size()) / static_cast<float>(sample_rate_);
}

std::vector<float> SampleBuffer::mono_mix() const {
  if (empty()) {
    return {};
  }

  const int n_channels = channels();
  if (n_channels == 1) {
    return data_->front();
  }

  const size_t length = size();
  std::vector<float> mono(length, 0.0f);
  for (const auto& ch : *data_) {
    for (size_t i = 0; i < length; ++i) {
      mono[i] += ch[i];
    }
  }
  const float scale = 1.0f / static_cast<float>(n_channels);
  for (float& v : mono) {
    v *= scale;
  }
  return mono;
}

}  // namespace keybeat
