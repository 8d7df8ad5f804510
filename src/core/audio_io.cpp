#include "core/audio_io.h"

#include <algorithm>
#include <fstream>
#include <vector>

#include "util/exception.h"

#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

namespace keybeat {

namespace {

/// @brief Reads an entire file into memory.
std::vector<uint8_t> read_file(const std::string& path, size_t max_size) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  KEYBEAT_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  auto size = file.tellg();
  KEYBEAT_CHECK_MSG(size >= 0, ErrorCode::DecodeFailed, "Failed to read file: " + path);
  KEYBEAT_CHECK_MSG(max_size == 0 || static_cast<size_t>(size) <= max_size,
                    ErrorCode::InvalidParameter,
                    "File too large: " + std::to_string(size) + " bytes (max: " +
                        std::to_string(max_size) + " bytes)");
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(size));
  file.read(reinterpret_cast<char*>(buffer.data()), size);
  KEYBEAT_CHECK_MSG(file.good(), ErrorCode::DecodeFailed, "Failed to read file: " + path);
  return buffer;
}

/// @brief Closes a dr_wav handle on scope exit.
struct WavGuard {
  drwav* wav;
  ~WavGuard() { drwav_uninit(wav); }
};

}  // namespace

AudioFormat detect_format(const uint8_t* data, size_t size) {
  if (size < 12) {
    return AudioFormat::Unknown;
  }
  if (data[0] == 'R' && data[1] == 'I' && data[2] == 'F' && data[3] == 'F' && data[8] == 'W' &&
      data[9] == 'A' && data[10] == 'V' && data[11] == 'E') {
    return AudioFormat::WAV;
  }
  return AudioFormat::Unknown;
}

SampleBuffer load_buffer_wav(const uint8_t* data, size_t size) {
  drwav wav;
  drwav_bool32 ok = drwav_init_memory(&wav, data, size, nullptr);
  KEYBEAT_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to parse WAV data");
  WavGuard guard{&wav};

  const int channels = static_cast<int>(wav.channels);
  const int sample_rate = static_cast<int>(wav.sampleRate);
  KEYBEAT_CHECK_MSG(channels > 0 && sample_rate > 0, ErrorCode::DecodeFailed,
                    "Invalid WAV header");

  std::vector<float> interleaved(static_cast<size_t>(wav.totalPCMFrameCount) * channels);
  drwav_uint64 frames_read =
      drwav_read_pcm_frames_f32(&wav, wav.totalPCMFrameCount, interleaved.data());
  KEYBEAT_CHECK_MSG(frames_read > 0, ErrorCode::DecodeFailed, "No audio frames in WAV data");

  return SampleBuffer::from_interleaved(interleaved.data(), static_cast<size_t>(frames_read),
                                        channels, sample_rate);
}

SampleBuffer load_wav(const std::string& path, const AudioLoadOptions& options) {
  std::vector<uint8_t> data = read_file(path, options.max_file_size);
  KEYBEAT_CHECK_MSG(detect_format(data.data(), data.size()) == AudioFormat::WAV,
                    ErrorCode::InvalidFormat, "Not a WAV file: " + path);
  return load_buffer_wav(data.data(), data.size());
}

void save_wav(const std::string& path, const SampleBuffer& buffer, int bits_per_sample) {
  KEYBEAT_CHECK_MSG(!buffer.empty(), ErrorCode::InvalidParameter, "No samples to save");
  KEYBEAT_CHECK_MSG(bits_per_sample == 16 || bits_per_sample == 24, ErrorCode::InvalidParameter,
                    "bits_per_sample must be 16 or 24");

  const int channels = buffer.channels();
  const size_t frames = buffer.size();

  drwav_data_format format;
  format.container = drwav_container_riff;
  format.format = DR_WAVE_FORMAT_PCM;
  format.channels = static_cast<drwav_uint32>(channels);
  format.sampleRate = static_cast<drwav_uint32>(buffer.sample_rate());
  format.bitsPerSample = static_cast<drwav_uint32>(bits_per_sample);

  drwav wav;
  drwav_bool32 ok = drwav_init_file_write(&wav, path.c_str(), &format, nullptr);
  KEYBEAT_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to create WAV file: " + path);

  // Packed little-endian PCM, frame-interleaved
  const int bytes = bits_per_sample / 8;
  const float scale = bits_per_sample == 16 ? 32767.0f : 8388607.0f;
  std::vector<uint8_t> pcm(frames * channels * bytes);
  size_t pos = 0;
  for (size_t i = 0; i < frames; ++i) {
    for (int ch = 0; ch < channels; ++ch) {
      float clamped = std::max(-1.0f, std::min(1.0f, buffer.channel(ch)[i]));
      int32_t value = static_cast<int32_t>(clamped * scale);
      for (int b = 0; b < bytes; ++b) {
        pcm[pos++] = static_cast<uint8_t>((static_cast<uint32_t>(value) >> (8 * b)) & 0xFF);
      }
    }
  }

  drwav_uint64 written = drwav_write_pcm_frames(&wav, frames, pcm.data());
  drwav_uninit(&wav);
  KEYBEAT_CHECK_MSG(written == frames, ErrorCode::DecodeFailed, "Failed to write all samples");
}

}  // namespace keybeat
