#pragma once

/// @file audio_io.h
/// @brief WAV loading and saving using dr_wav.

#include <cstddef>
#include <cstdint>
#include <string>

#include "core/sample_buffer.h"

namespace keybeat {

/// @brief Detected audio container.
enum class AudioFormat {
  Unknown,
  WAV,
};

/// @brief Options for audio loading.
struct AudioLoadOptions {
  /// @brief Maximum file size in bytes (0 = no limit).
  size_t max_file_size = 500 * 1024 * 1024;
};

/// @brief Detects the container from a buffer header ("RIFF....WAVE").
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Decodes WAV data from memory, keeping every channel.
/// @param data Pointer to WAV data
/// @param size Size of data in bytes
/// @return Buffer with samples normalized to [-1, 1]
/// @throws KeybeatException(DecodeFailed) on malformed data or no audio frames
SampleBuffer load_buffer_wav(const uint8_t* data, size_t size);

/// @brief Loads a WAV file from disk.
/// @throws KeybeatException(FileNotFound) if the file cannot be opened,
///         KeybeatException(InvalidFormat) if it is not a WAV file,
///         KeybeatException(InvalidParameter) if it exceeds options.max_file_size,
///         KeybeatException(DecodeFailed) on decode error
SampleBuffer load_wav(const std::string& path, const AudioLoadOptions& options = AudioLoadOptions());

/// @brief Saves a buffer as PCM WAV (16 or 24 bit), all channels interleaved.
/// @throws KeybeatException(InvalidParameter) on empty buffer or bad bit depth,
///         KeybeatException(DecodeFailed) on write error
void save_wav(const std::string& path, const SampleBuffer& buffer, int bits_per_sample = 16);

}  // namespace keybeat
