/// @file audio_io_test.cpp
/// @brief Tests for WAV loading and saving.

#include "core/audio_io.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "util/exception.h"

using namespace keybeat;
using Catch::Matchers::WithinAbs;

namespace {

std::string temp_path(const std::string& name) { return "keybeat_test_" + name; }

void write_bytes(const std::string& path, const std::string& bytes) {
  std::ofstream file(path, std::ios::binary);
  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

SampleBuffer stereo_ramp(int sr, size_t frames) {
  std::vector<float> left(frames);
  std::vector<float> right(frames);
  for (size_t i = 0; i < frames; ++i) {
    left[i] = 0.5f * std::sin(0.01f * static_cast<float>(i));
    right[i] = -0.25f;
  }
  return SampleBuffer::from_channels({std::move(left), std::move(right)}, sr);
}

}  // namespace

TEST_CASE("detect_format", "[audio_io]") {
  const uint8_t wav[] = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
  const uint8_t other[] = {'I', 'D', '3', 4, 0, 0, 0, 0, 0, 0, 0, 0};
  REQUIRE(detect_format(wav, sizeof(wav)) == AudioFormat::WAV);
  REQUIRE(detect_format(other, sizeof(other)) == AudioFormat::Unknown);
  REQUIRE(detect_format(wav, 4) == AudioFormat::Unknown);
}

TEST_CASE("save_wav and load_wav", "[audio_io]") {
  SampleBuffer original = stereo_ramp(44100, 4410);

  SECTION("16 bit") {
    std::string path = temp_path("stereo16.wav");
    save_wav(path, original, 16);
    SampleBuffer loaded = load_wav(path);
    std::remove(path.c_str());

    REQUIRE(loaded.channels() == 2);
    REQUIRE(loaded.sample_rate() == 44100);
    REQUIRE(loaded.size() == original.size());
    for (size_t i = 0; i < loaded.size(); i += 97) {
      REQUIRE_THAT(loaded.channel(0)[i], WithinAbs(original.channel(0)[i], 1e-3f));
      REQUIRE_THAT(loaded.channel(1)[i], WithinAbs(-0.25f, 1e-3f));
    }
  }

  SECTION("24 bit") {
    std::string path = temp_path("stereo24.wav");
    save_wav(path, original, 24);
    SampleBuffer loaded = load_wav(path);
    std::remove(path.c_str());

    REQUIRE(loaded.channels() == 2);
    REQUIRE(loaded.size() == original.size());
    REQUIRE_THAT(loaded.channel(0)[1000], WithinAbs(original.channel(0)[1000], 1e-5f));
  }
}

TEST_CASE("save_wav rejects bad input", "[audio_io]") {
  REQUIRE_THROWS_AS(save_wav(temp_path("empty.wav"), SampleBuffer()), KeybeatException);
  REQUIRE_THROWS_AS(save_wav(temp_path("bits.wav"), stereo_ramp(44100, 100), 8),
                    KeybeatException);
}

TEST_CASE("load_wav errors", "[audio_io]") {
  SECTION("missing file") {
    try {
      load_wav(temp_path("does_not_exist.wav"));
      FAIL("expected FileNotFound");
    } catch (const KeybeatException& e) {
      REQUIRE(e.code() == ErrorCode::FileNotFound);
    }
  }

  SECTION("not a WAV file") {
    std::string path = temp_path("not_wav.bin");
    write_bytes(path, "ID3 this is not a wave file");
    try {
      load_wav(path);
      FAIL("expected InvalidFormat");
    } catch (const KeybeatException& e) {
      REQUIRE(e.code() == ErrorCode::InvalidFormat);
    }
    std::remove(path.c_str());
  }

  SECTION("truncated WAV") {
    std::string path = temp_path("truncated.wav");
    write_bytes(path, std::string("RIFF\x04\x00\x00\x00WAVE", 12));
    try {
      load_wav(path);
      FAIL("expected DecodeFailed");
    } catch (const KeybeatException& e) {
      REQUIRE(e.code() == ErrorCode::DecodeFailed);
    }
    std::remove(path.c_str());
  }

  SECTION("size limit") {
    std::string path = temp_path("limit.wav");
    save_wav(path, stereo_ramp(44100, 1000));
    AudioLoadOptions options;
    options.max_file_size = 16;
    try {
      load_wav(path, options);
      FAIL("expected InvalidParameter");
    } catch (const KeybeatException& e) {
      REQUIRE(e.code() == ErrorCode::InvalidParameter);
    }
    std::remove(path.c_str());
  }
}
