/// @file media_probe_test.cpp
/// @brief Tests for probe log parsing and media names.

#include "pipeline/media_probe.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <string>

using namespace keybeat;
using Catch::Matchers::WithinAbs;

namespace {

const char* const kMp3Log =
    "Input #0, mp3, from 'input.mp3':\n"
    "  Metadata:\n"
    "    title           : Night Drive\n"
    "    encoder         : Lavf58.76.100\n"
    "  Duration: 00:03:25.47, start: 0.025057, bitrate: 320 kb/s\n"
    "  Stream #0:0: Audio: mp3, 44100 Hz, stereo, fltp, 320 kb/s\n"
    "At least one output file must be specified\n";

const char* const kMovieLog =
    "Input #0, mov,mp4,m4a,3gp,3g2,mj2, from 'input.mp4':\n"
    "  Duration: 01:02:03.04, start: 0.000000, bitrate: 2500 kb/s\n"
    "  Stream #0:0(und): Video: h264 (High) (avc1 / 0x31637661), yuv420p, 1920x1080, "
    "2300 kb/s, 25 fps, 25 tbr, 12800 tbn (default)\r\n"
    "  Stream #0:1(eng): Audio: aac (LC) (mp4a / 0x6134706D), 48000 Hz, 5.1(side), fltp, "
    "384 kb/s (default)\r\n"
    "  Stream #0:2(jpn): Audio: aac (LC) (mp4a / 0x6134706D), 44100 Hz, stereo, fltp, "
    "128 kb/s\r\n";

}  // namespace

TEST_CASE("parse_probe_log mp3 banner", "[media_probe]") {
  MediaInfo info = parse_probe_log(kMp3Log);

  REQUIRE(info.has_audio());
  REQUIRE_THAT(info.duration, WithinAbs(205.47f, 1e-3f));
  REQUIRE(info.bitrate == 320);
  REQUIRE(info.codec == "mp3");
  REQUIRE(info.sample_rate == 44100);
  REQUIRE(info.channels == 2);
  REQUIRE(info.bit_depth == 32);
}

TEST_CASE("parse_probe_log keeps the first audio stream", "[media_probe]") {
  MediaInfo info = parse_probe_log(kMovieLog);

  REQUIRE_THAT(info.duration, WithinAbs(3723.04f, 1e-2f));
  REQUIRE(info.bitrate == 2500);
  REQUIRE(info.codec == "aac");
  REQUIRE(info.sample_rate == 48000);
  REQUIRE(info.channels == 6);
  REQUIRE(info.bit_depth == 32);
}

TEST_CASE("parse_probe_line stream layouts and formats", "[media_probe]") {
  SECTION("PCM with a channel count") {
    MediaInfo info;
    REQUIRE(parse_probe_line(
        "  Stream #0:0: Audio: pcm_s16le ([1][0][0][0] / 0x0001), 44100 Hz, 2 channels, s16, "
        "1411 kb/s",
        info));
    REQUIRE(info.codec == "pcm_s16le");
    REQUIRE(info.channels == 2);
    REQUIRE(info.bit_depth == 16);
  }

  SECTION("FLAC with its real depth in parentheses") {
    MediaInfo info;
    REQUIRE(parse_probe_line("  Stream #0:0: Audio: flac, 96000 Hz, mono, s32 (24 bit)", info));
    REQUIRE(info.sample_rate == 96000);
    REQUIRE(info.channels == 1);
    REQUIRE(info.bit_depth == 24);
  }

  SECTION("7.1 layout") {
    MediaInfo info;
    REQUIRE(parse_probe_line("    Stream #0:1: Audio: eac3, 48000 Hz, 7.1, fltp, 768 kb/s", info));
    REQUIRE(info.channels == 8);
  }

  SECTION("unknown layout is not a stream line") {
    MediaInfo info;
    REQUIRE_FALSE(parse_probe_line("  Stream #0:0: Audio: opus, 48000 Hz, quad, fltp", info));
    REQUIRE_FALSE(info.has_audio());
  }

  SECTION("metadata mentioning audio is ignored") {
    MediaInfo info;
    REQUIRE_FALSE(parse_probe_line("    comment         : Audio: remastered 2019", info));
    REQUIRE(info.codec.empty());
  }

  SECTION("unavailable duration and bitrate") {
    MediaInfo info;
    REQUIRE_FALSE(parse_probe_line("  Duration: N/A, start: 0.000000, bitrate: N/A", info));
    REQUIRE(info.duration == 0.0f);
    REQUIRE(info.bitrate == 0);
  }
}

TEST_CASE("parse_probe_log without audio", "[media_probe]") {
  MediaInfo info = parse_probe_log("input.txt: Invalid data found when processing input\n");
  REQUIRE_FALSE(info.has_audio());
  REQUIRE(info.codec.empty());
  REQUIRE(info.duration == 0.0f);

  REQUIRE_FALSE(parse_probe_log("").has_audio());
}

TEST_CASE("sample_format_bit_depth", "[media_probe]") {
  REQUIRE(sample_format_bit_depth("s16") == 16);
  REQUIRE(sample_format_bit_depth("s16p") == 16);
  REQUIRE(sample_format_bit_depth("s24") == 24);
  REQUIRE(sample_format_bit_depth("s32p") == 32);
  REQUIRE(sample_format_bit_depth("flt") == 32);
  REQUIRE(sample_format_bit_depth("fltp") == 32);
  REQUIRE(sample_format_bit_depth("dblp") == 64);
  REQUIRE(sample_format_bit_depth("u8") == 16);
}

TEST_CASE("file_name_from_url", "[media_probe]") {
  REQUIRE(file_name_from_url("https://cdn.example.com/music/night-drive.mp3") ==
          "night-drive.mp3");
  REQUIRE(file_name_from_url("https://example.com/a/b/clip.mp4?token=abc#t=10") == "clip.mp4");
  REQUIRE(file_name_from_url("http://example.com:8080/track%20one.flac") == "track%20one.flac");
  REQUIRE(file_name_from_url("file:///home/user/song.wav") == "song.wav");

  REQUIRE(file_name_from_url("https://example.com/music/").empty());
  REQUIRE(file_name_from_url("https://example.com").empty());
  REQUIRE(file_name_from_url("https://example.com?file=a.mp3").empty());
  REQUIRE(file_name_from_url("not a url").empty());
  REQUIRE(file_name_from_url("/local/path/song.mp3").empty());
  REQUIRE(file_name_from_url("://example.com/song.mp3").empty());
}

TEST_CASE("source_file_name", "[media_probe]") {
  REQUIRE(source_file_name("https://example.com/live/set.m4a") == "set.m4a");
  REQUIRE(source_file_name("https://example.com/") == "media");
  REQUIRE(source_file_name("recordings/take2.wav") == "recordings/take2.wav");
}
