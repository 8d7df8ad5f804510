#pragma once

/// @file media_probe.h
/// @brief Stream facts from the transcoder's probe output, and media names from URLs.
/// @details The host runs the transcoder with probe_arguments() and hands its log here.
///          Lines look like
///          @code
///            Duration: 00:03:25.47, start: 0.025057, bitrate: 320 kb/s
///              Stream #0:0: Audio: mp3, 44100 Hz, stereo, fltp, 320 kb/s
///          @endcode

#include <string>

namespace keybeat {

/// @brief Facts about the source media reported by the probe.
/// @details Fields the log never mentions stay at their zero value.
struct MediaInfo {
  float duration = 0.0f;  ///< Container duration in seconds
  std::string codec;      ///< Audio codec name ("mp3", "aac", "pcm_s16le", ...)
  int sample_rate = 0;    ///< Audio sample rate in Hz
  int channels = 0;       ///< Channel count (mono 1, stereo 2, 5.1 6, 7.1 8)
  int bit_depth = 0;      ///< Bits per sample derived from the sample format
  int bitrate = 0;        ///< Container bitrate in kb/s

  /// @brief Returns true once an audio stream line was parsed.
  bool has_audio() const { return sample_rate > 0; }
};

/// @brief Merges the facts found in one log line into info.
/// @details Recognizes the "Duration: HH:MM:SS.cc" line (duration and "bitrate: N kb/s")
///          and "Audio: <codec>..., N Hz, <layout>, <format>" stream lines. Layouts are
///          mono, stereo, 5.1, 7.1 (with an optional "(side)"-style suffix) and "N channels".
///          An audio line only counts when info has no audio stream yet.
/// @return true if the line contributed anything
bool parse_probe_line(const std::string& line, MediaInfo& info);

/// @brief Parses a complete probe log (one message per line).
MediaInfo parse_probe_log(const std::string& log);

/// @brief Bits per sample for a transcoder sample format name.
/// @details "s16"/"s16p" 16, "s24" 24, "s32"/"flt"/"fltp" 32, "dbl"/"dblp" 64; anything
///          else is taken as 16.
int sample_format_bit_depth(const std::string& format);

/// @brief Returns the last path segment of a URL ("https://host/a/song.mp3?x=1" gives
///        "song.mp3").
/// @return The segment, or "" if the URL has no scheme, no path or a path ending in '/'
std::string file_name_from_url(const std::string& url);

/// @brief Name used for exports of a source given as a path or a URL.
/// @details URLs use file_name_from_url, falling back to "media". Paths are returned as is.
std::string source_file_name(const std::string& source);

}  // namespace keybeat
