#pragma once

/// @file export_format.h
/// @brief Export targets and argument lists for the external transcoder (ffmpeg).
/// @details keybeat does not encode audio itself. These helpers describe what a host
///          application passes to the transcoder, so every front end uses the same settings.

#include <string>
#include <vector>

namespace keybeat {

/// @brief Export container/codec.
enum class ExportFormat {
  Flac,  ///< Lossless FLAC, max compression, 32-bit samples
  Wav,   ///< 24-bit PCM WAV
  Mp3,   ///< LAME MP3 at 320 kbit/s
  Aac,   ///< AAC at 256 kbit/s in an .m4a container
};

/// @brief Parses a format name ("flac", "wav", "mp3", "aac"; case-insensitive).
/// @throws KeybeatException(InvalidParameter) with "Unsupported format: <name>"
ExportFormat parse_export_format(const std::string& name);

/// @brief Returns the lowercase format name ("flac", "wav", "mp3", "aac").
const char* export_format_name(ExportFormat format);

/// @brief Returns the file extension without dot ("aac" maps to "m4a").
const char* export_file_extension(ExportFormat format);

/// @brief Returns the MIME type ("audio/flac", "audio/wav", "audio/mpeg", "audio/mp4").
const char* export_mime_type(ExportFormat format);

/// @brief Returns the extension of a file name including the dot (".mp4"), or "".
std::string file_extension(const std::string& file_name);

/// @brief Builds the download name for an exported file.
/// @details "<base>.<ext>" where base is source_name without its extension. Without a
///          source name the result is "audio.<format name>".
std::string export_file_name(const std::string& source_name, ExportFormat format);

/// @brief Returns the transcoder output name ("output.flac", ..., "output.m4a").
std::string transcode_output_name(ExportFormat format);

/// @brief Builds the transcoder arguments converting extracted audio to a format.
/// @param format Target format
/// @param input Input file name
/// @param output Output file name
std::vector<std::string> transcode_arguments(ExportFormat format, const std::string& input,
                                             const std::string& output);

/// @brief Builds the transcoder arguments that print stream information for a file.
std::vector<std::string> probe_arguments(const std::string& input);

/// @brief Sample rate used for extraction: 44100 is kept, anything else becomes 48000.
int extraction_sample_rate(int source_rate);

/// @brief Builds the arguments extracting audio as 24-bit stereo PCM WAV without video.
std::vector<std::string> extraction_arguments(const std::string& input, const std::string& output,
                                              int source_rate);

}  // namespace keybeat
