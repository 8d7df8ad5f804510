#include "pipeline/export_format.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

#include "util/exception.h"

namespace keybeat {

namespace {

void append(std::vector<std::string>& args, std::initializer_list<const char*> values) {
  for (const char* v : values) {
    args.emplace_back(v);
  }
}

}  // namespace

ExportFormat parse_export_format(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "flac") return ExportFormat::Flac;
  if (lower == "wav") return ExportFormat::Wav;
  if (lower == "mp3") return ExportFormat::Mp3;
  if (lower == "aac") return ExportFormat::Aac;
  throw KeybeatException(ErrorCode::InvalidParameter, "Unsupported format: " + name);
}

const char* export_format_name(ExportFormat format) {
  switch (format) {
    case ExportFormat::Flac:
      return "flac";
    case ExportFormat::Wav:
      return "wav";
    case ExportFormat::Mp3:
      return "mp3";
    case ExportFormat::Aac:
      return "aac";
  }
  return "";
}

const char* export_file_extension(ExportFormat format) {
  return format == ExportFormat::Aac ? "m4a" : export_format_name(format);
}

const char* export_mime_type(ExportFormat format) {
  switch (format) {
    case ExportFormat::Flac:
      return "audio/flac";
    case ExportFormat::Wav:
      return "audio/wav";
    case ExportFormat::Mp3:
      return "audio/mpeg";
    case ExportFormat::Aac:
      return "audio/mp4";
  }
  return "application/octet-stream";
}

std::string file_extension(const std::string& file_name) {
  size_t dot = file_name.find_last_of('.');
  if (dot == std::string::npos || dot + 1 == file_name.size()) {
    return "";
  }
  // A dot inside a directory component is not an extension
  if (file_name.find('/', dot) != std::string::npos) {
    return "";
  }
  return file_name.substr(dot);
}

std::string export_file_name(const std::string& source_name, ExportFormat format) {
  if (source_name.empty()) {
    return std::string("audio.") + export_format_name(format);
  }
  std::string extension = file_extension(source_name);
  std::string base = source_name.substr(0, source_name.size() - extension.size());
  return base + "." + export_file_extension(format);
}

std::string transcode_output_name(ExportFormat format) {
  return std::string("output.") + export_file_extension(format);
}

std::vector<std::string> transcode_arguments(ExportFormat format, const std::string& input,
                                             const std::string& output) {
  std::vector<std::string> args = {"-i", input};
  switch (format) {
    case ExportFormat::Flac:
      append(args, {"-acodec", "flac", "-compression_level", "8", "-sample_fmt", "s32"});
      break;
    case ExportFormat::Wav:
      append(args, {"-acodec", "pcm_s24le"});
      break;
    case ExportFormat::Mp3:
      append(args, {"-acodec", "libmp3lame", "-b:a", "320k", "-q:a", "0"});
      break;
    case ExportFormat::Aac:
      append(args, {"-acodec", "aac", "-b:a", "256k", "-movflags", "+faststart"});
      break;
  }
  args.push_back(output);
  return args;
}

std::vector<std::string> probe_arguments(const std::string& input) {
  return {"-i", input, "-hide_banner"};
}

int extraction_sample_rate(int source_rate) { return source_rate == 44100 ? 44100 : 48000; }

std::vector<std::string> extraction_arguments(const std::string& input, const std::string& output,
                                              int source_rate) {
  return {"-i",  input, "-vn", "-acodec", "pcm_s24le", "-ar",
          std::to_string(extraction_sample_rate(source_rate)),
          "-ac", "2",   output};
}

}  // namespace keybeat
