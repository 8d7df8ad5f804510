#include "pipeline/media_probe.h"

#include <cctype>
#include <sstream>
#include <vector>

namespace keybeat {

namespace {

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

bool is_word_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

/// @brief Reads a run of 1..9 digits at pos and advances past it.
bool read_number(const std::string& s, size_t& pos, int& value) {
  size_t start = pos;
  int v = 0;
  while (pos < s.size() && is_digit(s[pos])) {
    if (pos - start == 9) {
      return false;
    }
    v = v * 10 + (s[pos] - '0');
    ++pos;
  }
  value = v;
  return pos > start;
}

/// @brief Reads exactly `count` digits at pos.
bool read_digits(const std::string& s, size_t& pos, size_t count, int& value) {
  size_t start = pos;
  return read_number(s, pos, value) && pos - start == count;
}

bool expect(const std::string& s, size_t& pos, const std::string& text) {
  if (s.compare(pos, text.size(), text) != 0) {
    return false;
  }
  pos += text.size();
  return true;
}

std::string leading_word(const std::string& s) {
  size_t end = 0;
  while (end < s.size() && is_word_char(s[end])) {
    ++end;
  }
  return s.substr(0, end);
}

std::vector<std::string> split_fields(const std::string& s) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    size_t comma = s.find(", ", start);
    if (comma == std::string::npos) {
      fields.push_back(s.substr(start));
      return fields;
    }
    fields.push_back(s.substr(start, comma - start));
    start = comma + 2;
  }
}

/// @brief Channel count of a layout field, or 0 if it is not a layout.
int layout_channels(const std::string& field) {
  if (field == "mono") return 1;
  if (field == "stereo") return 2;

  auto named = [&field](const char* name) {
    return starts_with(field, name) && (field.size() == 3 || field[3] == '(');
  };
  if (named("5.1")) return 6;
  if (named("7.1")) return 8;

  size_t pos = 0;
  int count = 0;
  if (read_number(field, pos, count) && expect(field, pos, " channels") && pos == field.size()) {
    return count;
  }
  return 0;
}

/// @brief Bit depth of a format field such as "s16", "fltp" or "s32 (24 bit)".
int format_bit_depth(const std::string& field) {
  size_t paren = field.find('(');
  if (paren != std::string::npos) {
    size_t pos = paren + 1;
    int bits = 0;
    if (read_number(field, pos, bits) && expect(field, pos, " bit)") && bits > 0) {
      return bits;
    }
  }
  return sample_format_bit_depth(leading_word(field));
}

bool parse_duration(const std::string& line, MediaInfo& info) {
  size_t pos = line.find("Duration: ");
  if (pos == std::string::npos) {
    return false;
  }
  pos += 10;

  int hours = 0, minutes = 0, seconds = 0, centis = 0;
  if (!read_digits(line, pos, 2, hours) || !expect(line, pos, ":") ||
      !read_digits(line, pos, 2, minutes) || !expect(line, pos, ":") ||
      !read_digits(line, pos, 2, seconds) || !expect(line, pos, ".") ||
      !read_digits(line, pos, 2, centis)) {
    return false;
  }
  info.duration = static_cast<float>(hours * 3600 + minutes * 60 + seconds) + centis / 100.0f;
  return true;
}

bool parse_bitrate(const std::string& line, MediaInfo& info) {
  size_t pos = line.find("bitrate: ");
  if (pos == std::string::npos) {
    return false;
  }
  pos += 9;

  int kbps = 0;
  if (!read_number(line, pos, kbps) || !expect(line, pos, " kb/s")) {
    return false;
  }
  info.bitrate = kbps;
  return true;
}

bool parse_audio_stream(const std::string& line, MediaInfo& info) {
  size_t pos = line.find("Audio: ");
  if (pos == std::string::npos || info.has_audio()) {
    return false;
  }

  std::string rest = line.substr(pos + 7);
  std::string codec = leading_word(rest);
  if (codec.empty()) {
    return false;
  }

  // <codec details>, <rate> Hz, <layout>, <format>[, ...]
  std::vector<std::string> fields = split_fields(rest.substr(codec.size()));
  for (size_t i = 1; i + 2 < fields.size(); ++i) {
    size_t p = 0;
    int rate = 0;
    if (!read_number(fields[i], p, rate) || !expect(fields[i], p, " Hz") ||
        p != fields[i].size()) {
      continue;
    }
    int channels = layout_channels(fields[i + 1]);
    if (channels == 0 || leading_word(fields[i + 2]).empty()) {
      continue;
    }

    info.codec = codec;
    info.sample_rate = rate;
    info.channels = channels;
    info.bit_depth = format_bit_depth(fields[i + 2]);
    return true;
  }
  return false;
}

}  // namespace

int sample_format_bit_depth(const std::string& format) {
  auto has = [&format](const char* part) { return format.find(part) != std::string::npos; };
  if (has("16")) return 16;
  if (has("24")) return 24;
  if (has("32") || has("flt")) return 32;
  if (has("dbl")) return 64;
  return 16;
}

bool parse_probe_line(const std::string& line, MediaInfo& info) {
  bool duration = parse_duration(line, info);
  bool bitrate = parse_bitrate(line, info);
  bool audio = parse_audio_stream(line, info);
  return duration || bitrate || audio;
}

MediaInfo parse_probe_log(const std::string& log) {
  MediaInfo info;
  std::istringstream stream(log);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    parse_probe_line(line, info);
  }
  return info;
}

std::string file_name_from_url(const std::string& url) {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0 ||
      !std::isalpha(static_cast<unsigned char>(url[0]))) {
    return "";
  }
  for (size_t i = 1; i < scheme_end; ++i) {
    char c = url[i];
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
      return "";
    }
  }

  size_t path_start = url.find_first_of("/?#", scheme_end + 3);
  if (path_start == std::string::npos || url[path_start] != '/') {
    return "";
  }
  size_t path_end = url.find_first_of("?#", path_start);
  if (path_end == std::string::npos) {
    path_end = url.size();
  }

  size_t slash = url.rfind('/', path_end - 1);
  return url.substr(slash + 1, path_end - slash - 1);
}

std::string source_file_name(const std::string& source) {
  if (source.find("://") == std::string::npos) {
    return source;
  }
  std::string name = file_name_from_url(source);
  return name.empty() ? "media" : name;
}

}  // namespace keybeat
