/// @file keybeat_cli.cpp
/// @brief Command-line interface for keybeat tempo and key detection.

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "core/audio_io.h"
#include "keybeat.h"

using namespace keybeat;

// ============================================================================
// JSON Builder - Fluent interface for building JSON output
// ============================================================================

class JsonBuilder {
 public:
  JsonBuilder& begin_object() {
    append_separator();
    ss_ << "{";
    needs_comma_.push_back(false);
    return *this;
  }

  JsonBuilder& end_object() {
    ss_ << "}";
    needs_comma_.pop_back();
    if (!needs_comma_.empty()) needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& begin_array() {
    append_separator();
    ss_ << "[";
    needs_comma_.push_back(false);
    return *this;
  }

  JsonBuilder& end_array() {
    ss_ << "]";
    needs_comma_.pop_back();
    if (!needs_comma_.empty()) needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& key(const std::string& k) {
    append_separator();
    ss_ << "\"" << escape(k) << "\": ";
    needs_comma_.back() = false;
    return *this;
  }

  JsonBuilder& value(const std::string& v) {
    append_separator();
    ss_ << "\"" << escape(v) << "\"";
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(const char* v) { return value(std::string(v)); }

  JsonBuilder& value(int v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(float v) {
    append_separator();
    ss_ << v;
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& value(bool v) {
    append_separator();
    ss_ << (v ? "true" : "false");
    needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& kv(const std::string& k, const std::string& v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, const char* v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, int v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, float v) { return key(k).value(v); }
  JsonBuilder& kv(const std::string& k, bool v) { return key(k).value(v); }

  JsonBuilder& float_array(const std::vector<float>& arr) {
    begin_array();
    for (float v : arr) value(v);
    end_array();
    return *this;
  }

  JsonBuilder& string_array(const std::vector<std::string>& arr) {
    begin_array();
    for (const auto& v : arr) value(v);
    end_array();
    return *this;
  }

  void print() const { std::cout << ss_.str() << "\n"; }

 private:
  void append_separator() {
    if (!needs_comma_.empty() && needs_comma_.back()) {
      ss_ << ", ";
    }
  }

  static std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
      switch (c) {
        case '"':
          result += "\\\"";
          break;
        case '\\':
          result += "\\\\";
          break;
        case '\n':
          result += "\\n";
          break;
        default:
          result += c;
      }
    }
    return result;
  }

  std::ostringstream ss_;
  std::vector<bool> needs_comma_;
};

// ============================================================================
// CLI Arguments
// ============================================================================

struct CliArgs {
  std::string input_file;
  std::string export_format;
  std::string probe_log_file;
  std::string source;
  int waveform_points = 0;
  bool json_output = false;
  bool verbose = false;
  bool help = false;
  bool version = false;
};

/// @brief Parses argv; returns false (with a message on stderr) on malformed input.
bool parse_args(int argc, char* argv[], CliArgs& args) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
    } else if (arg == "--version") {
      args.version = true;
    } else if (arg == "--json") {
      args.json_output = true;
    } else if (arg == "--verbose" || arg == "-v") {
      args.verbose = true;
    } else if (arg == "--waveform" && i + 1 < argc) {
      args.waveform_points = std::atoi(argv[++i]);
      if (args.waveform_points <= 0) {
        std::cerr << "Error: --waveform needs a positive number of points\n";
        return false;
      }
    } else if (arg == "--export" && i + 1 < argc) {
      args.export_format = argv[++i];
    } else if (arg == "--probe-log" && i + 1 < argc) {
      args.probe_log_file = argv[++i];
    } else if (arg == "--source" && i + 1 < argc) {
      args.source = argv[++i];
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Error: Unknown option '" << arg << "'\n";
      return false;
    } else if (args.input_file.empty()) {
      args.input_file = arg;
    }
  }
  return true;
}

// ============================================================================
// Progress Reporting
// ============================================================================

class StderrObserver : public AnalysisObserver {
 public:
  void on_stage(const std::string& stage) override { std::cerr << stage << "\n"; }
  void on_progress(int percent) override { std::cerr << "  " << percent << "%\n"; }
};

// ============================================================================
// Output
// ============================================================================

struct ExportPlan {
  ExportFormat format;
  std::string file_name;
  std::vector<std::string> arguments;
};

ExportPlan make_export_plan(const std::string& name, const std::string& source) {
  ExportPlan plan{parse_export_format(name), "", {}};
  plan.file_name = export_file_name(source, plan.format);
  plan.arguments = transcode_arguments(plan.format, "input.wav", transcode_output_name(plan.format));
  return plan;
}

/// @brief Reads the transcoder's probe output saved by the host.
std::string read_probe_log(const std::string& path) {
  std::ifstream file(path);
  KEYBEAT_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

void print_json(const CliArgs& args, const SessionReport& report, const ExportPlan* plan,
                const std::vector<std::string>& extraction) {
  const AnalysisResult& r = report.analysis;
  JsonBuilder json;
  json.begin_object()
      .kv("file", args.input_file)
      .kv("status", analysis_status_name(r.status))
      .kv("duration", r.duration)
      .kv("sample_rate", r.sample_rate)
      .kv("channels", r.channels);

  json.key("tempo").begin_object().kv("bpm", r.tempo.bpm).kv("confidence", r.tempo.confidence)
      .end_object();

  json.key("key").begin_object().kv("detected", r.key.detected);
  if (r.key.detected) {
    json.kv("root", pitch_class_name(r.key.root))
        .kv("mode", mode_name(r.key.mode))
        .kv("name", r.key.to_string())
        .kv("short", r.key.to_short_string())
        .kv("camelot", r.key.camelot())
        .kv("score", r.key.score);
  }
  json.end_object();

  if (!report.waveform.empty()) {
    json.key("waveform").float_array(report.waveform);
  }

  if (!extraction.empty()) {
    const MediaInfo& m = report.media;
    json.key("media")
        .begin_object()
        .kv("source", args.source.empty() ? args.input_file : args.source)
        .kv("codec", m.codec)
        .kv("sample_rate", m.sample_rate)
        .kv("channels", m.channels)
        .kv("bit_depth", m.bit_depth)
        .kv("bitrate", m.bitrate)
        .kv("duration", m.duration)
        .key("extraction")
        .string_array(extraction)
        .end_object();
  }

  if (plan != nullptr) {
    json.key("export")
        .begin_object()
        .kv("format", export_format_name(plan->format))
        .kv("file_name", plan->file_name)
        .kv("mime_type", export_mime_type(plan->format))
        .key("arguments")
        .string_array(plan->arguments)
        .end_object();
  }

  json.end_object().print();
}

void print_text(const CliArgs& args, const SessionReport& report, const ExportPlan* plan,
                const std::vector<std::string>& extraction) {
  const AnalysisResult& r = report.analysis;
  int mins = static_cast<int>(r.duration) / 60;
  float secs = r.duration - static_cast<float>(mins * 60);

  std::cout << "File: " << args.input_file << "\n";
  std::cout << "  Duration:    " << mins << ":" << std::fixed << std::setprecision(1) << secs
            << " (" << r.sample_rate << " Hz, " << r.channels << " ch)\n";

  if (r.status != AnalysisStatus::Complete) {
    std::cout << "  Analysis " << analysis_status_name(r.status) << "\n";
  } else {
    if (r.tempo.detected()) {
      std::cout << "  Tempo:       " << std::setprecision(1) << r.tempo.bpm << " BPM"
                << " (confidence: " << std::setprecision(2) << r.tempo.confidence << ")\n";
    } else {
      std::cout << "  Tempo:       not detected\n";
    }
    if (r.key.detected) {
      std::cout << "  Key:         " << r.key.to_string() << " (" << r.key.camelot()
                << ", score: " << std::setprecision(2) << r.key.score << ")\n";
    } else {
      std::cout << "  Key:         not detected\n";
    }
  }

  if (!report.waveform.empty()) {
    std::cout << "  Waveform:    " << report.waveform.size() << " points\n";
  }

  if (!extraction.empty()) {
    const MediaInfo& m = report.media;
    if (m.has_audio()) {
      std::cout << "  Source:      " << m.codec << ", " << m.sample_rate << " Hz, " << m.channels
                << " ch, " << m.bit_depth << " bit";
      if (m.bitrate > 0) {
        std::cout << ", " << m.bitrate << " kb/s";
      }
      std::cout << "\n";
    } else {
      std::cout << "  Source:      no audio stream found\n";
    }
    std::cout << "  Extract:    ";
    for (const auto& a : extraction) std::cout << " " << a;
    std::cout << "\n";
  }

  if (plan != nullptr) {
    std::cout << "  Export:      " << plan->file_name << " (" << export_mime_type(plan->format)
              << ")\n";
    std::cout << "  Transcode:  ";
    for (const auto& a : plan->arguments) std::cout << " " << a;
    std::cout << "\n";
  }
}

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <file.wav> [options]\n\n"
            << "OPTIONS:\n"
            << "  --json             Output results in JSON format\n"
            << "  --verbose, -v      Print analysis stages on stderr\n"
            << "  --waveform <int>   Include N waveform peaks\n"
            << "  --export <format>  Describe export to flac, wav, mp3 or aac\n"
            << "  --probe-log <file> Read the transcoder's probe output for the source\n"
            << "  --source <path>    Original media path or URL (names exports)\n"
            << "  --version          Show library version\n"
            << "  --help, -h         Show help\n"
            << "\nExamples:\n"
            << "  " << prog << " song.wav\n"
            << "  " << prog << " song.wav --json --waveform 200\n"
            << "  " << prog << " extracted.wav --source https://example.com/set.m4a \\\n"
            << "      --probe-log probe.txt --export flac\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  CliArgs args;
  if (!parse_args(argc, argv, args)) {
    print_usage(argv[0]);
    return 1;
  }

  if (args.help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.version) {
    std::cout << "keybeat version " << version() << "\n";
    return 0;
  }

  if (args.input_file.empty()) {
    std::cerr << "Error: Missing audio file\n\n";
    print_usage(argv[0]);
    return 1;
  }

  try {
    ExportPlan plan{};
    bool has_plan = !args.export_format.empty();
    if (has_plan) {
      std::string source = args.source.empty() ? args.input_file : source_file_name(args.source);
      plan = make_export_plan(args.export_format, source);
    }

    StderrObserver observer;
    AnalysisSession session(MusicAnalyzerConfig(), args.verbose ? &observer : nullptr);

    session.report_stage("Loading media...", session_progress::kLoading);

    std::vector<std::string> extraction;
    if (!args.probe_log_file.empty()) {
      session.probe(read_probe_log(args.probe_log_file));
      extraction = session.plan_extraction(args.source.empty() ? args.input_file : args.source,
                                           "output.wav");
    }

    SampleBuffer buffer = load_wav(args.input_file);

    SessionReport report = session.run(buffer, args.waveform_points);

    if (args.json_output) {
      print_json(args, report, has_plan ? &plan : nullptr, extraction);
    } else {
      print_text(args, report, has_plan ? &plan : nullptr, extraction);
    }
    return report.analysis.status == AnalysisStatus::Complete ? 0 : 2;

  } catch (const KeybeatException& e) {
    std::cerr << "Error: " << e.describe() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
