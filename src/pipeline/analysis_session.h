#pragma once

/// @file analysis_session.h
/// @brief Staged analysis run with progress reporting.

#include <string>
#include <vector>

#include "analysis/music_analyzer.h"
#include "core/sample_buffer.h"
#include "core/waveform.h"
#include "pipeline/media_probe.h"
#include "util/cancellation.h"

namespace keybeat {

/// @brief Receives stage and progress notifications from a session.
/// @details Called on the thread that runs the session.
class AnalysisObserver {
 public:
  virtual ~AnalysisObserver() = default;

  /// @brief Called when a new stage starts (e.g. "Detecting tempo & key...").
  virtual void on_stage(const std::string& stage) = 0;

  /// @brief Called with overall progress in percent [0, 100].
  virtual void on_progress(int percent) = 0;
};

/// @brief Progress values reported by the stages of a session.
/// @details Loading and probing come first, then extraction by the transcoder, then the
///          analysis of the decoded buffer.
namespace session_progress {
constexpr int kLoading = 5;
constexpr int kProbed = 15;
constexpr int kExtracting = 25;
constexpr int kExtracted = 60;
constexpr int kAnalyzing = 75;
constexpr int kComplete = 100;
}  // namespace session_progress

/// @brief Everything a front end shows for one analyzed file.
struct SessionReport {
  AnalysisResult analysis;     ///< Tempo, key and buffer facts
  std::vector<float> waveform; ///< Peaks of channel 0
  MediaInfo media;             ///< Source facts from probe(), empty without one
};

/// @brief Runs analysis on a decoded buffer and reports its stages.
/// @details One session owns one cancellation token. After cancel(), the current run ends
///          with AnalysisStatus::Cancelled and later runs return immediately with that status.
class AnalysisSession {
 public:
  /// @param config Analyzer configuration
  /// @param observer Optional observer (not owned, must outlive the session)
  explicit AnalysisSession(const MusicAnalyzerConfig& config = MusicAnalyzerConfig(),
                           AnalysisObserver* observer = nullptr);

  /// @brief Analyzes a buffer.
  /// @param buffer Decoded buffer
  /// @param waveform_points Number of waveform peaks (0 = none)
  SessionReport run(const SampleBuffer& buffer, int waveform_points = kDefaultWaveformPoints);

  /// @brief Reads the transcoder's probe output for the source media.
  /// @details Reports "Detecting audio streams..." at session_progress::kProbed. The facts
  ///          are kept for plan_extraction() and copied into later reports.
  /// @param probe_log Output of the transcoder run with probe_arguments()
  const MediaInfo& probe(const std::string& probe_log);

  /// @brief Builds the transcoder arguments extracting the source's audio to a WAV file.
  /// @details Reports "Extracting audio..." at session_progress::kExtracting. The rate
  ///          follows extraction_sample_rate() of the probed rate (48000 without a probe).
  /// @param input Source media given to the transcoder
  /// @param output WAV file to write
  std::vector<std::string> plan_extraction(const std::string& input, const std::string& output);

  /// @brief Returns the facts from the last probe().
  const MediaInfo& media() const { return media_; }

  /// @brief Requests cancellation of the current and later runs (any thread).
  void cancel() { cancel_.cancel(); }

  /// @brief Returns true once cancel() has been called.
  bool cancelled() const { return cancel_.is_cancelled(); }

  /// @brief Forwards a stage notification to the observer, if any.
  void report_stage(const std::string& stage, int percent);

 private:
  MusicAnalyzer analyzer_;
  AnalysisObserver* observer_;
  CancellationToken cancel_;
  MediaInfo media_;
};

}  // namespace keybeat
