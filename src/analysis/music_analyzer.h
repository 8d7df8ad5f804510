#pragma once

/// @file music_analyzer.h
/// @brief Concurrent tempo + key analysis facade.

#include <memory>

#include "analysis/key_detector.h"
#include "analysis/tempo_detector.h"
#include "core/fft.h"
#include "core/sample_buffer.h"
#include "util/cancellation.h"

namespace keybeat {

/// @brief Outcome of an analysis run.
enum class AnalysisStatus {
  Complete,   ///< Both detectors finished
  Skipped,    ///< Time budget exceeded; results are the fallback values
  Cancelled,  ///< Cancelled by the caller; results are the fallback values
};

/// @brief Returns the name of an analysis status ("complete", "skipped", "cancelled").
const char* analysis_status_name(AnalysisStatus status);

/// @brief Configuration for MusicAnalyzer.
struct MusicAnalyzerConfig {
  TempoConfig tempo;         ///< Tempo detector settings
  KeyConfig key;             ///< Key detector settings
  int time_budget_ms = 0;    ///< Wall-clock budget for both detectors (0 = unlimited)
};

/// @brief Combined analysis result.
struct AnalysisResult {
  AnalysisStatus status = AnalysisStatus::Complete;
  TempoEstimate tempo;
  KeyEstimate key;
  float duration = 0.0f;  ///< Seconds
  int sample_rate = 0;
  int channels = 0;
};

/// @brief Runs the tempo and key detectors concurrently on one buffer.
/// @details Both detectors read the same immutable mono mix and share the analyzer's FFT
///          plan cache, which lives as long as the analyzer and is reused across calls.
///
/// @code
/// keybeat::MusicAnalyzer analyzer;
/// auto result = analyzer.analyze(buffer);
/// std::cout << result.tempo.bpm << " BPM, " << result.key.to_string() << std::endl;
/// @endcode
class MusicAnalyzer {
 public:
  explicit MusicAnalyzer(const MusicAnalyzerConfig& config = MusicAnalyzerConfig());

  /// @brief Analyzes a buffer.
  /// @param buffer Input buffer (any channel count)
  /// @param cancel Optional caller token, polled by both detectors. An exceeded time budget
  ///        stops the detectors through a per-run token and leaves this one untouched.
  /// @return Result; status tells whether the estimates are real or fallbacks
  /// @throws KeybeatException(InvalidParameter) on bad configuration
  AnalysisResult analyze(const SampleBuffer& buffer,
                         const CancellationToken* cancel = nullptr) const;

  /// @brief Returns the configuration.
  const MusicAnalyzerConfig& config() const { return config_; }

  /// @brief Returns the shared FFT plan cache.
  const std::shared_ptr<FftPlanCache>& plan_cache() const { return fft_.cache(); }

 private:
  MusicAnalyzerConfig config_;
  FFT fft_;
};

/// @brief Quick combined analysis with a fresh analyzer.
AnalysisResult analyze_music(const SampleBuffer& buffer,
                             const MusicAnalyzerConfig& config = MusicAnalyzerConfig(),
                             const CancellationToken* cancel = nullptr);

}  // namespace keybeat
