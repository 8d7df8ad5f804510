#include "analysis/music_analyzer.h"

#include <chrono>
#include <future>
#include <vector>

#include "util/exception.h"

namespace keybeat {

namespace {

// Waits for a detector task; returns false if it stopped on cancellation.
template <typename T>
bool collect(std::future<T>& future, T& out) {
  try {
    out = future.get();
    return true;
  } catch (const KeybeatException& e) {
    if (!e.cancelled()) {
      throw;
    }
    return false;
  }
}

}  // namespace

const char* analysis_status_name(AnalysisStatus status) {
  switch (status) {
    case AnalysisStatus::Complete:
      return "complete";
    case AnalysisStatus::Skipped:
      return "skipped";
    case AnalysisStatus::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

MusicAnalyzer::MusicAnalyzer(const MusicAnalyzerConfig& config) : config_(config) {
  KEYBEAT_CHECK_MSG(config_.time_budget_ms >= 0, ErrorCode::InvalidParameter,
                    "Time budget must be non-negative");
}

AnalysisResult MusicAnalyzer::analyze(const SampleBuffer& buffer,
                                      const CancellationToken* cancel) const {
  AnalysisResult result;
  result.duration = buffer.duration();
  result.sample_rate = buffer.sample_rate();
  result.channels = buffer.channels();

  // The budget cancels only this run; the caller's token is observed, never set
  CancellationToken run_token(cancel);
  const CancellationToken* token = &run_token;
  if (token->is_cancelled()) {
    result.status = AnalysisStatus::Cancelled;
    return result;
  }

  const std::vector<float> mono = buffer.mono_mix();
  const int sr = buffer.sample_rate();
  const FFT& fft = fft_;
  const MusicAnalyzerConfig& config = config_;

  std::future<TempoEstimate> tempo_task = std::async(std::launch::async, [&]() {
    return TempoDetector(mono.data(), mono.size(), sr, config.tempo, fft, token).estimate();
  });
  std::future<KeyEstimate> key_task = std::async(std::launch::async, [&]() {
    return KeyDetector(mono.data(), mono.size(), sr, config.key, fft, token).key();
  });

  bool timed_out = false;
  if (config_.time_budget_ms > 0) {
    auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.time_budget_ms);
    if (tempo_task.wait_until(deadline) == std::future_status::timeout ||
        key_task.wait_until(deadline) == std::future_status::timeout) {
      timed_out = true;
      run_token.cancel();
    }
  }

  TempoEstimate tempo;
  KeyEstimate key;
  // A std::async future joins in its destructor, so a throwing get() still waits for both
  bool tempo_done = collect(tempo_task, tempo);
  bool key_done = collect(key_task, key);

  if (tempo_done && key_done) {
    result.tempo = tempo;
    result.key = key;
  } else {
    result.status = timed_out ? AnalysisStatus::Skipped : AnalysisStatus::Cancelled;
  }
  return result;
}

AnalysisResult analyze_music(const SampleBuffer& buffer, const MusicAnalyzerConfig& config,
                             const CancellationToken* cancel) {
  MusicAnalyzer analyzer(config);
  return analyzer.analyze(buffer, cancel);
}

}  // namespace keybeat
