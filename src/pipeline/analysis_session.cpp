#include "pipeline/analysis_session.h"

#include "pipeline/export_format.h"

namespace keybeat {

AnalysisSession::AnalysisSession(const MusicAnalyzerConfig& config, AnalysisObserver* observer)
    : analyzer_(config), observer_(observer) {}

void AnalysisSession::report_stage(const std::string& stage, int percent) {
  if (observer_ == nullptr) {
    return;
  }
  observer_->on_stage(stage);
  observer_->on_progress(percent);
}

const MediaInfo& AnalysisSession::probe(const std::string& probe_log) {
  report_stage("Detecting audio streams...", session_progress::kProbed);
  media_ = parse_probe_log(probe_log);
  return media_;
}

std::vector<std::string> AnalysisSession::plan_extraction(const std::string& input,
                                                          const std::string& output) {
  report_stage("Extracting audio...", session_progress::kExtracting);
  return extraction_arguments(input, output, media_.sample_rate);
}

SessionReport AnalysisSession::run(const SampleBuffer& buffer, int waveform_points) {
  SessionReport report;
  report.media = media_;

  report_stage("Analyzing audio...", session_progress::kExtracted);
  if (waveform_points > 0) {
    report.waveform = waveform_peaks(buffer, waveform_points);
  }

  report_stage("Detecting tempo & key...", session_progress::kAnalyzing);
  report.analysis = analyzer_.analyze(buffer, &cancel_);

  if (report.analysis.status == AnalysisStatus::Complete) {
    report_stage("Analysis complete", session_progress::kComplete);
  } else if (report.analysis.status == AnalysisStatus::Skipped) {
    report_stage("Analysis skipped", session_progress::kComplete);
  } else {
    report_stage("Analysis cancelled", session_progress::kComplete);
  }
  return report;
}

}  // namespace keybeat
