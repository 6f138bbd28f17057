#pragma once

// strata/report.hpp — Report builder: analyzed jobs -> JSON + Markdown reports.
//
// IDEMPOTENCE:
//   A job is a candidate only while status == analyzed and report_path is empty. Report
//   files are named after the content hash and are never overwritten: a file left behind
//   by a run that crashed before updating the queue is reused as-is. The final queue
//   update re-checks both conditions under the lock, so a second builder racing on the
//   same job neither writes a second report nor changes report_path.
//
// OVERALL LEVEL:
//   overall_risk.score is the top-level analysis score; its level comes from the coarser
//   job ladder in risk.hpp (CRITICAL..INFO), not the per-artifact thresholds.

#include <cstdint>
#include <optional>
#include <string>

#include "strata/analysis.hpp"
#include "strata/jsonlite.hpp"
#include "strata/observability.hpp"
#include "strata/queue_store.hpp"

namespace strata {

struct ReportRecord {
  std::string report_id;
  std::string generated_at;
  JobEntry job;
  std::optional<AnalysisResult> analysis;
  std::uint64_t overall_score{0};
  std::string overall_level{"INFO"};
};

ReportRecord build_report(const JobEntry& job, std::optional<AnalysisResult> analysis);

jsonlite::Value report_to_json(const ReportRecord& record);
std::string report_to_markdown(const ReportRecord& record);

// shields.io colour for an overall level.
std::string badge_color(const std::string& overall_level);

// Read and decode the AnalysisResult document at `path`. nullopt when unreadable.
std::optional<AnalysisResult> load_analysis(const std::string& path);

class ReportBuilder {
 public:
  ReportBuilder(const QueueStore& queue, std::string reports_dir, PipelineStats& stats);

  // Report every candidate job once. Returns the number of jobs moved to `reported`.
  std::size_t run_once();

 private:
  bool report_job(const JobEntry& job);

  const QueueStore& queue_;
  std::string reports_dir_;
  PipelineStats& stats_;
};

}  // namespace strata
