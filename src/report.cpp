#include "strata/report.hpp"

#include <filesystem>
#include <sstream>

#include "strata/fsutil.hpp"
#include "strata/log.hpp"
#include "strata/risk.hpp"
#include "strata/version.hpp"

namespace fs = std::filesystem;

namespace strata {

namespace {

constexpr std::size_t kIndicatorsShown = 10;

std::string cell(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '|') {
      out += "\\|";
    } else if (c == '\n' || c == '\r') {
      out += ' ';
    } else {
      out += c;
    }
  }
  return out;
}

void write_indicator_block(std::ostringstream& md, const char* title,
                           const std::vector<std::string>& values) {
  md << "#### " << title << " (" << values.size() << ")\n\n";
  if (values.empty()) {
    md << "_None_\n\n";
    return;
  }
  md << "```\n";
  for (std::size_t i = 0; i < values.size() && i < kIndicatorsShown; ++i) md << values[i] << "\n";
  if (values.size() > kIndicatorsShown) {
    md << "... (" << (values.size() - kIndicatorsShown) << " more)\n";
  }
  md << "```\n\n";
}

void write_member_rows(std::ostringstream& md, const AnalysisResult& node) {
  for (const auto& child : node.children) {
    md << "| " << child.depth << " | `" << cell(child.file_info.path) << "` | "
       << cell(child.file_info.mime_type) << " | " << child.risk.score << " | "
       << to_string(child.risk.level) << " | " << to_string(child.status);
    if (child.status == NodeStatus::failed) md << " (" << cell(to_string(child.error_code)) << ")";
    md << " |\n";
    write_member_rows(md, child);
  }
}

}  // namespace

ReportRecord build_report(const JobEntry& job, std::optional<AnalysisResult> analysis) {
  ReportRecord r;
  r.report_id = "report-" + job.content_hash;
  r.generated_at = utc_timestamp_iso8601();
  r.job = job;
  r.analysis = std::move(analysis);
  r.overall_score = r.analysis ? r.analysis->risk.score : 0;
  r.overall_level = overall_level(r.overall_score);
  return r;
}

std::string badge_color(const std::string& overall_level) {
  if (overall_level == "CRITICAL") return "red";
  if (overall_level == "HIGH") return "orange";
  if (overall_level == "MEDIUM") return "yellow";
  if (overall_level == "LOW") return "green";
  return "blue";
}

jsonlite::Value report_to_json(const ReportRecord& r) {
  using jsonlite::make_string;
  using jsonlite::make_u64;
  jsonlite::Object o;
  o["schema_version"] = make_u64(version::REPORT_SCHEMA_VERSION);
  o["report_id"] = make_string(r.report_id);
  o["generated_at"] = make_string(r.generated_at);

  jsonlite::Object file_info;
  file_info["original_path"] = make_string(r.job.original_path);
  file_info["content_hash"] = make_string(r.job.content_hash);
  file_info["job_id"] = make_string(r.job.job_id);
  file_info["created_at"] = make_string(r.job.created_at);
  file_info["file_type"] = make_string(r.job.file_type);
  if (r.analysis) {
    file_info["mime_type"] = make_string(r.analysis->file_info.mime_type);
    file_info["size_bytes"] = make_u64(r.analysis->file_info.size_bytes);
  }
  o["file_info"] = jsonlite::Value{std::move(file_info)};

  o["static_analysis"] = r.analysis ? analysis_to_json(*r.analysis) : jsonlite::Value{nullptr};

  jsonlite::Object overall;
  overall["score"] = make_u64(r.overall_score);
  overall["level"] = make_string(r.overall_level);
  o["overall_risk"] = jsonlite::Value{std::move(overall)};
  return jsonlite::Value{std::move(o)};
}

std::string report_to_markdown(const ReportRecord& r) {
  std::ostringstream md;
  md << "# Static Analysis Report\n\n";
  md << "**Report ID**: `" << r.report_id << "`  \n";
  md << "**Generated**: " << r.generated_at << "\n\n";

  md << "## File Information\n\n";
  md << "- **Original Path**: `" << r.job.original_path << "`\n";
  md << "- **Content Hash (BLAKE3)**: `" << r.job.content_hash << "`\n";
  md << "- **Job ID**: `" << r.job.job_id << "`\n";
  md << "- **Queued At**: " << r.job.created_at << "\n";
  md << "- **File Type**: " << (r.job.file_type.empty() ? "unknown" : r.job.file_type) << "\n";
  if (r.analysis) md << "- **Size**: " << r.analysis->file_info.size_bytes << " bytes\n";
  md << "\n";

  md << "## Overall Risk\n\n";
  md << "![Risk](https://img.shields.io/badge/Risk-" << r.overall_level << "-"
     << badge_color(r.overall_level) << "?style=for-the-badge)\n\n";
  md << "- **Score**: " << r.overall_score << "\n";
  md << "- **Level**: " << r.overall_level << "\n\n";

  if (!r.analysis) {
    md << "## Static Analysis\n\n_No static analysis output was available for this job._\n";
    return md.str();
  }
  const AnalysisResult& a = *r.analysis;

  md << "## Static Analysis\n\n";
  md << "- **Analysis ID**: `" << a.analysis_id << "`\n";
  md << "- **Node Kind**: " << to_string(a.kind) << "\n";
  md << "- **Artifact Level**: " << to_string(a.risk.level) << " (" << a.risk.recommendation
     << ")\n";
  md << "- **Duration**: " << a.duration_ms << " ms\n";
  if (!a.facet_errors.empty()) {
    md << "- **Facet Errors**: " << a.facet_errors.size() << "\n";
  }
  md << "\n";

  md << "### Signature Matches (" << a.signature_matches.size() << ")\n\n";
  if (a.signature_matches.empty()) {
    md << "_None_\n\n";
  } else {
    md << "| Rule | Severity | Source | Strings |\n|---|---|---|---|\n";
    for (const auto& m : a.signature_matches) {
      md << "| " << cell(m.rule_name) << " | " << m.severity << " | " << cell(m.source_rule)
         << " | " << m.matched_strings.size() << " |\n";
    }
    md << "\n";
  }

  if (a.executable_analysis) {
    const ExecutableFacts& pe = *a.executable_analysis;
    md << "### Executable Analysis\n\n";
    md << "- **Format**: " << pe.format << " (" << pe.section_count << " sections, "
       << pe.import_count << " imports)\n";
    md << "- **Packed**: " << (pe.is_packed ? "yes" : "no") << "\n";
    md << "- **Overlay**: " << (pe.has_overlay ? std::to_string(pe.overlay_size) + " bytes" : "none")
       << "\n";
    for (const auto& imp : pe.suspicious_imports) md << "- Suspicious import `" << imp << "`\n";
    for (const auto& s : pe.high_entropy_sections) {
      md << "- High-entropy section `" << s.name << "` (" << s.entropy << ")\n";
    }
    md << "\n";
  }

  md << "### Indicators\n\n";
  write_indicator_block(md, "URLs", a.extracted_indicators.urls);
  write_indicator_block(md, "IPs", a.extracted_indicators.ips);

  if (a.kind == NodeKind::container || a.status == NodeStatus::failed) {
    md << "### Archive Members\n\n";
    if (a.status == NodeStatus::failed) {
      md << "**Extraction failed**: `" << to_string(a.error_code) << "` " << a.error << "\n\n";
    }
    if (!a.children.empty()) {
      md << "| Depth | Path | Type | Score | Level | Status |\n|---|---|---|---|---|---|\n";
      write_member_rows(md, a);
      md << "\n";
    }
  }
  return md.str();
}

std::optional<AnalysisResult> load_analysis(const std::string& path) {
  if (path.empty()) return std::nullopt;
  const auto text = read_file(path);
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object obj = jsonlite::parse(*text, &err);
  if (err) {
    log::get("report")->warn("cannot parse {}: {}", path, err->message);
    return std::nullopt;
  }
  return analysis_from_json(obj);
}

ReportBuilder::ReportBuilder(const QueueStore& queue, std::string reports_dir,
                             PipelineStats& stats)
    : queue_(queue), reports_dir_(std::move(reports_dir)), stats_(stats) {}

bool ReportBuilder::report_job(const JobEntry& job) {
  auto logger = log::get("report");
  std::error_code ec;
  fs::create_directories(reports_dir_, ec);
  const fs::path json_path = fs::path(reports_dir_) / ("report-" + job.content_hash + ".json");
  const fs::path md_path = fs::path(reports_dir_) / ("report-" + job.content_hash + ".md");

  const bool have_json = fs::exists(json_path, ec);
  const bool have_md = fs::exists(md_path, ec);
  if (!have_json || !have_md) {
    auto analysis = load_analysis(job.static_output_path);
    if (!analysis) {
      logger->warn("job {}: analysis output {} unavailable", job.job_id, job.static_output_path);
    }
    const ReportRecord record = build_report(job, std::move(analysis));
    std::string err;
    if (!have_json &&
        !atomic_write_file(json_path, jsonlite::to_pretty_json(report_to_json(record)), &err)) {
      logger->error("job {}: cannot write {}: {}", job.job_id, json_path.string(), err);
      return false;
    }
    if (!have_md && !atomic_write_file(md_path, report_to_markdown(record), &err)) {
      logger->error("job {}: cannot write {}: {}", job.job_id, md_path.string(), err);
      return false;
    }
  } else {
    logger->info("job {}: reusing existing report {}", job.job_id, json_path.string());
  }

  bool updated = false;
  queue_.transact([&](std::vector<JobEntry>& jobs) {
    for (auto& entry : jobs) {
      if (entry.content_hash != job.content_hash) continue;
      if (entry.status != JobStatus::analyzed || !entry.report_path.empty()) return false;
      if (!advance(entry, JobStatus::reported)) return false;
      entry.report_path = json_path.string();
      entry.report_md_path = md_path.string();
      updated = true;
      return true;
    }
    return false;
  });
  if (updated) {
    logger->info("job {} analyzed -> reported ({})", job.job_id, json_path.string());
    stats_.jobs_reported.fetch_add(1, std::memory_order_relaxed);
  }
  return updated;
}

std::size_t ReportBuilder::run_once() {
  std::size_t reported = 0;
  for (const auto& job : queue_.load()) {
    if (job.status != JobStatus::analyzed || !job.report_path.empty()) continue;
    if (report_job(job)) ++reported;
  }
  return reported;
}

}  // namespace strata
