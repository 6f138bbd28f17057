#include "strata/orchestrator.hpp"

#include <filesystem>

#include "strata/fsutil.hpp"
#include "strata/log.hpp"

namespace fs = std::filesystem;

namespace strata {

AnalysisOrchestrator::AnalysisOrchestrator(const QueueStore& queue, const AnalysisEngine& engine,
                                           std::string processing_dir, std::string output_dir,
                                           const SampleVault* vault, PipelineStats& stats)
    : queue_(queue),
      engine_(engine),
      processing_dir_(std::move(processing_dir)),
      output_dir_(std::move(output_dir)),
      vault_(vault),
      stats_(stats) {}

std::optional<JobEntry> AnalysisOrchestrator::claim() {
  std::optional<JobEntry> claimed;
  queue_.transact([&](std::vector<JobEntry>& jobs) {
    for (auto& job : jobs) {
      if (job.status != JobStatus::pending) continue;
      if (!advance(job, JobStatus::analyzing)) continue;
      claimed = job;
      return true;
    }
    return false;
  });
  return claimed;
}

void AnalysisOrchestrator::finish(const JobEntry& claimed, JobStatus to,
                                  const std::string& output_path, const std::string& error,
                                  ErrorCode code) {
  auto logger = log::get("orchestrator");
  bool updated = false;
  std::optional<JobStatus> found;
  queue_.transact([&](std::vector<JobEntry>& jobs) {
    for (auto& job : jobs) {
      if (job.content_hash != claimed.content_hash) continue;
      found = job.status;
      // Someone else moved the entry on; their write wins.
      if (job.status != JobStatus::analyzing) return false;
      if (!advance(job, to)) return false;
      job.static_output_path = output_path;
      if (to == JobStatus::failed) {
        job.error = error;
        job.error_code = code;
      }
      updated = true;
      return true;
    }
    return false;
  });
  if (updated) {
    logger->info("job {} analyzing -> {}", claimed.job_id, to_string(to));
  } else if (!found) {
    logger->warn("job {} left the queue while analyzing; result not recorded", claimed.job_id);
  } else if (is_terminal(*found)) {
    logger->warn("job {} already {}; result not recorded", claimed.job_id, to_string(*found));
  } else {
    logger->warn("job {} is {} instead of analyzing; result not recorded", claimed.job_id,
                 to_string(*found));
  }
}

bool AnalysisOrchestrator::process_next() {
  auto logger = log::get("orchestrator");
  auto claimed = claim();
  if (!claimed) return false;

  const ScopeTimer timer(stats_.job_latency);
  const JobEntry& job = *claimed;
  logger->info("job {} pending -> analyzing ({})", job.job_id, job.original_path);

  std::error_code ec;
  fs::create_directories(processing_dir_, ec);
  const fs::path relocated = fs::path(processing_dir_) / fs::path(job.shared_path).filename();
  std::string move_error;
  if (!move_file(job.shared_path, relocated, &move_error)) {
    logger->error("job {}: cannot relocate {}: {}", job.job_id, job.shared_path, move_error);
    finish(job, JobStatus::failed, "", "relocation failed: " + move_error,
           ErrorCode::relocation_failed);
    stats_.jobs_failed.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  AnalysisResult result;
  try {
    result = engine_.analyze(relocated.string(), job.content_hash, 0);
  } catch (const std::exception& e) {
    result = AnalysisResult{};
    result.analysis_id = analysis_id_for(job.content_hash);
    result.file_info.hash = job.content_hash;
    result.file_info.path = relocated.string();
    result.status = NodeStatus::failed;
    result.error = e.what();
    result.error_code = ErrorCode::analysis_failed;
  }

  fs::create_directories(output_dir_, ec);
  const fs::path output = fs::path(output_dir_) / (job.content_hash + ".json");
  std::string write_error;
  if (!atomic_write_file(output, analysis_to_json_text(result), &write_error)) {
    logger->error("job {}: cannot write {}: {}", job.job_id, output.string(), write_error);
    finish(job, JobStatus::failed, "", "cannot write analysis output: " + write_error,
           ErrorCode::io_error);
    stats_.jobs_failed.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  const JobStatus to =
      result.status == NodeStatus::analyzed ? JobStatus::analyzed : JobStatus::failed;
  finish(job, to, output.string(), result.error, result.error_code);
  if (to == JobStatus::analyzed) {
    stats_.jobs_analyzed.fetch_add(1, std::memory_order_relaxed);
  } else {
    stats_.jobs_failed.fetch_add(1, std::memory_order_relaxed);
  }
  logger->info("job {}: score {} level {} ({} ms)", job.job_id, result.risk.score,
               to_string(result.risk.level), result.duration_ms);

  if (vault_ != nullptr) {
    std::string vault_error;
    if (vault_->put_file(relocated.string(), job.content_hash, &vault_error)) {
      fs::remove(relocated, ec);
      if (ec) logger->warn("job {}: cannot remove {}: {}", job.job_id, relocated.string(), ec.message());
    } else {
      logger->warn("job {}: vault store failed, keeping {}: {}", job.job_id, relocated.string(),
                   vault_error);
    }
  }
  return true;
}

std::size_t AnalysisOrchestrator::drain() {
  std::size_t handled = 0;
  while (process_next()) ++handled;
  return handled;
}

}  // namespace strata
