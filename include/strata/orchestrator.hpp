#pragma once

// strata/orchestrator.hpp — Analysis orchestrator: drains pending queue entries.
//
// PER JOB:
//   lock: first entry still `pending` -> `analyzing`, persist, unlock
//   move  shared_path -> <processing_dir>/<file name>   (failure: job -> failed)
//   analyze the relocated file (no lock held)
//   write <output_dir>/<content_hash>.json atomically
//   lock: `analyzing` -> result status, static_output_path, error; persist, unlock
//   vault the relocated sample and remove the processing copy (when a vault is set)
//
// A job left in `analyzing` after a crash stays visible there; it is never silently
// re-queued as pending.

#include <optional>
#include <string>

#include "strata/analysis.hpp"
#include "strata/observability.hpp"
#include "strata/queue_store.hpp"
#include "strata/vault.hpp"

namespace strata {

class AnalysisOrchestrator {
 public:
  AnalysisOrchestrator(const QueueStore& queue, const AnalysisEngine& engine,
                       std::string processing_dir, std::string output_dir,
                       const SampleVault* vault, PipelineStats& stats);

  // Claim and process the first pending job. Returns false when nothing was pending.
  bool process_next();

  // process_next() until the queue has no pending entry. Returns jobs handled.
  std::size_t drain();

 private:
  std::optional<JobEntry> claim();
  void finish(const JobEntry& claimed, JobStatus to, const std::string& output_path,
              const std::string& error, ErrorCode code);

  const QueueStore& queue_;
  const AnalysisEngine& engine_;
  std::string processing_dir_;
  std::string output_dir_;
  const SampleVault* vault_;
  PipelineStats& stats_;
};

}  // namespace strata
