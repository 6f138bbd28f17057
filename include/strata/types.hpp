#pragma once

// strata/types.hpp — Shared enums and status vocabulary for the strata pipeline.
//
// STATE MACHINE (JobStatus):
//   pending -> analyzing -> {analyzed | failed} -> reported
//   Transitions are monotonic. failed and reported are terminal. The only writer of a
//   transition is whichever process holds the queue lock at that instant.
//
// ERROR VOCABULARY:
//   ErrorCode values are written into queue, analysis and report documents via
//   to_string(). The strings are part of the on-disk schema: never rename one.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strata {

enum class ErrorCode {
  none,
  recursion_limit_exceeded,
  extraction_traversal_violation,
  extraction_count_exceeded,
  extraction_size_exceeded,
  extraction_bad_container,
  extraction_unsupported_codec,
  extraction_no_extractor,
  extraction_workdir_collision,
  extraction_timeout,
  relocation_failed,
  parse_failed,
  queue_corruption,
  queue_lock_timeout,
  analysis_failed,
  io_error,
  config_invalid,
};

std::string to_string(ErrorCode code);
ErrorCode parse_error_code(const std::string& s);

// ---------------------------------------------------------------------------
// JobStatus: queue state machine
// ---------------------------------------------------------------------------
enum class JobStatus {
  pending,
  analyzing,
  analyzed,
  failed,
  reported,
};

std::string to_string(JobStatus status);
std::optional<JobStatus> parse_job_status(const std::string& s);

// True when `from -> to` is an edge of the state machine. Self-edges are not edges.
bool can_transition(JobStatus from, JobStatus to);

bool is_terminal(JobStatus status);

// ---------------------------------------------------------------------------
// Risk vocabulary
// ---------------------------------------------------------------------------
// Per-artifact levels. The report ladder (CRITICAL..INFO) is a separate scale and is
// rendered as a plain string by report.cpp.
enum class RiskLevel {
  low,
  medium,
  high,
};

std::string to_string(RiskLevel level);
std::optional<RiskLevel> parse_risk_level(const std::string& s);

// Per-node analysis status.
enum class NodeStatus {
  analyzed,
  failed,
};

std::string to_string(NodeStatus status);

}  // namespace strata
