#include "strata/types.hpp"

namespace strata {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::recursion_limit_exceeded: return "recursion_limit_exceeded";
    case ErrorCode::extraction_traversal_violation: return "extraction_traversal_violation";
    case ErrorCode::extraction_count_exceeded: return "extraction_count_exceeded";
    case ErrorCode::extraction_size_exceeded: return "extraction_size_exceeded";
    case ErrorCode::extraction_bad_container: return "extraction_bad_container";
    case ErrorCode::extraction_unsupported_codec: return "extraction_unsupported_codec";
    case ErrorCode::extraction_no_extractor: return "extraction_no_extractor";
    case ErrorCode::extraction_workdir_collision: return "extraction_workdir_collision";
    case ErrorCode::extraction_timeout: return "extraction_timeout";
    case ErrorCode::relocation_failed: return "relocation_failed";
    case ErrorCode::parse_failed: return "parse_failed";
    case ErrorCode::queue_corruption: return "queue_corruption";
    case ErrorCode::queue_lock_timeout: return "queue_lock_timeout";
    case ErrorCode::analysis_failed: return "analysis_failed";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

ErrorCode parse_error_code(const std::string& s) {
  static const ErrorCode kAll[] = {
      ErrorCode::recursion_limit_exceeded,     ErrorCode::extraction_traversal_violation,
      ErrorCode::extraction_count_exceeded,    ErrorCode::extraction_size_exceeded,
      ErrorCode::extraction_bad_container,     ErrorCode::extraction_unsupported_codec,
      ErrorCode::extraction_no_extractor,      ErrorCode::extraction_workdir_collision,
      ErrorCode::extraction_timeout,           ErrorCode::relocation_failed,
      ErrorCode::parse_failed,                 ErrorCode::queue_corruption,
      ErrorCode::queue_lock_timeout,           ErrorCode::analysis_failed,
      ErrorCode::io_error,                     ErrorCode::config_invalid,
  };
  for (ErrorCode c : kAll) {
    if (to_string(c) == s) return c;
  }
  return ErrorCode::none;
}

std::string to_string(JobStatus status) {
  switch (status) {
    case JobStatus::pending: return "pending";
    case JobStatus::analyzing: return "analyzing";
    case JobStatus::analyzed: return "analyzed";
    case JobStatus::failed: return "failed";
    case JobStatus::reported: return "reported";
  }
  return "pending";
}

std::optional<JobStatus> parse_job_status(const std::string& s) {
  if (s == "pending") return JobStatus::pending;
  if (s == "analyzing") return JobStatus::analyzing;
  if (s == "analyzed") return JobStatus::analyzed;
  if (s == "failed") return JobStatus::failed;
  if (s == "reported") return JobStatus::reported;
  return std::nullopt;
}

bool can_transition(JobStatus from, JobStatus to) {
  switch (from) {
    case JobStatus::pending: return to == JobStatus::analyzing;
    case JobStatus::analyzing: return to == JobStatus::analyzed || to == JobStatus::failed;
    case JobStatus::analyzed: return to == JobStatus::reported;
    case JobStatus::failed: return false;
    case JobStatus::reported: return false;
  }
  return false;
}

bool is_terminal(JobStatus status) {
  return status == JobStatus::failed || status == JobStatus::reported;
}

std::string to_string(RiskLevel level) {
  switch (level) {
    case RiskLevel::low: return "LOW";
    case RiskLevel::medium: return "MEDIUM";
    case RiskLevel::high: return "HIGH";
  }
  return "LOW";
}

std::optional<RiskLevel> parse_risk_level(const std::string& s) {
  if (s == "LOW") return RiskLevel::low;
  if (s == "MEDIUM") return RiskLevel::medium;
  if (s == "HIGH") return RiskLevel::high;
  return std::nullopt;
}

std::string to_string(NodeStatus status) {
  return status == NodeStatus::failed ? "failed" : "analyzed";
}

}  // namespace strata
