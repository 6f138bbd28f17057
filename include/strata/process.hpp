#pragma once

// strata/process.hpp — Bounded child-process runner for external extractors.
//
// GUARANTEES:
//   - The child runs in its own session; on timeout the whole process group is SIGKILLed,
//     so an extractor that forks helpers cannot outlive the deadline.
//   - RLIMIT_CPU is derived from timeout_ms; RLIMIT_AS and RLIMIT_FSIZE apply when set.
//   - Captured stdout/stderr are capped at max_output_bytes each.
//   - The child sees only spec.env, never the parent's environment.
//
// exit_code follows shell conventions: 124 on timeout, 128+N when killed by signal N,
// 127 when exec failed.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace strata {

struct ProcessSpec {
  std::string command;  // absolute path; no PATH lookup is done here
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  std::string cwd;
  std::uint64_t timeout_ms{60000};
  std::size_t max_output_bytes{1 << 20};
  std::uint64_t max_memory_bytes{0};     // 0 = unlimited
  std::uint64_t max_file_size_bytes{0};  // 0 = unlimited
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // non-empty when the child could not be spawned

  bool ok() const { return error_message.empty() && !timed_out && exit_code == 0; }
};

ProcessResult run_process(const ProcessSpec& spec);

// Look `name` up in a colon-separated search path (empty = $PATH). Returns the absolute
// path of the first executable regular file, or "" when none is found.
std::string find_executable(const std::string& name, const std::string& search_path = "");

}  // namespace strata
