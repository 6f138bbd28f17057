#pragma once

// strata/queue_store.hpp — Durable, lock-guarded job queue.
//
// DOCUMENT:
//   A single JSON array of JobEntry objects at Layout::queue_file. Every reader and
//   writer takes an exclusive flock(2) on the sibling Layout::lock_file first, so one
//   process's load -> mutate -> save cycle is never interleaved with another's.
//
// DURABILITY:
//   save() rewrites the whole document through atomic_write_file(): a crash leaves either
//   the previous or the new document, never a truncated one.
//
// SELF-HEALING READ:
//   A missing document is an empty queue. A document that fails to parse is copied to
//   <queue_file>.corrupt, logged, and treated as empty. Corruption never propagates.
//
// CRITICAL SECTION RULE:
//   Only load -> mutate -> save runs under the lock. Callers must not extract, scan or
//   hash while inside transact().

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "strata/jsonlite.hpp"
#include "strata/types.hpp"

namespace strata {

struct JobEntry {
  std::string job_id;
  std::string original_path;
  std::string shared_path;
  std::string content_hash;
  JobStatus status{JobStatus::pending};
  std::string created_at;
  std::string file_type;
  std::string static_output_path;
  std::string report_path;
  std::string report_md_path;
  std::string error;  // only when status == failed
  ErrorCode error_code{ErrorCode::none};
};

jsonlite::Object job_to_json(const JobEntry& job);
std::optional<JobEntry> job_from_json(const jsonlite::Object& obj);

// Move `job` along one edge of the state machine. Returns false, leaving `job` untouched,
// when `to` is not a successor of the current status.
bool advance(JobEntry& job, JobStatus to);

class QueueLockTimeout : public std::runtime_error {
 public:
  explicit QueueLockTimeout(const std::string& lock_file)
      : std::runtime_error("timed out waiting for queue lock " + lock_file) {}
};

// Exclusive advisory lock held for the lifetime of the object.
class QueueLock {
 public:
  QueueLock(const std::string& lock_file, std::chrono::milliseconds timeout);
  ~QueueLock();
  QueueLock(const QueueLock&) = delete;
  QueueLock& operator=(const QueueLock&) = delete;

 private:
  int fd_{-1};
};

class QueueStore {
 public:
  QueueStore(std::string queue_file, std::string lock_file,
             std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));

  // Each call takes and releases the lock. Throws QueueLockTimeout.
  std::vector<JobEntry> load() const;
  void save(const std::vector<JobEntry>& jobs) const;

  // Lock, load, run `mutate`, and save when it returns true. Returns what `mutate`
  // returned. Throws QueueLockTimeout, or std::runtime_error when the save fails.
  bool transact(const std::function<bool(std::vector<JobEntry>&)>& mutate) const;

  const std::string& queue_file() const { return queue_file_; }

 private:
  std::vector<JobEntry> read_unlocked() const;
  void write_unlocked(const std::vector<JobEntry>& jobs) const;

  std::string queue_file_;
  std::string lock_file_;
  std::chrono::milliseconds lock_timeout_;
};

std::string queue_to_json(const std::vector<JobEntry>& jobs);

}  // namespace strata
