#pragma once

// strata/producer.hpp — Queue producer: discovery, hashing, intake, de-duplication.
//
// add(path):
//   1. Copy the file into the intake directory under a staging name (no lock held).
//   2. Hash and sniff the staged copy, so the recorded hash is the hash of exactly the
//      bytes the pipeline will analyze.
//   3. Under the queue lock: when an entry with the same content_hash exists, drop the
//      staged copy and report a duplicate. Otherwise rename the copy to
//      <job_id>-<basename> and append a pending entry.

#include <string>
#include <vector>

#include "strata/content_type.hpp"
#include "strata/queue_store.hpp"

namespace strata {

// In-progress download names (.part, .crdownload, ...), compared case-insensitively.
bool is_temp_download(const std::string& filename);

// fnmatch(3) against any of `patterns`. An empty list matches everything.
bool matches_file_types(const std::string& filename, const std::vector<std::string>& patterns);

// Regular files under `dir` that pass both filters above, sorted.
std::vector<std::string> scan_directory(const std::string& dir, bool recursive,
                                        const std::vector<std::string>& patterns);

enum class AddOutcome {
  added,
  duplicate,
  rejected,
};

struct AddResult {
  AddOutcome outcome{AddOutcome::rejected};
  std::string job_id;
  std::string detail;
};

class Producer {
 public:
  Producer(const QueueStore& queue, const MimeSniffer& sniffer, std::string intake_dir);

  // Never throws for a bad input file; lock timeouts propagate as QueueLockTimeout.
  AddResult add(const std::string& path) const;

 private:
  const QueueStore& queue_;
  const MimeSniffer& sniffer_;
  std::string intake_dir_;
};

}  // namespace strata
