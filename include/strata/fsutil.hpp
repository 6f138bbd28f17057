#pragma once

// strata/fsutil.hpp — Small filesystem and clock helpers shared by every store.

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

namespace strata {

// Streaming form of atomic_write_file(). Chunks go to a temp file beside `target`;
// commit() fsyncs and renames it into place. Destroyed uncommitted, the temp file is removed.
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(std::filesystem::path target);
  ~AtomicFileWriter();
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

  bool write(const void* data, std::size_t len, std::string* error = nullptr);
  bool commit(std::string* error = nullptr);

 private:
  void discard() noexcept;

  std::filesystem::path target_;
  std::string tmp_;
  std::FILE* file_{nullptr};
  bool open_failed_{false};
};

// Write to a temp file in the target's directory, fsync, then rename into place.
// Readers observe either the old content or the new content, never a mix.
bool atomic_write_file(const std::filesystem::path& target, const std::string& data,
                       std::string* error = nullptr);

// Whole-file read. nullopt when the file is missing or unreadable.
std::optional<std::string> read_file(const std::filesystem::path& path);

// Relocate a file. rename() when source and destination share a filesystem; otherwise
// copy, then remove the source (and roll back the copy if the source cannot be removed).
bool move_file(const std::filesystem::path& from, const std::filesystem::path& to,
               std::string* error = nullptr);

// True when `candidate`, after lexical normalization, is `base` or lies below it.
bool is_lexically_within(const std::filesystem::path& base,
                         const std::filesystem::path& candidate);

// 2026-01-31T12:34:56.789Z
std::string utc_timestamp_iso8601();

std::uint64_t unix_ms_now();

}  // namespace strata
