#pragma once

// strata/hash.hpp — Content digests.
//
// BLAKE3-256 is the sole primitive. A job's content_hash, the vault key, and the
// member hashes of extracted archive contents all come from hash_file_hex(), so the
// same bytes always produce the same identifier regardless of where they were found.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace strata {

// Incremental BLAKE3 for data that arrives in chunks.
class Blake3Hasher {
 public:
  Blake3Hasher();
  ~Blake3Hasher();
  Blake3Hasher(const Blake3Hasher&) = delete;
  Blake3Hasher& operator=(const Blake3Hasher&) = delete;

  void update(const void* data, std::size_t len);
  // Lowercase hex of everything fed so far. The hasher may keep being updated.
  std::string hex_digest() const;

 private:
  struct State;
  std::unique_ptr<State> state_;
};

// Lowercase hex of BLAKE3(payload), 64 chars.
std::string blake3_hex(std::string_view payload);

// Stream-hash a file in 64 KB chunks and return the 64-char hex digest.
// Returns "" when the file cannot be opened or a read fails.
std::string hash_file_hex(const std::string& path);

// First 8 hex chars of a content hash. Used as job_id.
std::string short_id(std::string_view content_hash);

// True for a well-formed 64-char lowercase hex digest.
bool is_hex_digest(std::string_view s);

std::string hash_backend_version();

}  // namespace strata
