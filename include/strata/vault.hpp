#pragma once

// strata/vault.hpp — Content-addressed, compressed sample vault.
//
// DESIGN INVARIANTS:
//   1. Key = content hash of the original sample bytes (BLAKE3 hex), the same value the
//      queue uses as content_hash.
//   2. Layout: <root>/AB/CD/<digest> (zstd frame) plus <digest>.meta (JSON).
//   3. Writes are atomic: temp file then rename, blob first, meta second. A blob without
//      meta is invisible to get().
//   4. Reads verify both the stored blob hash and the decompressed content hash. Any
//      mismatch returns nullopt, never damaged bytes.
//   5. put() of content already present is a no-op that returns true.

#include <cstdint>
#include <optional>
#include <string>

namespace strata {

struct VaultObjectInfo {
  std::string digest;
  std::string encoding{"zstd"};
  std::uint64_t original_size{0};
  std::uint64_t stored_size{0};
  std::string stored_blob_hash;
  std::string created_at;
};

class SampleVault {
 public:
  explicit SampleVault(std::string root);

  // Store the sample at `path`, whose content hash must equal `digest`.
  bool put_file(const std::string& path, const std::string& digest,
                std::string* error = nullptr) const;

  std::optional<std::string> get(const std::string& digest) const;
  std::optional<VaultObjectInfo> info(const std::string& digest) const;
  bool contains(const std::string& digest) const;

  std::string object_path(const std::string& digest) const;
  std::string meta_path(const std::string& digest) const;

 private:
  std::string root_;
};

}  // namespace strata
