#pragma once

// strata/extract.hpp — Archive Safety Layer.
//
// CONTRACT:
//   extract(container) either returns an owned, fully populated ScratchDir or a typed
//   failure. A half-populated directory is never handed to the caller: every failure
//   path destroys the working directory before returning.
//
// CHECKS, in order:
//   1. Fresh working directory <scratch_root>/<stem>_<ms>_<rand>. An existing name is a
//      hard failure (workdir_collision), never reused.
//   2. Declared member count (zip end-of-central-directory record, external lister).
//   3. Every member name is validated lexically against the working directory before
//      anything is written: absolute names, root names and ".." escapes abort the whole
//      extraction (traversal_violation).
//   4. Enumerated member count and declared sizes.
//   5. Extraction proper. Only regular files are materialized; symlinks, hard links and
//      special files are skipped. Total bytes written are capped.
//   6. The directory tree on disk is walked and recounted. Symlinks found on disk fail
//      the extraction; so does a file count or byte total over the limits.
//
// External extractors (7z, unrar) run under run_process() with a wall-clock timeout.

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "strata/content_type.hpp"
#include "strata/types.hpp"

namespace strata {

class ExtractionError : public std::runtime_error {
 public:
  ExtractionError(ErrorCode code, const std::string& detail)
      : std::runtime_error(detail), code_(code) {}
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

// Owned working directory, removed recursively on destruction. Move-only.
class ScratchDir {
 public:
  // <root>/<sanitized stem>_<unix ms>_<random hex>
  static ScratchDir create(const std::filesystem::path& root, const std::string& stem);
  // Throws ExtractionError(extraction_workdir_collision) when <root>/<name> exists.
  static ScratchDir create_named(const std::filesystem::path& root, const std::string& name);

  ScratchDir(ScratchDir&& other) noexcept;
  ScratchDir& operator=(ScratchDir&& other) noexcept;
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;
  ~ScratchDir();

  const std::filesystem::path& path() const { return path_; }

 private:
  explicit ScratchDir(std::filesystem::path p) : path_(std::move(p)) {}
  void remove_now() noexcept;

  std::filesystem::path path_;
};

struct ExtractionLimits {
  std::size_t max_members{100};
  std::uint64_t max_total_bytes{512ull * 1024 * 1024};
  std::uint64_t extractor_timeout_ms{60000};
  std::string extractor_search_path;  // empty = $PATH
};

struct ExtractionResult {
  std::optional<ScratchDir> dir;
  std::vector<std::filesystem::path> members;  // regular files on disk, sorted
  ErrorCode error{ErrorCode::none};
  std::string detail;

  bool ok() const { return error == ErrorCode::none && dir.has_value(); }
};

// True when `member_name` stays inside `base` after lexical normalization. Backslashes
// count as separators. Absolute names and names with a root are never inside.
bool member_path_is_safe(const std::filesystem::path& base, const std::string& member_name);

// Total-entries field of the zip end-of-central-directory record. nullopt when the
// record is not found or the archive is zip64.
std::optional<std::uint64_t> zip_declared_entries(const std::string& path);

class ArchiveExtractor {
 public:
  ArchiveExtractor(std::filesystem::path scratch_root, ExtractionLimits limits);

  ExtractionResult extract(const std::string& container_path, ContainerFamily family) const;

  const ExtractionLimits& limits() const { return limits_; }
  const std::filesystem::path& scratch_root() const { return scratch_root_; }

 private:
  void extract_libarchive(const std::string& container, ContainerFamily family,
                          const std::filesystem::path& work) const;
  void extract_external(const std::string& container, const std::filesystem::path& work) const;
  std::vector<std::filesystem::path> verify_tree(const std::filesystem::path& work) const;

  std::filesystem::path scratch_root_;
  ExtractionLimits limits_;
};

}  // namespace strata
