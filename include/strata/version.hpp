#pragma once

// strata/version.hpp — Version manifest for every document strata writes.
//
// INVARIANT:
//   Every JSON document on disk (queue, analysis result, report, vault meta) carries the
//   schema_version constant for its kind. Readers accept equal or older versions only.
//   Bump the constant before any field is renamed or removed.

#include <cstdint>
#include <string>

namespace strata {
namespace version {

constexpr const char* STRATA_SEMVER = "0.3.0";

// ---------------------------------------------------------------------------
// QUEUE_FORMAT_VERSION
// Version 1 = JSON array of JobEntry objects, guarded by a sibling .lock file.
// ---------------------------------------------------------------------------
constexpr uint32_t QUEUE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// ANALYSIS_SCHEMA_VERSION
// Version 1 = AnalysisResult tree with aggregated signature_matches and indicators.
// ---------------------------------------------------------------------------
constexpr uint32_t ANALYSIS_SCHEMA_VERSION = 1;

// ---------------------------------------------------------------------------
// REPORT_SCHEMA_VERSION
// Version 1 = ReportRecord with overall_risk on the CRITICAL..INFO ladder.
// ---------------------------------------------------------------------------
constexpr uint32_t REPORT_SCHEMA_VERSION = 1;

// ---------------------------------------------------------------------------
// VAULT_FORMAT_VERSION
// Version 1 = AB/CD/<64-char-digest> sharding with JSON .meta sidecars.
// ---------------------------------------------------------------------------
constexpr uint32_t VAULT_FORMAT_VERSION = 1;

struct VersionManifest {
  std::string semver{STRATA_SEMVER};
  uint32_t queue_format{QUEUE_FORMAT_VERSION};
  uint32_t analysis_schema{ANALYSIS_SCHEMA_VERSION};
  uint32_t report_schema{REPORT_SCHEMA_VERSION};
  uint32_t vault_format{VAULT_FORMAT_VERSION};
  std::string hash_primitive;   // "blake3"
  std::string hash_backend;     // BLAKE3 library version string
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace strata
