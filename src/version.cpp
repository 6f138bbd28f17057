#include "strata/version.hpp"

#include <sstream>

#include "strata/hash.hpp"

namespace strata {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.hash_primitive = "blake3";
  m.hash_backend = hash_backend_version();
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"semver\":\"" << m.semver << "\""
    << ",\"queue_format\":" << m.queue_format
    << ",\"analysis_schema\":" << m.analysis_schema
    << ",\"report_schema\":" << m.report_schema
    << ",\"vault_format\":" << m.vault_format
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_backend\":\"" << m.hash_backend << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace strata
