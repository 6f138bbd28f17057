#pragma once

// strata/pe_inspect.hpp — Portable Executable inspection (PE32 and PE32+).
//
// Reads only the structures needed for triage: the section table and the import
// directory. Every offset is bounds-checked against the buffer; a malformed header
// raises PeParseError and yields no facts. Nothing is mapped or executed.

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

class PeParseError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

constexpr double kHighEntropyThreshold = 6.5;

struct SectionEntropy {
  std::string name;
  double entropy{0.0};
};

struct ExecutableFacts {
  std::string format;  // "PE32" | "PE32+"
  std::uint16_t machine{0};
  std::size_t section_count{0};
  std::size_t import_count{0};
  std::vector<std::string> suspicious_imports;
  std::vector<SectionEntropy> high_entropy_sections;
  bool has_overlay{false};
  std::uint64_t overlay_size{0};
  bool is_packed{false};  // some section claims zero raw size

  // Flags that feed the risk score. Overlay presence alone is informational.
  bool flagged() const {
    return !suspicious_imports.empty() || !high_entropy_sections.empty() || is_packed;
  }
};

const std::vector<std::string>& suspicious_import_denylist();

// Shannon entropy in bits per byte, 0.0 for an empty range.
double shannon_entropy(std::string_view bytes);

// True when the buffer starts with an MZ header.
bool looks_like_pe(std::string_view bytes);

// Throws PeParseError when `bytes` is not a well-formed PE32/PE32+ image.
ExecutableFacts inspect_pe(std::string_view bytes);

}  // namespace strata
