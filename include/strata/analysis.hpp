#pragma once

// strata/analysis.hpp — Recursive static-analysis engine.
//
// RESULT TREE:
//   AnalysisResult is a tagged tree. A leaf carries its own facet findings. A container
//   carries no findings of its own: fold_children() fills its signature_matches and
//   extracted_indicators with the concatenation of its children's (already folded)
//   lists, and sets its score to the maximum child score. So for every node:
//     risk.score >= max(child.risk.score)
//     findings(node) = own findings ++ findings of every descendant
//
// FACET ISOLATION:
//   On a leaf, signature matching, executable inspection and indicator extraction run
//   independently. A facet that throws is recorded in facet_errors and contributes no
//   signal; the other facets still run. A PE parse failure is not a facet error.
//
// FAILURE CONTAINMENT:
//   analyze() never throws. Depth overruns, extraction failures and unexpected faults
//   become a node with status=failed, an error message and an ErrorCode. A failed child
//   is still folded into its parent and does not stop its siblings.
//
// Sibling members are analyzed sequentially, in sorted path order.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "strata/content_type.hpp"
#include "strata/extract.hpp"
#include "strata/indicators.hpp"
#include "strata/jsonlite.hpp"
#include "strata/pe_inspect.hpp"
#include "strata/risk.hpp"
#include "strata/signatures.hpp"
#include "strata/types.hpp"

namespace strata {

struct PipelineStats;

enum class NodeKind {
  leaf,
  container,
};

std::string to_string(NodeKind kind);

struct FileInfo {
  std::string hash;
  std::string path;
  std::string mime_type;
  std::uint64_t size_bytes{0};
};

struct AnalysisResult {
  NodeKind kind{NodeKind::leaf};
  std::string analysis_id;
  FileInfo file_info;
  std::uint32_t depth{0};

  std::vector<SignatureMatch> signature_matches;
  std::optional<ExecutableFacts> executable_analysis;
  Indicators extracted_indicators;
  std::vector<AnalysisResult> children;

  RiskAssessment risk;
  NodeStatus status{NodeStatus::analyzed};
  std::string error;
  ErrorCode error_code{ErrorCode::none};
  std::vector<std::string> facet_errors;
  std::uint64_t duration_ms{0};
};

constexpr const char* kDepthExceededMessage = "max recursion depth exceeded";

// "static_" + first 8 hex chars of the content hash.
std::string analysis_id_for(const std::string& content_hash);

// Merge children into `node`: concatenated findings, max score, level recomputed.
void fold_children(AnalysisResult& node);

// Leaf signals -> assessment.
RiskAssessment assess_leaf(const AnalysisResult& leaf);

jsonlite::Value analysis_to_json(const AnalysisResult& result);
std::string analysis_to_json_text(const AnalysisResult& result);
std::optional<AnalysisResult> analysis_from_json(const jsonlite::Object& obj);

class AnalysisEngine {
 public:
  AnalysisEngine(const ISignatureEngine& signatures, const MimeSniffer& sniffer,
                 const ArchiveExtractor& extractor, std::uint32_t max_depth = 3,
                 PipelineStats* stats = nullptr);

  // Analyze the artifact at `path` whose content hash is `content_hash`. Never throws.
  AnalysisResult analyze(const std::string& path, const std::string& content_hash,
                         std::uint32_t depth = 0) const;

  std::uint32_t max_depth() const { return max_depth_; }

 private:
  AnalysisResult analyze_node(const std::string& on_disk, const std::string& display_path,
                              const std::string& content_hash, std::uint32_t depth) const;
  void analyze_leaf(AnalysisResult& node, const std::string& on_disk) const;
  void analyze_container(AnalysisResult& node, const std::string& on_disk,
                         ContainerFamily family) const;

  const ISignatureEngine& signatures_;
  const MimeSniffer& sniffer_;
  const ArchiveExtractor& extractor_;
  std::uint32_t max_depth_;
  PipelineStats* stats_;
};

}  // namespace strata
