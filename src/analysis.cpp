#include "strata/analysis.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

#include "strata/hash.hpp"
#include "strata/log.hpp"
#include "strata/observability.hpp"
#include "strata/version.hpp"

namespace fs = std::filesystem;

namespace strata {

namespace {

// Facets see at most this many leading bytes of a leaf.
constexpr std::size_t kMaxLeafBytes = 256u * 1024 * 1024;

using jsonlite::make_bool;
using jsonlite::make_string;
using jsonlite::make_string_array;
using jsonlite::make_u64;

std::string read_prefix(const std::string& path, std::size_t max_bytes, bool& truncated) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("cannot open " + path);
  std::string data;
  char buf[65536];
  while (ifs && data.size() < max_bytes) {
    ifs.read(buf, static_cast<std::streamsize>(std::min(sizeof(buf), max_bytes - data.size())));
    data.append(buf, static_cast<std::size_t>(ifs.gcount()));
  }
  if (ifs.bad()) throw std::runtime_error("read failed on " + path);
  truncated = ifs.peek() != std::char_traits<char>::eof();
  return data;
}

std::uint64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - start)
                                        .count());
}

jsonlite::Value match_to_json(const SignatureMatch& m) {
  jsonlite::Object o;
  o["rule_name"] = make_string(m.rule_name);
  o["severity"] = make_string(m.severity);
  o["matched_strings"] = make_string_array(m.matched_strings);
  o["source_rule"] = make_string(m.source_rule);
  return jsonlite::Value{std::move(o)};
}

jsonlite::Value facts_to_json(const ExecutableFacts& f) {
  jsonlite::Object o;
  o["format"] = make_string(f.format);
  o["machine"] = make_u64(f.machine);
  o["section_count"] = make_u64(f.section_count);
  o["import_count"] = make_u64(f.import_count);
  o["suspicious_imports"] = make_string_array(f.suspicious_imports);
  jsonlite::Array sections;
  for (const auto& s : f.high_entropy_sections) {
    jsonlite::Object so;
    so["name"] = make_string(s.name);
    so["entropy"] = jsonlite::Value{s.entropy};
    sections.push_back(jsonlite::Value{std::move(so)});
  }
  o["high_entropy_sections"] = jsonlite::Value{std::move(sections)};
  o["has_overlay"] = make_bool(f.has_overlay);
  o["overlay_size"] = make_u64(f.overlay_size);
  o["is_packed"] = make_bool(f.is_packed);
  return jsonlite::Value{std::move(o)};
}

ExecutableFacts facts_from_json(const jsonlite::Object& o) {
  ExecutableFacts f;
  f.format = jsonlite::get_string(o, "format");
  f.machine = static_cast<std::uint16_t>(jsonlite::get_u64(o, "machine"));
  f.section_count = jsonlite::get_u64(o, "section_count");
  f.import_count = jsonlite::get_u64(o, "import_count");
  f.suspicious_imports = jsonlite::get_string_array(o, "suspicious_imports");
  if (const auto* arr = jsonlite::get_array(o, "high_entropy_sections")) {
    for (const auto& v : *arr) {
      if (const auto* so = std::get_if<jsonlite::Object>(&v.v)) {
        f.high_entropy_sections.push_back(
            {jsonlite::get_string(*so, "name"), jsonlite::get_double(*so, "entropy")});
      }
    }
  }
  f.has_overlay = jsonlite::get_bool(o, "has_overlay");
  f.overlay_size = jsonlite::get_u64(o, "overlay_size");
  f.is_packed = jsonlite::get_bool(o, "is_packed");
  return f;
}

}  // namespace

std::string to_string(NodeKind kind) { return kind == NodeKind::container ? "container" : "leaf"; }

std::string analysis_id_for(const std::string& content_hash) {
  return "static_" + short_id(content_hash);
}

RiskAssessment assess_leaf(const AnalysisResult& leaf) {
  RiskSignals s;
  s.signature_match = !leaf.signature_matches.empty();
  s.executable_flag = leaf.executable_analysis.has_value() && leaf.executable_analysis->flagged();
  s.indicator = !leaf.extracted_indicators.empty();
  return assess(s);
}

void fold_children(AnalysisResult& node) {
  std::uint32_t score = node.risk.score;
  for (const auto& c : node.children) {
    node.signature_matches.insert(node.signature_matches.end(), c.signature_matches.begin(),
                                  c.signature_matches.end());
    auto& ind = node.extracted_indicators;
    ind.urls.insert(ind.urls.end(), c.extracted_indicators.urls.begin(),
                    c.extracted_indicators.urls.end());
    ind.ips.insert(ind.ips.end(), c.extracted_indicators.ips.begin(),
                   c.extracted_indicators.ips.end());
    score = std::max(score, c.risk.score);
  }
  node.risk = assess_score(score);
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

jsonlite::Value analysis_to_json(const AnalysisResult& r) {
  jsonlite::Object o;
  o["schema_version"] = make_u64(version::ANALYSIS_SCHEMA_VERSION);
  o["analysis_id"] = make_string(r.analysis_id);
  o["node_kind"] = make_string(to_string(r.kind));
  o["depth"] = make_u64(r.depth);

  jsonlite::Object fi;
  fi["hash"] = make_string(r.file_info.hash);
  fi["path"] = make_string(r.file_info.path);
  fi["mime_type"] = make_string(r.file_info.mime_type);
  fi["size_bytes"] = make_u64(r.file_info.size_bytes);
  o["file_info"] = jsonlite::Value{std::move(fi)};

  jsonlite::Array matches;
  for (const auto& m : r.signature_matches) matches.push_back(match_to_json(m));
  o["signature_matches"] = jsonlite::Value{std::move(matches)};

  if (r.executable_analysis) o["executable_analysis"] = facts_to_json(*r.executable_analysis);

  jsonlite::Object ind;
  ind["urls"] = make_string_array(r.extracted_indicators.urls);
  ind["ips"] = make_string_array(r.extracted_indicators.ips);
  o["extracted_indicators"] = jsonlite::Value{std::move(ind)};

  jsonlite::Array children;
  for (const auto& c : r.children) children.push_back(analysis_to_json(c));
  o["children"] = jsonlite::Value{std::move(children)};

  jsonlite::Object risk;
  risk["score"] = make_u64(r.risk.score);
  risk["level"] = make_string(to_string(r.risk.level));
  risk["recommendation"] = make_string(r.risk.recommendation);
  o["risk"] = jsonlite::Value{std::move(risk)};

  o["status"] = make_string(to_string(r.status));
  if (r.status == NodeStatus::failed) {
    o["error"] = make_string(r.error);
    o["error_code"] = make_string(to_string(r.error_code));
  }
  if (!r.facet_errors.empty()) o["facet_errors"] = make_string_array(r.facet_errors);
  o["duration_ms"] = make_u64(r.duration_ms);
  return jsonlite::Value{std::move(o)};
}

std::string analysis_to_json_text(const AnalysisResult& result) {
  return jsonlite::to_pretty_json(analysis_to_json(result));
}

std::optional<AnalysisResult> analysis_from_json(const jsonlite::Object& o) {
  const auto* fi = jsonlite::get_object(o, "file_info");
  const auto* risk = jsonlite::get_object(o, "risk");
  if (!fi || !risk) return std::nullopt;

  AnalysisResult r;
  r.analysis_id = jsonlite::get_string(o, "analysis_id");
  r.kind = jsonlite::get_string(o, "node_kind") == "container" ? NodeKind::container : NodeKind::leaf;
  r.depth = static_cast<std::uint32_t>(jsonlite::get_u64(o, "depth"));
  r.file_info.hash = jsonlite::get_string(*fi, "hash");
  r.file_info.path = jsonlite::get_string(*fi, "path");
  r.file_info.mime_type = jsonlite::get_string(*fi, "mime_type");
  r.file_info.size_bytes = jsonlite::get_u64(*fi, "size_bytes");

  if (const auto* arr = jsonlite::get_array(o, "signature_matches")) {
    for (const auto& v : *arr) {
      const auto* mo = std::get_if<jsonlite::Object>(&v.v);
      if (!mo) continue;
      SignatureMatch m;
      m.rule_name = jsonlite::get_string(*mo, "rule_name");
      m.severity = jsonlite::get_string(*mo, "severity");
      m.matched_strings = jsonlite::get_string_array(*mo, "matched_strings");
      m.source_rule = jsonlite::get_string(*mo, "source_rule");
      r.signature_matches.push_back(std::move(m));
    }
  }
  if (const auto* ea = jsonlite::get_object(o, "executable_analysis")) {
    r.executable_analysis = facts_from_json(*ea);
  }
  if (const auto* ind = jsonlite::get_object(o, "extracted_indicators")) {
    r.extracted_indicators.urls = jsonlite::get_string_array(*ind, "urls");
    r.extracted_indicators.ips = jsonlite::get_string_array(*ind, "ips");
  }
  if (const auto* arr = jsonlite::get_array(o, "children")) {
    for (const auto& v : *arr) {
      const auto* co = std::get_if<jsonlite::Object>(&v.v);
      if (!co) continue;
      auto child = analysis_from_json(*co);
      if (child) r.children.push_back(std::move(*child));
    }
  }

  r.risk.score = static_cast<std::uint32_t>(jsonlite::get_u64(*risk, "score"));
  r.risk.level = parse_risk_level(jsonlite::get_string(*risk, "level")).value_or(RiskLevel::low);
  r.risk.recommendation = jsonlite::get_string(*risk, "recommendation", "MONITOR");
  r.status = jsonlite::get_string(o, "status") == "failed" ? NodeStatus::failed : NodeStatus::analyzed;
  r.error = jsonlite::get_string(o, "error");
  r.error_code = parse_error_code(jsonlite::get_string(o, "error_code"));
  r.facet_errors = jsonlite::get_string_array(o, "facet_errors");
  r.duration_ms = jsonlite::get_u64(o, "duration_ms");
  return r;
}

// ---------------------------------------------------------------------------
// AnalysisEngine
// ---------------------------------------------------------------------------

AnalysisEngine::AnalysisEngine(const ISignatureEngine& signatures, const MimeSniffer& sniffer,
                               const ArchiveExtractor& extractor, std::uint32_t max_depth,
                               PipelineStats* stats)
    : signatures_(signatures),
      sniffer_(sniffer),
      extractor_(extractor),
      max_depth_(max_depth),
      stats_(stats) {}

AnalysisResult AnalysisEngine::analyze(const std::string& path, const std::string& content_hash,
                                       std::uint32_t depth) const {
  return analyze_node(path, path, content_hash, depth);
}

AnalysisResult AnalysisEngine::analyze_node(const std::string& on_disk,
                                            const std::string& display_path,
                                            const std::string& content_hash,
                                            std::uint32_t depth) const {
  auto logger = log::get("engine");
  const auto start = std::chrono::steady_clock::now();

  AnalysisResult node;
  node.analysis_id = analysis_id_for(content_hash);
  node.file_info.hash = content_hash;
  node.file_info.path = display_path;
  node.depth = depth;

  if (depth > max_depth_) {
    node.status = NodeStatus::failed;
    node.error = kDepthExceededMessage;
    node.error_code = ErrorCode::recursion_limit_exceeded;
    node.risk = assess_score(0);
    logger->warn("{}: {} at depth {} (max {})", to_string(node.error_code), display_path, depth,
                 max_depth_);
    return node;
  }

  try {
    std::error_code ec;
    node.file_info.size_bytes = fs::file_size(on_disk, ec);
    if (ec) throw std::runtime_error("cannot stat " + display_path + ": " + ec.message());
    node.file_info.mime_type = sniffer_.sniff(on_disk);

    const auto family = container_family_for(node.file_info.mime_type);
    if (family != ContainerFamily::none) {
      node.kind = NodeKind::container;
      analyze_container(node, on_disk, family);
    } else {
      analyze_leaf(node, on_disk);
    }
  } catch (const std::exception& e) {
    node.status = NodeStatus::failed;
    node.error = e.what();
    node.error_code = ErrorCode::analysis_failed;
    logger->error("analysis of {} failed: {}", display_path, e.what());
  }

  node.duration_ms = elapsed_ms(start);
  if (stats_) stats_->artifacts_analyzed.fetch_add(1, std::memory_order_relaxed);
  logger->debug("{} {} depth={} mime={} score={} status={} ({} ms)", to_string(node.kind),
                display_path, depth, node.file_info.mime_type, node.risk.score,
                to_string(node.status), node.duration_ms);
  return node;
}

void AnalysisEngine::analyze_leaf(AnalysisResult& node, const std::string& on_disk) const {
  auto logger = log::get("engine");
  bool truncated = false;
  const std::string data = read_prefix(on_disk, kMaxLeafBytes, truncated);
  if (truncated) {
    node.facet_errors.push_back("content: facets limited to the first " +
                                std::to_string(kMaxLeafBytes) + " bytes");
  }

  try {
    node.signature_matches = signatures_.scan_file(on_disk);
  } catch (const std::exception& e) {
    node.facet_errors.push_back(std::string("signatures: ") + e.what());
    logger->warn("signature facet failed on {}: {}", node.file_info.path, e.what());
  }

  if (looks_like_pe(data)) {
    try {
      node.executable_analysis = inspect_pe(data);
    } catch (const PeParseError& e) {
      logger->debug("{} on {}: {}", to_string(ErrorCode::parse_failed), node.file_info.path,
                    e.what());
    } catch (const std::exception& e) {
      node.facet_errors.push_back(std::string("executable: ") + e.what());
      logger->warn("executable facet failed on {}: {}", node.file_info.path, e.what());
    }
  }

  try {
    node.extracted_indicators = extract_indicators(data);
  } catch (const std::exception& e) {
    node.facet_errors.push_back(std::string("indicators: ") + e.what());
    logger->warn("indicator facet failed on {}: {}", node.file_info.path, e.what());
  }

  node.risk = assess_leaf(node);
}

void AnalysisEngine::analyze_container(AnalysisResult& node, const std::string& on_disk,
                                       ContainerFamily family) const {
  ExtractionResult ex = extractor_.extract(on_disk, family);
  if (!ex.ok()) {
    if (stats_) stats_->extraction_failures.fetch_add(1, std::memory_order_relaxed);
    node.status = NodeStatus::failed;
    node.error = ex.detail;
    node.error_code = ex.error;
    fold_children(node);
    return;
  }
  if (stats_) stats_->containers_extracted.fetch_add(1, std::memory_order_relaxed);

  try {
    for (const auto& member : ex.members) {
      const std::string rel = member.lexically_relative(ex.dir->path()).generic_string();
      const std::string display = node.file_info.path + "!/" + rel;
      const std::string hash = hash_file_hex(member.string());
      if (hash.empty()) {
        AnalysisResult child;
        child.file_info.path = display;
        child.depth = node.depth + 1;
        child.status = NodeStatus::failed;
        child.error = "cannot read extracted member";
        child.error_code = ErrorCode::io_error;
        node.children.push_back(std::move(child));
        continue;
      }
      node.children.push_back(analyze_node(member.string(), display, hash, node.depth + 1));
    }
  } catch (const std::exception& e) {
    node.status = NodeStatus::failed;
    node.error = e.what();
    node.error_code = ErrorCode::analysis_failed;
    log::get("engine")->error("container {} aborted after {} member(s): {}", node.file_info.path,
                              node.children.size(), e.what());
  }
  fold_children(node);
}

}  // namespace strata
