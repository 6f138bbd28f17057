#include <archive.h>
#include <archive_entry.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "strata/analysis.hpp"
#include "strata/config.hpp"
#include "strata/content_type.hpp"
#include "strata/extract.hpp"
#include "strata/fsutil.hpp"
#include "strata/hash.hpp"
#include "strata/indicators.hpp"
#include "strata/jsonlite.hpp"
#include "strata/log.hpp"
#include "strata/observability.hpp"
#include "strata/orchestrator.hpp"
#include "strata/pe_inspect.hpp"
#include "strata/poller.hpp"
#include "strata/process.hpp"
#include "strata/producer.hpp"
#include "strata/queue_store.hpp"
#include "strata/report.hpp"
#include "strata/risk.hpp"
#include "strata/signatures.hpp"
#include "strata/vault.hpp"
#include "strata/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ============================================================================
// Fixtures
// ============================================================================

constexpr const char* kMarker = "STRATA-TEST-SIGNATURE";

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("strata_" + name + "_test");
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

void write_bytes(const fs::path& p, const std::string& data) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << data;
  expect(static_cast<bool>(ofs), "write " + p.string());
}

std::string read_bytes(const fs::path& p) {
  const auto data = strata::read_file(p);
  expect(data.has_value(), "read " + p.string());
  return *data;
}

using Members = std::vector<std::pair<std::string, std::string>>;

void write_archive(const fs::path& out, bool zip, const Members& members) {
  fs::create_directories(out.parent_path());
  struct archive* a = archive_write_new();
  if (zip) {
    archive_write_set_format_zip(a);
  } else {
    archive_write_set_format_ustar(a);
  }
  expect(archive_write_open_filename(a, out.c_str()) == ARCHIVE_OK, "open " + out.string());
  for (const auto& [name, data] : members) {
    struct archive_entry* e = archive_entry_new();
    archive_entry_set_pathname(e, name.c_str());
    archive_entry_set_filetype(e, AE_IFREG);
    archive_entry_set_perm(e, 0644);
    archive_entry_set_size(e, static_cast<la_int64_t>(data.size()));
    expect(archive_write_header(a, e) == ARCHIVE_OK, "archive header for " + name);
    if (!data.empty()) {
      expect(archive_write_data(a, data.data(), data.size()) ==
                 static_cast<la_ssize_t>(data.size()),
             "archive data for " + name);
    }
    archive_entry_free(e);
  }
  expect(archive_write_close(a) == ARCHIVE_OK, "close " + out.string());
  archive_write_free(a);
}

void put16(std::string& b, std::size_t off, std::uint16_t v) {
  b[off] = static_cast<char>(v & 0xff);
  b[off + 1] = static_cast<char>(v >> 8);
}

void put32(std::string& b, std::size_t off, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) b[off + i] = static_cast<char>((v >> (8 * i)) & 0xff);
}

// Minimal PE32 image:
//   .text  raw 0x200..0x400, every byte value twice (entropy 8.0)
//   .idata raw 0x400..0x600, one descriptor importing kernel32!VirtualAlloc
std::string build_pe(const std::string& marker = "") {
  std::string b(0x600, '\0');
  b[0] = 'M';
  b[1] = 'Z';
  put32(b, 0x3c, 0x80);
  b.replace(0x80, 4, std::string("PE\0\0", 4));
  put16(b, 0x84, 0x14c);   // i386
  put16(b, 0x86, 2);       // sections
  put16(b, 0x94, 0xE0);    // optional header size
  put16(b, 0x96, 0x0102);  // characteristics
  put16(b, 0x98, 0x10b);   // PE32
  put32(b, 0x98 + 92, 16);
  put32(b, 0x98 + 96 + 8, 0x2000);  // import directory
  put32(b, 0x98 + 96 + 12, 40);

  auto section = [&](std::size_t h, const char* name, std::uint32_t va, std::uint32_t raw_ptr) {
    std::memcpy(&b[h], name, std::strlen(name));
    put32(b, h + 8, 0x200);
    put32(b, h + 12, va);
    put32(b, h + 16, 0x200);
    put32(b, h + 20, raw_ptr);
  };
  section(0x178, ".text", 0x1000, 0x200);
  section(0x1A0, ".idata", 0x2000, 0x400);

  for (std::size_t i = 0; i < 0x200; ++i) b[0x200 + i] = static_cast<char>(i & 0xff);

  put32(b, 0x400, 0x2040);  // OriginalFirstThunk
  put32(b, 0x40C, 0x2060);  // Name
  put32(b, 0x410, 0x2040);  // FirstThunk
  put32(b, 0x440, 0x2080);  // hint/name RVA
  std::memcpy(&b[0x460], "kernel32.dll", 12);
  std::memcpy(&b[0x482], "VirtualAlloc", 12);
  if (!marker.empty()) b.replace(0x500, marker.size(), marker);
  return b;
}

// Reports one match whenever the file contains kMarker.
class MarkerSignatures final : public strata::ISignatureEngine {
 public:
  std::vector<strata::SignatureMatch> scan_file(const std::string& path) const override {
    const auto data = strata::read_file(path);
    if (!data) throw std::runtime_error("cannot read " + path);
    const auto at = data->find(kMarker);
    if (at == std::string::npos) return {};
    strata::SignatureMatch m;
    m.rule_name = "Test_Malware_Marker";
    m.severity = strata::severity_for_rule(m.rule_name);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "0x%zx:$marker", at);
    m.matched_strings = {buf};
    m.source_rule = "test-rules";
    return {m};
  }
  std::size_t rule_set_count() const override { return 1; }
};

class ThrowingSignatures final : public strata::ISignatureEngine {
 public:
  std::vector<strata::SignatureMatch> scan_file(const std::string&) const override {
    throw std::runtime_error("rule engine unavailable");
  }
  std::size_t rule_set_count() const override { return 0; }
};

// One on-disk pipeline under a fresh root.
struct Pipeline {
  fs::path root;
  strata::Config cfg;
  strata::Layout layout;
  strata::QueueStore queue;
  strata::MimeSniffer sniffer;
  MarkerSignatures signatures;
  strata::ArchiveExtractor extractor;
  strata::PipelineStats stats;
  strata::AnalysisEngine engine;

  static strata::Config config_for(const fs::path& root) {
    strata::Config c;
    c.root = root.string();
    return c;
  }

  explicit Pipeline(const std::string& name)
      : root(fresh_dir(name)),
        cfg(config_for(root)),
        layout(cfg.layout()),
        queue(layout.queue_file, layout.lock_file),
        extractor(layout.scratch_dir, strata::ExtractionLimits{}),
        engine(signatures, sniffer, extractor, 3, &stats) {
    std::string err;
    expect(strata::ensure_layout(layout, &err), "ensure_layout: " + err);
  }
  ~Pipeline() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }
};

bool scratch_is_empty(const fs::path& scratch) {
  std::error_code ec;
  return !fs::exists(scratch, ec) || fs::is_empty(scratch, ec);
}

const strata::JobEntry* find_job(const std::vector<strata::JobEntry>& jobs,
                                 const std::string& hash) {
  for (const auto& j : jobs) {
    if (j.content_hash == hash) return &j;
  }
  return nullptr;
}

void expect_score_monotonic(const strata::AnalysisResult& node) {
  for (const auto& c : node.children) {
    expect(node.risk.score >= c.risk.score,
           "parent score below child score at " + node.file_info.path);
    expect_score_monotonic(c);
  }
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(strata::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(strata::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_file_hash_and_ids() {
  const fs::path tmp = fresh_dir("hash");
  write_bytes(tmp / "f.bin", "hello");
  const std::string h = strata::hash_file_hex((tmp / "f.bin").string());
  expect(h == strata::blake3_hex("hello"), "file hash equals buffer hash");
  expect(strata::is_hex_digest(h), "digest is 64 lowercase hex chars");
  expect(strata::short_id(h) == "ea8f163d", "job id is first 8 hex chars");
  expect(strata::analysis_id_for(h) == "static_ea8f163d", "analysis id");
  expect(strata::hash_file_hex((tmp / "missing").string()).empty(), "missing file hashes empty");
  fs::remove_all(tmp);
}

// ============================================================================
// Risk scoring
// ============================================================================

void test_risk_thresholds() {
  expect(strata::score_signals({true, true, true}) == 100, "all signals sum to 100");
  expect(strata::score_signals({false, false, false}) == 0, "no signals score 0");
  expect(strata::level_for_score(70) == strata::RiskLevel::medium, "70 is MEDIUM");
  expect(strata::level_for_score(71) == strata::RiskLevel::high, "71 is HIGH");
  expect(strata::level_for_score(40) == strata::RiskLevel::low, "40 is LOW");
  expect(strata::level_for_score(41) == strata::RiskLevel::medium, "41 is MEDIUM");

  const auto sig_only = strata::assess({true, false, false});
  expect(sig_only.score == 50 && sig_only.level == strata::RiskLevel::medium, "signature only");
  expect(sig_only.recommendation == "MONITOR", "MEDIUM keeps the MONITOR recommendation");
  const auto b = strata::assess({true, true, false});
  expect(b.score == 85 && b.recommendation == "QUARANTINE", "signature + executable");
  const auto ind = strata::assess({false, false, true});
  expect(ind.score == 15 && ind.level == strata::RiskLevel::low, "indicator only");
  expect(ind.recommendation == "MONITOR", "LOW recommends MONITOR");
}

void test_overall_ladder() {
  expect(strata::overall_level(140) == "CRITICAL", "140 CRITICAL");
  expect(strata::overall_level(139) == "HIGH", "139 HIGH");
  expect(strata::overall_level(100) == "HIGH", "100 HIGH");
  expect(strata::overall_level(99) == "MEDIUM", "99 MEDIUM");
  expect(strata::overall_level(60) == "MEDIUM", "60 MEDIUM");
  expect(strata::overall_level(59) == "LOW", "59 LOW");
  expect(strata::overall_level(30) == "LOW", "30 LOW");
  expect(strata::overall_level(29) == "INFO", "29 INFO");
  expect(strata::overall_level(0) == "INFO", "0 INFO");
}

void test_fold_children() {
  strata::AnalysisResult parent;
  parent.kind = strata::NodeKind::container;
  strata::AnalysisResult clean;
  clean.risk = strata::assess_score(0);
  strata::AnalysisResult dirty;
  dirty.signature_matches.push_back({"Rule_A", "MEDIUM", {}, "set"});
  dirty.extracted_indicators.ips = {"8.8.8.8"};
  dirty.risk = strata::assess_score(65);
  parent.children = {clean, dirty, dirty};
  strata::fold_children(parent);
  expect(parent.risk.score == 65, "parent takes max child score");
  expect(parent.risk.level == strata::RiskLevel::medium, "level recomputed from folded score");
  expect(parent.signature_matches.size() == 2, "matches concatenated, not deduplicated");
  expect(parent.extracted_indicators.ips.size() == 2, "indicators concatenated");
}

// ============================================================================
// Indicators
// ============================================================================

void test_public_ipv4_filter() {
  expect(strata::is_public_ipv4("8.8.8.8"), "8.8.8.8 is public");
  expect(strata::is_public_ipv4("172.32.0.1"), "172.32/16 is public");
  expect(!strata::is_public_ipv4("10.1.2.3"), "10/8 private");
  expect(!strata::is_public_ipv4("172.16.0.1"), "172.16/12 private");
  expect(!strata::is_public_ipv4("192.168.0.1"), "192.168/16 private");
  expect(!strata::is_public_ipv4("127.0.0.1"), "loopback");
  expect(!strata::is_public_ipv4("169.254.1.1"), "link-local");
  expect(!strata::is_public_ipv4("255.255.255.255"), "broadcast");
  expect(!strata::is_public_ipv4("256.1.1.1"), "octet out of range");
  expect(!strata::is_public_ipv4("08.8.8.8"), "leading zero");
  expect(!strata::is_public_ipv4("1.2.3"), "three octets");
}

void test_indicator_extraction() {
  const std::string text =
      "fetch http://evil.example.com/path?q=1 then https://cdn.example.net/a%20b "
      "call 8.8.8.8 or 8.8.8.8 not 10.0.0.1 nor 127.0.0.1 nor 999.1.1.1 nor v1.2.3.4x\n";
  const auto ind = strata::extract_indicators(text);
  expect(ind.urls.size() == 2, "two URLs");
  expect(ind.urls[0] == "http://evil.example.com/path?q=1", "first URL");
  expect(ind.urls[1] == "https://cdn.example.net/a%20b", "percent-escaped URL");
  expect(ind.ips.size() == 1 && ind.ips[0] == "8.8.8.8", "public IPs deduplicated");
  expect(strata::extract_indicators("no network here").empty(), "nothing to extract");
}

// ============================================================================
// Executable inspection
// ============================================================================

void test_entropy() {
  expect(strata::shannon_entropy("") == 0.0, "empty entropy");
  expect(strata::shannon_entropy("aaaa") == 0.0, "uniform byte entropy");
  std::string all(256, '\0');
  for (int i = 0; i < 256; ++i) all[i] = static_cast<char>(i);
  expect(strata::shannon_entropy(all) > 7.99, "all byte values give 8 bits");
}

void test_pe_inspection() {
  const auto facts = strata::inspect_pe(build_pe());
  expect(facts.format == "PE32", "PE32 format");
  expect(facts.machine == 0x14c, "machine");
  expect(facts.section_count == 2, "two sections");
  expect(facts.import_count == 1, "one import");
  expect(facts.suspicious_imports.size() == 1 && facts.suspicious_imports[0] == "VirtualAlloc",
         "VirtualAlloc flagged");
  expect(facts.high_entropy_sections.size() == 1 && facts.high_entropy_sections[0].name == ".text",
         ".text is high entropy");
  expect(!facts.has_overlay, "no overlay");
  expect(!facts.is_packed, "not packed");
  expect(facts.flagged(), "facts raise the executable signal");

  const auto with_overlay = strata::inspect_pe(build_pe() + std::string(16, 'Z'));
  expect(with_overlay.has_overlay && with_overlay.overlay_size == 16, "overlay measured");
}

void test_pe_parse_failure() {
  bool threw = false;
  try {
    strata::inspect_pe(std::string("MZ") + std::string(10, '\0'));
  } catch (const strata::PeParseError&) {
    threw = true;
  }
  expect(threw, "truncated image raises PeParseError");
  expect(!strata::looks_like_pe("ELF"), "non-MZ is not PE");
}

// ============================================================================
// Signatures
// ============================================================================

void test_severity_for_rule() {
  expect(strata::severity_for_rule("Win_Malware_Dropper") == "HIGH", "malware escalates");
  expect(strata::severity_for_rule("MALWARE_generic") == "HIGH", "case-insensitive");
  expect(strata::severity_for_rule("Suspicious_Packer") == "MEDIUM", "default MEDIUM");
}

void test_yara_engine() {
  const fs::path tmp = fresh_dir("yara");
  strata::YaraSignatureEngine engine;
  std::string err;
  const std::string rule = std::string("rule Evil_Malware_Test { strings: $a = \"") + kMarker +
                           "\" condition: $a }";
  expect(engine.add_source("inline", rule, &err), "rule compiles: " + err);
  expect(!engine.add_source("broken", "rule { nope", &err), "bad rule rejected");
  expect(!err.empty(), "compiler diagnostics reported");
  expect(engine.rule_set_count() == 1, "only the good set is kept");

  write_bytes(tmp / "hit.bin", std::string(kMarker) + " trailing bytes");
  write_bytes(tmp / "miss.bin", "benign content");
  const auto hits = engine.scan_file((tmp / "hit.bin").string());
  expect(hits.size() == 1, "one rule matched");
  expect(hits[0].rule_name == "Evil_Malware_Test", "rule name");
  expect(hits[0].severity == "HIGH", "severity from rule name");
  expect(hits[0].source_rule == "inline", "source rule set");
  expect(hits[0].matched_strings.size() == 1 && hits[0].matched_strings[0] == "0x0:$a",
         "matched string rendered as offset:identifier");
  expect(engine.scan_file((tmp / "miss.bin").string()).empty(), "no match on benign file");

  write_bytes(tmp / "rules" / "a.yar", "rule Dir_Rule { condition: true }");
  write_bytes(tmp / "rules" / "notes.txt", "not a rule");
  strata::YaraSignatureEngine from_dir;
  expect(from_dir.load_directory((tmp / "rules").string()) == 1, "one rule file loaded");
  expect(from_dir.load_directory((tmp / "absent").string()) == 0, "missing dir adds nothing");
  fs::remove_all(tmp);
}

// ============================================================================
// Archive safety layer
// ============================================================================

void test_member_path_checks() {
  const fs::path base = "/scratch/work";
  expect(strata::member_path_is_safe(base, "a/b.txt"), "nested member");
  expect(strata::member_path_is_safe(base, "a/../b.txt"), "dotdot staying inside");
  expect(!strata::member_path_is_safe(base, "../x"), "parent escape");
  expect(!strata::member_path_is_safe(base, "a/../../x"), "nested escape");
  expect(!strata::member_path_is_safe(base, "/etc/passwd"), "absolute path");
  expect(!strata::member_path_is_safe(base, "C:\\Windows\\x"), "drive letter");
  expect(!strata::member_path_is_safe(base, "..\\..\\evil"), "backslash escape");
  expect(!strata::member_path_is_safe(base, ""), "empty name");
}

void test_zip_extraction() {
  const fs::path tmp = fresh_dir("zip_extract");
  write_archive(tmp / "ok.zip", true, {{"a.txt", "alpha"}, {"dir/b.txt", "beta"}, {"c.txt", ""}});
  expect(strata::zip_declared_entries((tmp / "ok.zip").string()) == 3u, "EOCD count");

  const strata::ArchiveExtractor ex(tmp / "scratch", {});
  fs::path workdir;
  {
    auto res = ex.extract((tmp / "ok.zip").string(), strata::ContainerFamily::zip);
    expect(res.ok(), "zip extracted: " + res.detail);
    expect(res.members.size() == 3, "three members on disk");
    workdir = res.dir->path();
    expect(read_bytes(workdir / "dir" / "b.txt") == "beta", "member content");
    expect(workdir.parent_path() == tmp / "scratch", "workdir under scratch root");
  }
  expect(!fs::exists(workdir), "workdir released with the result");
  fs::remove_all(tmp);
}

void test_tar_extraction() {
  const fs::path tmp = fresh_dir("tar_extract");
  write_archive(tmp / "ok.tar", false, {{"x/one.txt", "1"}, {"two.txt", "2"}});
  const strata::ArchiveExtractor ex(tmp / "scratch", {});
  auto res = ex.extract((tmp / "ok.tar").string(), strata::ContainerFamily::tar);
  expect(res.ok(), "tar extracted: " + res.detail);
  expect(res.members.size() == 2, "two members");
  expect(res.members[0].filename() == "two.txt" || res.members[1].filename() == "two.txt",
         "flat member present");
  fs::remove_all(tmp);
}

void test_traversal_rejected() {
  const fs::path tmp = fresh_dir("traversal");
  write_archive(tmp / "evil.zip", true, {{"fine.txt", "ok"}, {"../../evil", "pwned"}});
  const strata::ArchiveExtractor ex(tmp / "scratch", {});
  auto res = ex.extract((tmp / "evil.zip").string(), strata::ContainerFamily::zip);
  expect(!res.ok(), "traversal archive fails");
  expect(res.error == strata::ErrorCode::extraction_traversal_violation, "traversal error code");
  expect(!res.dir.has_value() && res.members.empty(), "no partial directory returned");
  expect(!fs::exists(tmp / "evil"), "nothing written outside the workdir");
  expect(scratch_is_empty(tmp / "scratch"), "workdir removed");

  write_archive(tmp / "abs.tar", false, {{"/tmp/strata_abs_evil", "pwned"}});
  auto abs = ex.extract((tmp / "abs.tar").string(), strata::ContainerFamily::tar);
  expect(abs.error == strata::ErrorCode::extraction_traversal_violation, "absolute member rejected");
  expect(!fs::exists("/tmp/strata_abs_evil"), "absolute member not written");
  fs::remove_all(tmp);
}

void test_declared_count_cap() {
  const fs::path tmp = fresh_dir("count_cap");
  Members many;
  for (int i = 0; i < 150; ++i) many.push_back({"f" + std::to_string(1000 + i) + ".txt", "x"});
  write_archive(tmp / "many.zip", true, many);
  expect(strata::zip_declared_entries((tmp / "many.zip").string()) == 150u, "declares 150");

  const strata::ArchiveExtractor ex(tmp / "scratch", {});
  auto res = ex.extract((tmp / "many.zip").string(), strata::ContainerFamily::zip);
  expect(res.error == strata::ErrorCode::extraction_count_exceeded, "declared count rejected");
  expect(scratch_is_empty(tmp / "scratch"), "nothing left behind");
  fs::remove_all(tmp);
}

void test_underreported_count_cap() {
  const fs::path tmp = fresh_dir("count_lie");
  Members many;
  for (int i = 0; i < 150; ++i) many.push_back({"f" + std::to_string(1000 + i) + ".txt", "x"});
  write_archive(tmp / "lie.zip", true, many);

  // Rewrite the EOCD total-entries field to claim 50 members.
  std::string bytes = read_bytes(tmp / "lie.zip");
  const auto eocd = bytes.rfind(std::string("PK\x05\x06", 4));
  expect(eocd != std::string::npos, "EOCD present");
  put16(bytes, eocd + 10, 50);
  write_bytes(tmp / "lie.zip", bytes);
  expect(strata::zip_declared_entries((tmp / "lie.zip").string()) == 50u, "now declares 50");

  const strata::ArchiveExtractor ex(tmp / "scratch", {});
  auto res = ex.extract((tmp / "lie.zip").string(), strata::ContainerFamily::zip);
  expect(res.error == strata::ErrorCode::extraction_count_exceeded, "real count still enforced");
  expect(scratch_is_empty(tmp / "scratch"), "nothing left behind");
  fs::remove_all(tmp);
}

void test_size_cap() {
  const fs::path tmp = fresh_dir("size_cap");
  write_archive(tmp / "big.zip", true, {{"a.bin", std::string(4096, 'A')}});
  strata::ExtractionLimits limits;
  limits.max_total_bytes = 1024;
  const strata::ArchiveExtractor ex(tmp / "scratch", limits);
  auto res = ex.extract((tmp / "big.zip").string(), strata::ContainerFamily::zip);
  expect(res.error == strata::ErrorCode::extraction_size_exceeded, "byte cap enforced");
  fs::remove_all(tmp);
}

void test_bad_container() {
  const fs::path tmp = fresh_dir("bad_container");
  write_bytes(tmp / "junk.zip", std::string("PK\x03\x04", 4) + "junk");
  const strata::ArchiveExtractor ex(tmp / "scratch", {});
  auto res = ex.extract((tmp / "junk.zip").string(), strata::ContainerFamily::zip);
  expect(!res.ok(), "junk fails");
  expect(res.error == strata::ErrorCode::extraction_bad_container, "bad container code");
  fs::remove_all(tmp);
}

void test_workdir_collision() {
  const fs::path tmp = fresh_dir("collision");
  auto first = strata::ScratchDir::create_named(tmp, "job");
  bool collided = false;
  try {
    strata::ScratchDir::create_named(tmp, "job");
  } catch (const strata::ExtractionError& e) {
    collided = e.code() == strata::ErrorCode::extraction_workdir_collision;
  }
  expect(collided, "second create of the same name fails");
  expect(fs::exists(first.path()), "first directory untouched");
  fs::remove_all(tmp);
}

void test_no_external_extractor() {
  const fs::path tmp = fresh_dir("no_extractor");
  fs::create_directories(tmp / "empty_bin");
  write_bytes(tmp / "a.7z", std::string("7z\xbc\xaf\x27\x1c", 6) + std::string(32, '\0'));
  strata::ExtractionLimits limits;
  limits.extractor_search_path = (tmp / "empty_bin").string();
  const strata::ArchiveExtractor ex(tmp / "scratch", limits);
  auto res = ex.extract((tmp / "a.7z").string(), strata::ContainerFamily::external);
  expect(res.error == strata::ErrorCode::extraction_no_extractor, "no extractor on search path");
  expect(scratch_is_empty(tmp / "scratch"), "workdir removed");
  fs::remove_all(tmp);
}

void test_container_family_mapping() {
  expect(strata::container_family_for("application/zip") == strata::ContainerFamily::zip, "zip");
  expect(strata::container_family_for("application/gzip") == strata::ContainerFamily::tar, "gzip");
  expect(strata::container_family_for("application/x-7z-compressed") ==
             strata::ContainerFamily::external,
         "7z");
  expect(strata::container_family_for("application/vnd.rar") == strata::ContainerFamily::external,
         "rar");
  expect(strata::container_family_for("text/plain") == strata::ContainerFamily::none, "text");

  const fs::path tmp = fresh_dir("sniff");
  write_archive(tmp / "a.bin", true, {{"x.txt", "x"}});
  const strata::MimeSniffer sniffer;
  expect(strata::container_family_for(sniffer.sniff((tmp / "a.bin").string())) ==
             strata::ContainerFamily::zip,
         "zip sniffed by content, not name");
  fs::remove_all(tmp);
}

// ============================================================================
// Recursive analysis engine
// ============================================================================

void test_scenario_a_plain_text() {
  Pipeline p("scenario_a");
  const fs::path f = p.root / "note.txt";
  write_bytes(f, "beacon to 8.8.8.8 every hour\n");
  const auto r = p.engine.analyze(f.string(), strata::hash_file_hex(f.string()));
  expect(r.kind == strata::NodeKind::leaf, "plain text is a leaf");
  expect(r.status == strata::NodeStatus::analyzed, "analyzed");
  expect(r.risk.score == 15, "indicator only scores 15");
  expect(r.risk.level == strata::RiskLevel::low, "LOW");
  expect(r.risk.recommendation == "MONITOR", "MONITOR");
  expect(!r.executable_analysis.has_value(), "no executable facts");
  expect(r.file_info.size_bytes == 29, "size recorded");
}

void test_scenario_b_executable() {
  Pipeline p("scenario_b");
  const fs::path f = p.root / "dropper.exe";
  write_bytes(f, build_pe(kMarker));
  const auto r = p.engine.analyze(f.string(), strata::hash_file_hex(f.string()));
  expect(r.kind == strata::NodeKind::leaf, "executable is a leaf");
  expect(r.executable_analysis.has_value(), "executable facts attached");
  expect(r.signature_matches.size() == 1, "one signature match");
  expect(r.extracted_indicators.empty(), "no indicators");
  expect(r.risk.score == 85, "50 + 35");
  expect(r.risk.level == strata::RiskLevel::high, "HIGH");
  expect(r.risk.recommendation == "QUARANTINE", "QUARANTINE");
}

void test_scenario_c_container() {
  Pipeline p("scenario_c");
  const fs::path z = p.root / "bundle.zip";
  write_archive(z, true, {{"clean.txt", "nothing to see here\n"}, {"evil.exe", build_pe(kMarker)}});
  const auto r = p.engine.analyze(z.string(), strata::hash_file_hex(z.string()));
  expect(r.kind == strata::NodeKind::container, "zip is a container");
  expect(r.status == strata::NodeStatus::analyzed, "analyzed");
  expect(r.children.size() == 2, "two children");
  expect(r.children[0].file_info.path == z.string() + "!/clean.txt", "child display path");
  expect(r.children[0].risk.score == 0 && r.children[1].risk.score == 85, "child scores");
  expect(r.children[1].depth == 1, "child depth");
  expect(r.risk.score == 85 && r.risk.level == strata::RiskLevel::high, "max aggregation");
  expect(r.signature_matches.size() == 1, "child match folded into parent");
  expect_score_monotonic(r);
  expect(scratch_is_empty(p.layout.scratch_dir), "working directories released");
  expect(p.stats.containers_extracted.load() == 1, "container counted");
}

void test_depth_bound() {
  Pipeline p("depth_bound");
  fs::path inner = p.root / "level5.txt";
  write_bytes(inner, "innermost 8.8.8.8\n");
  for (int level = 4; level >= 0; --level) {
    const fs::path outer = p.root / ("level" + std::to_string(level) + ".zip");
    write_archive(outer, true, {{inner.filename().string(), read_bytes(inner)}});
    inner = outer;
  }

  const auto r = p.engine.analyze(inner.string(), strata::hash_file_hex(inner.string()));
  expect(r.status == strata::NodeStatus::analyzed, "root still analyzed");
  const strata::AnalysisResult* node = &r;
  for (std::uint32_t d = 0; d <= 3; ++d) {
    expect(node->depth == d, "depth " + std::to_string(d));
    expect(node->kind == strata::NodeKind::container, "container at depth " + std::to_string(d));
    expect(node->children.size() == 1, "one child at depth " + std::to_string(d));
    node = &node->children[0];
  }
  expect(node->depth == 4, "deepest node is depth 4");
  expect(node->status == strata::NodeStatus::failed, "depth 4 fails");
  expect(node->error == strata::kDepthExceededMessage, "depth error message");
  expect(node->error_code == strata::ErrorCode::recursion_limit_exceeded, "depth error code");
  expect(node->children.empty(), "nothing produced beyond depth 4");
  expect(r.risk.score == 0, "innermost indicator never reached");
  expect(scratch_is_empty(p.layout.scratch_dir), "working directories released");
}

void test_failed_child_is_folded() {
  Pipeline p("failed_child");
  const fs::path evil = p.root / "evil.zip";
  write_archive(evil, true, {{"../../evil", "x"}});
  const fs::path outer = p.root / "outer.zip";
  write_archive(outer, true,
                {{"a.txt", "see http://bad.example.org/x\n"}, {"evil.zip", read_bytes(evil)}});
  const auto r = p.engine.analyze(outer.string(), strata::hash_file_hex(outer.string()));
  expect(r.status == strata::NodeStatus::analyzed, "parent survives a failed child");
  expect(r.children.size() == 2, "both children present");
  const auto& bad = r.children[1];
  expect(bad.status == strata::NodeStatus::failed, "inner archive failed");
  expect(bad.error_code == strata::ErrorCode::extraction_traversal_violation, "cause recorded");
  expect(r.children[0].risk.score == 15, "sibling still analyzed");
  expect(r.risk.score == 15, "parent folds sibling score");
  expect(r.extracted_indicators.urls.size() == 1, "sibling indicator folded");
  expect(p.stats.extraction_failures.load() == 1, "failure counted");
}

void test_facet_isolation() {
  const fs::path tmp = fresh_dir("facet_isolation");
  const strata::MimeSniffer sniffer;
  const ThrowingSignatures broken;
  const strata::ArchiveExtractor ex(tmp / "scratch", {});
  const strata::AnalysisEngine engine(broken, sniffer, ex);
  write_bytes(tmp / "x.exe", build_pe());
  const auto r = engine.analyze((tmp / "x.exe").string(), "00");
  expect(r.status == strata::NodeStatus::analyzed, "facet failure does not fail the artifact");
  expect(r.facet_errors.size() == 1, "facet error recorded");
  expect(r.executable_analysis.has_value(), "other facets still ran");
  expect(r.risk.score == 35, "executable signal only");
  fs::remove_all(tmp);
}

void test_analysis_json_contract() {
  Pipeline p("analysis_json");
  const fs::path z = p.root / "bundle.zip";
  write_archive(z, true, {{"evil.exe", build_pe(kMarker)}});
  const auto r = p.engine.analyze(z.string(), strata::hash_file_hex(z.string()));

  std::optional<strata::jsonlite::JsonError> err;
  const auto obj = strata::jsonlite::parse(strata::analysis_to_json_text(r), &err);
  expect(!err, "analysis JSON parses");
  expect(strata::jsonlite::get_u64(obj, "schema_version") == strata::version::ANALYSIS_SCHEMA_VERSION,
         "schema version");
  expect(strata::jsonlite::get_string(obj, "node_kind") == "container", "node kind");
  const auto back = strata::analysis_from_json(obj);
  expect(back.has_value(), "decodes");
  expect(back->risk.score == 85 && back->children.size() == 1, "tree preserved");
  expect(back->children[0].executable_analysis.has_value(), "facts preserved");
  expect(back->children[0].executable_analysis->suspicious_imports.size() == 1, "imports preserved");
}

// ============================================================================
// Queue store
// ============================================================================

strata::JobEntry make_job(const std::string& tag, strata::JobStatus status) {
  strata::JobEntry j;
  j.content_hash = strata::blake3_hex(tag);
  j.job_id = strata::short_id(j.content_hash);
  j.status = status;
  j.created_at = strata::utc_timestamp_iso8601();
  return j;
}

void test_state_machine() {
  using strata::JobStatus;
  expect(strata::can_transition(JobStatus::pending, JobStatus::analyzing), "pending -> analyzing");
  expect(strata::can_transition(JobStatus::analyzing, JobStatus::analyzed), "analyzing -> analyzed");
  expect(strata::can_transition(JobStatus::analyzing, JobStatus::failed), "analyzing -> failed");
  expect(strata::can_transition(JobStatus::analyzed, JobStatus::reported), "analyzed -> reported");
  expect(!strata::can_transition(JobStatus::pending, JobStatus::analyzed), "no skipping");
  expect(!strata::can_transition(JobStatus::reported, JobStatus::pending), "reported terminal");
  expect(!strata::can_transition(JobStatus::failed, JobStatus::reported), "failed terminal");
  expect(!strata::can_transition(JobStatus::analyzing, JobStatus::analyzing), "no self edge");
  expect(strata::is_terminal(JobStatus::failed) && strata::is_terminal(JobStatus::reported),
         "failed and reported are terminal");
  expect(!strata::is_terminal(JobStatus::pending) && !strata::is_terminal(JobStatus::analyzing) &&
             !strata::is_terminal(JobStatus::analyzed),
         "live states are not terminal");

  auto j = make_job("sm", JobStatus::pending);
  expect(!strata::advance(j, JobStatus::reported) && j.status == JobStatus::pending,
         "rejected advance leaves job untouched");
  expect(strata::advance(j, JobStatus::analyzing) && j.status == JobStatus::analyzing, "advance");
}

void test_queue_missing_and_corrupt() {
  const fs::path tmp = fresh_dir("queue_corrupt");
  const strata::QueueStore q((tmp / "queue.json").string(), (tmp / "queue.json.lock").string());
  expect(q.load().empty(), "missing document is an empty queue");

  write_bytes(tmp / "queue.json", "  \n");
  expect(q.load().empty(), "blank document is an empty queue");
  expect(!fs::exists(tmp / "queue.json.corrupt"), "blank document is not quarantined");

  write_bytes(tmp / "queue.json", "[{\"job_id\": \"x\", ");
  expect(q.load().empty(), "corrupt document is an empty queue");
  expect(fs::exists(tmp / "queue.json.corrupt"), "corrupt document preserved");

  write_bytes(tmp / "queue.json", "{\"not\": \"an array\"}");
  expect(q.load().empty(), "non-array root is an empty queue");

  q.save({make_job("a", strata::JobStatus::pending)});
  const auto jobs = q.load();
  expect(jobs.size() == 1 && jobs[0].status == strata::JobStatus::pending, "save heals the queue");
  fs::remove_all(tmp);
}

void test_queue_document_format() {
  const fs::path tmp = fresh_dir("queue_format");
  const strata::QueueStore q((tmp / "queue.json").string(), (tmp / "queue.json.lock").string());
  auto failed = make_job("f", strata::JobStatus::failed);
  failed.error = "relocation failed: gone";
  failed.error_code = strata::ErrorCode::relocation_failed;
  q.save({make_job("p", strata::JobStatus::pending), failed});

  std::optional<strata::jsonlite::JsonError> err;
  const auto root = strata::jsonlite::parse_value(read_bytes(tmp / "queue.json"), &err);
  expect(!err, "queue document is JSON");
  const auto* arr = std::get_if<strata::jsonlite::Array>(&root.v);
  expect(arr && arr->size() == 2, "array of two entries");
  const auto& first = std::get<strata::jsonlite::Object>((*arr)[0].v);
  expect(strata::jsonlite::get_string(first, "status") == "pending", "status string");
  expect(first.find("error") == first.end(), "no error on a healthy entry");
  const auto& second = std::get<strata::jsonlite::Object>((*arr)[1].v);
  expect(strata::jsonlite::get_string(second, "error_code") == "relocation_failed", "error code");

  const auto back = q.load();
  expect(back[1].error == failed.error && back[1].error_code == failed.error_code, "reload");
  fs::remove_all(tmp);
}

void test_queue_concurrent_transactions() {
  const fs::path tmp = fresh_dir("queue_concurrency");
  const strata::QueueStore q((tmp / "queue.json").string(), (tmp / "queue.json.lock").string());
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&q, t] {
      for (int i = 0; i < 25; ++i) {
        q.transact([&](std::vector<strata::JobEntry>& jobs) {
          jobs.push_back(
              make_job("t" + std::to_string(t) + "-" + std::to_string(i), strata::JobStatus::pending));
          return true;
        });
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(q.load().size() == 100, "no lost updates under the lock");

  const bool saved = q.transact([](std::vector<strata::JobEntry>& jobs) {
    jobs.clear();
    return false;
  });
  expect(!saved && q.load().size() == 100, "declined mutation is not persisted");
  fs::remove_all(tmp);
}

void test_queue_lock_timeout() {
  const fs::path tmp = fresh_dir("queue_lock");
  const std::string lock = (tmp / "queue.json.lock").string();
  const strata::QueueStore q((tmp / "queue.json").string(), lock, std::chrono::milliseconds(50));
  bool timed_out = false;
  {
    strata::QueueLock held(lock, std::chrono::milliseconds(1000));
    try {
      q.load();
    } catch (const strata::QueueLockTimeout&) {
      timed_out = true;
    }
  }
  expect(timed_out, "second locker times out");
  expect(q.load().empty(), "lock released with its holder");
  fs::remove_all(tmp);
}

// ============================================================================
// Producer
// ============================================================================

void test_producer_dedup() {
  Pipeline p("producer");
  write_bytes(p.root / "in" / "a.txt", "same bytes");
  write_bytes(p.root / "in" / "copy-of-a.txt", "same bytes");
  write_bytes(p.root / "in" / "b.txt", "other bytes");
  const strata::Producer producer(p.queue, p.sniffer, p.layout.intake_dir);

  const auto a = producer.add((p.root / "in" / "a.txt").string());
  expect(a.outcome == strata::AddOutcome::added, "first add queued");
  const auto again = producer.add((p.root / "in" / "copy-of-a.txt").string());
  expect(again.outcome == strata::AddOutcome::duplicate, "same content is a duplicate");
  expect(again.job_id == a.job_id, "duplicate reports the existing job id");
  const auto b = producer.add((p.root / "in" / "b.txt").string());
  expect(b.outcome == strata::AddOutcome::added, "different content queued");
  const auto missing = producer.add((p.root / "in" / "nope").string());
  expect(missing.outcome == strata::AddOutcome::rejected, "missing file rejected");

  const auto jobs = p.queue.load();
  expect(jobs.size() == 2, "exactly one entry per content hash");
  const auto* ja = find_job(jobs, strata::blake3_hex("same bytes"));
  expect(ja != nullptr, "entry keyed by content hash");
  expect(ja->job_id == a.job_id && ja->status == strata::JobStatus::pending, "pending entry");
  expect(fs::path(ja->shared_path).filename() == a.job_id + "-a.txt", "intake copy naming");
  expect(read_bytes(ja->shared_path) == "same bytes", "intake copy content");
  expect(fs::exists(p.root / "in" / "a.txt"), "original left in place");

  std::size_t intake_files = 0;
  for (const auto& e : fs::directory_iterator(p.layout.intake_dir)) {
    (void)e;
    ++intake_files;
  }
  expect(intake_files == 2, "no staging leftovers");
}

void test_scan_filters() {
  const fs::path tmp = fresh_dir("scan");
  write_bytes(tmp / "a.exe", "a");
  write_bytes(tmp / "b.exe.part", "b");
  write_bytes(tmp / "notes.txt", "n");
  write_bytes(tmp / "sub" / "c.exe", "c");
  write_bytes(tmp / "sub" / "d.EXE.CRDOWNLOAD", "d");

  const auto rec = strata::scan_directory(tmp.string(), true, {"*.exe"});
  expect(rec.size() == 2, "recursive scan finds two executables");
  expect(fs::path(rec[0]).filename() == "a.exe" && fs::path(rec[1]).filename() == "c.exe",
         "sorted results");
  const auto flat = strata::scan_directory(tmp.string(), false, {"*.exe"});
  expect(flat.size() == 1, "non-recursive scan stays at top level");
  const auto all = strata::scan_directory(tmp.string(), false, {"*"});
  expect(all.size() == 2, "temp download names skipped");
  expect(strata::is_temp_download("X.CRDOWNLOAD"), "case-insensitive temp suffix");
  expect(!strata::is_temp_download("report.pdf"), "ordinary name");
  expect(strata::is_temp_download("setup.exe.part"), "suffix matched at the end");
  expect(!strata::is_temp_download("notes.part.txt"), "suffix elsewhere in the name ignored");
  expect(strata::is_temp_download(".part"), "bare suffix is still a temp name");
  fs::remove_all(tmp);
}

// ============================================================================
// Orchestrator and report builder
// ============================================================================

void test_pipeline_end_to_end() {
  Pipeline p("end_to_end");
  write_bytes(p.root / "in" / "note.txt", "beacon to 8.8.8.8\n");
  write_bytes(p.root / "in" / "dropper.exe", build_pe(kMarker));
  const strata::Producer producer(p.queue, p.sniffer, p.layout.intake_dir);
  expect(producer.add((p.root / "in" / "note.txt").string()).outcome == strata::AddOutcome::added,
         "text queued");
  expect(producer.add((p.root / "in" / "dropper.exe").string()).outcome ==
             strata::AddOutcome::added,
         "executable queued");

  const strata::SampleVault vault(p.layout.vault_dir);
  strata::AnalysisOrchestrator orch(p.queue, p.engine, p.layout.processing_dir,
                                    p.layout.output_dir, &vault, p.stats);
  expect(orch.drain() == 2, "two jobs handled");
  expect(orch.drain() == 0, "nothing left pending");

  const std::string text_hash = strata::blake3_hex("beacon to 8.8.8.8\n");
  const std::string exe_hash = strata::blake3_hex(build_pe(kMarker));
  auto jobs = p.queue.load();
  for (const auto& j : jobs) {
    expect(j.status == strata::JobStatus::analyzed, "job analyzed");
    expect(j.static_output_path == (fs::path(p.layout.output_dir) / (j.content_hash + ".json")).string(),
           "hash-named analysis output");
    expect(fs::exists(j.static_output_path), "analysis output written");
    expect(!fs::exists(j.shared_path), "intake copy relocated");
    expect(vault.contains(j.content_hash), "sample vaulted");
  }
  expect(fs::is_empty(p.layout.processing_dir), "processing copies removed after vaulting");
  expect(vault.get(exe_hash) == build_pe(kMarker), "vault returns original bytes");
  expect(p.stats.jobs_analyzed.load() == 2 && p.stats.job_latency.count() == 2, "stats");

  strata::ReportBuilder builder(p.queue, p.layout.reports_dir, p.stats);
  expect(builder.run_once() == 2, "two reports built");
  jobs = p.queue.load();
  const auto* exe = find_job(jobs, exe_hash);
  const auto* txt = find_job(jobs, text_hash);
  expect(exe && txt, "jobs still present");
  expect(exe->status == strata::JobStatus::reported, "reported");
  expect(exe->report_path ==
             (fs::path(p.layout.reports_dir) / ("report-" + exe_hash + ".json")).string(),
         "report path embeds content hash");
  expect(fs::exists(exe->report_md_path), "markdown report written");

  std::optional<strata::jsonlite::JsonError> err;
  const auto report = strata::jsonlite::parse(read_bytes(exe->report_path), &err);
  expect(!err, "report JSON parses");
  expect(strata::jsonlite::get_string(report, "report_id") == "report-" + exe_hash, "report id");
  const auto* overall = strata::jsonlite::get_object(report, "overall_risk");
  expect(overall && strata::jsonlite::get_u64(*overall, "score") == 85, "overall score");
  expect(strata::jsonlite::get_string(*overall, "level") == "MEDIUM", "85 is MEDIUM on job ladder");
  const auto* info = strata::jsonlite::get_object(report, "file_info");
  expect(info && strata::jsonlite::get_string(*info, "job_id") == exe->job_id, "job metadata merged");
  expect(strata::jsonlite::get_object(report, "static_analysis") != nullptr, "analysis embedded");

  const auto txt_report = strata::jsonlite::parse(read_bytes(txt->report_path), &err);
  const auto* txt_overall = strata::jsonlite::get_object(txt_report, "overall_risk");
  expect(txt_overall && strata::jsonlite::get_string(*txt_overall, "level") == "INFO", "15 is INFO");

  const std::string md = read_bytes(exe->report_md_path);
  expect(md.find("Risk-MEDIUM-yellow") != std::string::npos, "badge in markdown");
  expect(md.find("| Test_Malware_Marker | HIGH |") != std::string::npos, "signature table row");
}

void test_reporting_idempotent() {
  Pipeline p("report_idempotent");
  write_bytes(p.root / "in" / "x.txt", "visit https://bad.example.org/\n");
  const strata::Producer producer(p.queue, p.sniffer, p.layout.intake_dir);
  producer.add((p.root / "in" / "x.txt").string());
  strata::AnalysisOrchestrator orch(p.queue, p.engine, p.layout.processing_dir,
                                    p.layout.output_dir, nullptr, p.stats);
  orch.drain();
  strata::ReportBuilder builder(p.queue, p.layout.reports_dir, p.stats);
  expect(builder.run_once() == 1, "first run reports");

  const auto before = p.queue.load();
  const std::string json_before = read_bytes(before[0].report_path);
  expect(builder.run_once() == 0, "second run is a no-op");
  const auto after = p.queue.load();
  expect(after[0].report_path == before[0].report_path, "report_path unchanged");
  expect(read_bytes(after[0].report_path) == json_before, "report not rewritten");

  std::size_t reports = 0;
  for (const auto& e : fs::directory_iterator(p.layout.reports_dir)) {
    (void)e;
    ++reports;
  }
  expect(reports == 2, "one JSON and one markdown file");

  // A crash between writing the report and updating the queue leaves the files behind.
  auto rewound = after;
  rewound[0].status = strata::JobStatus::analyzed;
  rewound[0].report_path.clear();
  rewound[0].report_md_path.clear();
  p.queue.save(rewound);
  expect(builder.run_once() == 1, "entry re-reported");
  expect(read_bytes(p.queue.load()[0].report_path) == json_before, "existing report reused");
}

void test_relocation_failure() {
  Pipeline p("relocation_failure");
  write_bytes(p.root / "in" / "gone.txt", "soon gone");
  write_bytes(p.root / "in" / "ok.txt", "still here");
  const strata::Producer producer(p.queue, p.sniffer, p.layout.intake_dir);
  producer.add((p.root / "in" / "gone.txt").string());
  producer.add((p.root / "in" / "ok.txt").string());
  auto jobs = p.queue.load();
  fs::remove(jobs[0].shared_path);

  strata::AnalysisOrchestrator orch(p.queue, p.engine, p.layout.processing_dir,
                                    p.layout.output_dir, nullptr, p.stats);
  expect(orch.drain() == 2, "scan continues past the failed move");
  jobs = p.queue.load();
  expect(jobs[0].status == strata::JobStatus::failed, "missing intake copy fails the job");
  expect(jobs[0].error_code == strata::ErrorCode::relocation_failed, "relocation error code");
  expect(!jobs[0].error.empty(), "error message kept");
  expect(jobs[1].status == strata::JobStatus::analyzed, "next job analyzed");
  expect(p.stats.jobs_failed.load() == 1, "failure counted");
  expect(p.stats.job_latency.count() == 2, "latency recorded on the early-failure path too");

  strata::ReportBuilder builder(p.queue, p.layout.reports_dir, p.stats);
  expect(builder.run_once() == 1, "failed jobs are not reported");
}

void test_claim_skips_non_pending() {
  Pipeline p("claim_skip");
  auto stuck = make_job("stuck", strata::JobStatus::analyzing);
  const fs::path shared = fs::path(p.layout.intake_dir) / "fresh.txt";
  write_bytes(shared, "fresh");
  strata::JobEntry fresh;
  fresh.content_hash = strata::blake3_hex("fresh");
  fresh.job_id = strata::short_id(fresh.content_hash);
  fresh.shared_path = shared.string();
  fresh.status = strata::JobStatus::pending;
  p.queue.save({stuck, fresh});

  strata::AnalysisOrchestrator orch(p.queue, p.engine, p.layout.processing_dir,
                                    p.layout.output_dir, nullptr, p.stats);
  expect(orch.process_next(), "pending job claimed");
  expect(!orch.process_next(), "nothing else to claim");
  const auto jobs = p.queue.load();
  expect(jobs[0].status == strata::JobStatus::analyzing, "stuck job left visible");
  expect(jobs[1].status == strata::JobStatus::analyzed, "pending job analyzed");
  expect(fs::exists(fs::path(p.layout.processing_dir) / "fresh.txt"), "kept without a vault");
}

void test_failed_top_level_marks_job_failed() {
  Pipeline p("top_level_failure");
  write_archive(p.root / "in" / "evil.zip", true, {{"../../evil", "x"}});
  const strata::Producer producer(p.queue, p.sniffer, p.layout.intake_dir);
  producer.add((p.root / "in" / "evil.zip").string());
  strata::AnalysisOrchestrator orch(p.queue, p.engine, p.layout.processing_dir,
                                    p.layout.output_dir, nullptr, p.stats);
  orch.drain();
  const auto jobs = p.queue.load();
  expect(jobs[0].status == strata::JobStatus::failed, "top-level failure fails the job");
  expect(jobs[0].error_code == strata::ErrorCode::extraction_traversal_violation, "cause kept");
  expect(fs::exists(jobs[0].static_output_path), "failed analysis still persisted");
}

void test_markdown_rendering() {
  strata::JobEntry job = make_job("md", strata::JobStatus::analyzed);
  job.original_path = "/downloads/a|b.zip";
  strata::AnalysisResult a;
  a.kind = strata::NodeKind::container;
  a.analysis_id = strata::analysis_id_for(job.content_hash);
  for (int i = 0; i < 12; ++i) {
    a.extracted_indicators.urls.push_back("http://host" + std::to_string(i) + ".example.com/");
  }
  strata::AnalysisResult child;
  child.depth = 1;
  child.file_info.path = "a.zip!/inner.zip";
  child.status = strata::NodeStatus::failed;
  child.error_code = strata::ErrorCode::recursion_limit_exceeded;
  a.children.push_back(child);
  a.risk = strata::assess_score(15);

  const auto record = strata::build_report(job, a);
  expect(record.overall_level == "INFO", "overall level from ladder");
  const std::string md = strata::report_to_markdown(record);
  expect(md.find("http://host9.example.com/") != std::string::npos, "tenth URL shown");
  expect(md.find("http://host10.example.com/") == std::string::npos, "eleventh URL elided");
  expect(md.find("... (2 more)") != std::string::npos, "elision count");
  expect(md.find("recursion_limit_exceeded") != std::string::npos, "member failure listed");
  expect(md.find("Risk-INFO-blue") != std::string::npos, "INFO badge");

  expect(strata::badge_color("CRITICAL") == "red", "critical red");
  expect(strata::badge_color("HIGH") == "orange", "high orange");
  expect(strata::badge_color("LOW") == "green", "low green");

  const auto none = strata::build_report(job, std::nullopt);
  const auto json = strata::report_to_json(none);
  const auto& obj = std::get<strata::jsonlite::Object>(json.v);
  expect(std::holds_alternative<std::nullptr_t>(obj.at("static_analysis").v),
         "missing analysis is null");
  expect(strata::jsonlite::get_u64(obj, "schema_version") == strata::version::REPORT_SCHEMA_VERSION,
         "report schema version");
}

// ============================================================================
// Ambient: vault, process runner, config, poll loop
// ============================================================================

void test_vault_roundtrip() {
  const fs::path tmp = fresh_dir("vault");
  const strata::SampleVault vault((tmp / "vault").string());
  const std::string data = build_pe() + std::string(4096, 'A');
  write_bytes(tmp / "s.bin", data);
  const std::string digest = strata::blake3_hex(data);

  std::string err;
  expect(vault.put_file((tmp / "s.bin").string(), digest, &err), "put: " + err);
  expect(vault.put_file((tmp / "s.bin").string(), digest, &err), "second put is a no-op");
  expect(vault.contains(digest), "contains");
  const auto info = vault.info(digest);
  expect(info && info->original_size == data.size() && info->encoding == "zstd", "meta");
  expect(info->stored_size < data.size(), "stored compressed");
  expect(vault.get(digest) == data, "get returns original bytes");
  expect(vault.object_path(digest).find(digest.substr(0, 2) + "/" + digest.substr(2, 2)) !=
             std::string::npos,
         "sharded layout");

  expect(!vault.put_file((tmp / "s.bin").string(), strata::blake3_hex("other"), &err),
         "digest mismatch rejected");
  expect(!fs::exists(vault.object_path(strata::blake3_hex("other"))),
         "no blob published for a mismatched digest");

  write_bytes(vault.object_path(digest), "tampered");
  expect(!vault.get(digest).has_value(), "tampered blob detected");
  fs::remove_all(tmp);
}

void test_vault_streams_large_samples() {
  const fs::path tmp = fresh_dir("vault_stream");
  const strata::SampleVault vault((tmp / "vault").string());
  // Several compressor input chunks, with both compressible and noisy stretches.
  std::string data;
  data.reserve(3u << 20);
  std::uint64_t x = 0x9e3779b97f4a7c15ull;
  for (int block = 0; block < 48; ++block) {
    if (block % 2 == 0) {
      data.append(65536, static_cast<char>('a' + block % 26));
    } else {
      for (int i = 0; i < 65536; ++i) {
        x ^= x << 13;
        x ^= x >> 7;
        x ^= x << 17;
        data.push_back(static_cast<char>(x & 0xff));
      }
    }
  }
  write_bytes(tmp / "big.bin", data);
  const std::string digest = strata::hash_file_hex((tmp / "big.bin").string());
  expect(digest == strata::blake3_hex(data), "incremental and one-shot digests agree");

  std::string err;
  expect(vault.put_file((tmp / "big.bin").string(), digest, &err), "put: " + err);
  const auto info = vault.info(digest);
  expect(info && info->original_size == data.size(), "original size counted while streaming");
  expect(info->stored_size == fs::file_size(vault.object_path(digest)), "stored size matches blob");
  expect(info->stored_blob_hash == strata::hash_file_hex(vault.object_path(digest)),
         "blob hash computed while writing");
  expect(vault.get(digest) == data, "streamed frame decodes to the sample");

  write_bytes(tmp / "empty.bin", "");
  expect(vault.put_file((tmp / "empty.bin").string(), strata::blake3_hex(""), &err),
         "empty sample stored");
  expect(vault.get(strata::blake3_hex("")) == std::string(), "empty sample round trip");
  fs::remove_all(tmp);
}

void test_atomic_writer_discard() {
  const fs::path tmp = fresh_dir("atomic_writer");
  {
    strata::AtomicFileWriter w(tmp / "out.bin");
    expect(w.write("partial", 7), "chunk written");
  }
  expect(fs::is_empty(tmp), "uncommitted writer leaves nothing behind");
  {
    strata::AtomicFileWriter w(tmp / "out.bin");
    expect(w.write("ab", 2) && w.write("cd", 2) && w.commit(), "chunks committed");
    expect(!w.write("x", 1), "writer closed after commit");
  }
  expect(read_bytes(tmp / "out.bin") == "abcd", "chunks land in order");
  std::size_t entries = 0;
  for (const auto& e : fs::directory_iterator(tmp)) {
    (void)e;
    ++entries;
  }
  expect(entries == 1, "no temp file left after commit");
  fs::remove_all(tmp);
}

void test_process_runner() {
  strata::ProcessSpec ok;
  ok.command = "/bin/sh";
  ok.argv = {"-c", "echo hi; echo err >&2; exit 3"};
  ok.env = {{"PATH", "/usr/bin:/bin"}};
  ok.timeout_ms = 5000;
  const auto r = strata::run_process(ok);
  expect(r.error_message.empty(), "spawned");
  expect(r.stdout_text == "hi\n" && r.stderr_text == "err\n", "output captured");
  expect(r.exit_code == 3 && !r.ok(), "exit code propagated");

  strata::ProcessSpec slow = ok;
  slow.argv = {"-c", "sleep 5"};
  slow.timeout_ms = 200;
  const auto start = std::chrono::steady_clock::now();
  const auto t = strata::run_process(slow);
  expect(t.timed_out && t.exit_code == 124, "timeout enforced");
  expect(std::chrono::steady_clock::now() - start < std::chrono::seconds(3), "killed promptly");

  expect(strata::find_executable("sh", "/bin:/usr/bin").size() > 0, "sh found on search path");
  expect(strata::find_executable("definitely-not-a-tool", "/bin").empty(), "missing tool");
}

void test_config_parse_and_validate() {
  std::string err;
  const auto cfg = strata::parse_config(
      R"({"monitoring": {"watch_directory": "/in", "file_types": ["*.exe"], "recursive": false},
          "pipeline": {"root": "/srv/strata", "max_depth": 5, "max_members": 10,
                       "vault_enabled": false, "unknown": 1}})",
      &err);
  expect(cfg.has_value(), "config parses: " + err);
  expect(cfg->watch_directory == "/in" && !cfg->recursive, "monitoring section");
  expect(cfg->file_types.size() == 1 && cfg->file_types[0] == "*.exe", "file types");
  expect(cfg->max_depth == 5 && cfg->max_members == 10 && !cfg->vault_enabled, "pipeline section");
  expect(cfg->poll_interval_ms == 10000, "defaults kept");

  const auto layout = cfg->layout();
  expect(layout.queue_file == "/srv/strata/queue/queue.json", "queue path");
  expect(layout.lock_file == "/srv/strata/queue/queue.json.lock", "lock path");
  expect(cfg->effective_rules_dir() == "/srv/strata/rules", "default rules dir");

  strata::Config bad;
  bad.max_depth = 17;
  expect(bad.validate(&err) == strata::ErrorCode::config_invalid, "depth above 16 rejected");
  bad.max_depth = 3;
  bad.max_members = 0;
  expect(bad.validate(&err) == strata::ErrorCode::config_invalid, "zero member cap rejected");
  bad.max_members = 1;
  bad.poll_interval_ms = 0;
  expect(bad.validate(&err) == strata::ErrorCode::config_invalid, "zero poll interval rejected");
  expect(!strata::parse_config("{oops", &err).has_value(), "malformed config rejected");
}

void test_poll_loop() {
  std::atomic<bool> stop{false};
  strata::PipelineStats stats;
  int calls = 0;
  strata::run_poll_loop("test", stop, std::chrono::milliseconds(5), stats, [&] {
    ++calls;
    if (calls == 1) throw std::runtime_error("bad cycle");
    stop.store(true);
  });
  expect(calls == 2, "loop survives a throwing cycle");
  expect(stats.cycles.load() == 2, "cycles counted");
}

void test_error_code_names() {
  expect(strata::to_string(strata::ErrorCode::extraction_traversal_violation) ==
             "extraction_traversal_violation",
         "snake_case name");
  expect(strata::parse_error_code("recursion_limit_exceeded") ==
             strata::ErrorCode::recursion_limit_exceeded,
         "round trip");
  expect(strata::to_string(strata::JobStatus::reported) == "reported", "status name");
  expect(strata::parse_job_status("bogus") == std::nullopt, "unknown status");
}

}  // namespace

int main() {
  strata::log::init("tests", "", spdlog::level::off);
  std::cout << "=== Strata Test Suite ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("file hash and identifiers", test_file_hash_and_ids);

  std::cout << "\n[Risk scoring]\n";
  run_test("per-artifact thresholds", test_risk_thresholds);
  run_test("job-level ladder", test_overall_ladder);
  run_test("child folding", test_fold_children);

  std::cout << "\n[Facets]\n";
  run_test("public IPv4 filter", test_public_ipv4_filter);
  run_test("indicator extraction", test_indicator_extraction);
  run_test("byte entropy", test_entropy);
  run_test("PE inspection", test_pe_inspection);
  run_test("PE parse failure", test_pe_parse_failure);
  run_test("severity from rule name", test_severity_for_rule);
  run_test("YARA rule engine", test_yara_engine);

  std::cout << "\n[Archive safety]\n";
  run_test("member path checks", test_member_path_checks);
  run_test("zip extraction", test_zip_extraction);
  run_test("tar extraction", test_tar_extraction);
  run_test("traversal rejected", test_traversal_rejected);
  run_test("declared member cap", test_declared_count_cap);
  run_test("under-reported member cap", test_underreported_count_cap);
  run_test("extracted byte cap", test_size_cap);
  run_test("bad container", test_bad_container);
  run_test("workdir collision", test_workdir_collision);
  run_test("no external extractor", test_no_external_extractor);
  run_test("container family mapping", test_container_family_mapping);

  std::cout << "\n[Analysis engine]\n";
  run_test("plain text with public IP", test_scenario_a_plain_text);
  run_test("flagged executable with signature", test_scenario_b_executable);
  run_test("zip with clean and flagged member", test_scenario_c_container);
  run_test("recursion depth bound", test_depth_bound);
  run_test("failed child folded into parent", test_failed_child_is_folded);
  run_test("facet isolation", test_facet_isolation);
  run_test("analysis JSON contract", test_analysis_json_contract);

  std::cout << "\n[Queue]\n";
  run_test("job state machine", test_state_machine);
  run_test("missing and corrupt queue", test_queue_missing_and_corrupt);
  run_test("queue document format", test_queue_document_format);
  run_test("concurrent transactions", test_queue_concurrent_transactions);
  run_test("lock timeout", test_queue_lock_timeout);
  run_test("producer de-duplication", test_producer_dedup);
  run_test("directory scan filters", test_scan_filters);

  std::cout << "\n[Pipeline]\n";
  run_test("producer -> analyzer -> reporter", test_pipeline_end_to_end);
  run_test("idempotent reporting", test_reporting_idempotent);
  run_test("relocation failure", test_relocation_failure);
  run_test("claim skips non-pending", test_claim_skips_non_pending);
  run_test("top-level failure", test_failed_top_level_marks_job_failed);
  run_test("markdown rendering", test_markdown_rendering);

  std::cout << "\n[Ambient]\n";
  run_test("vault round trip", test_vault_roundtrip);
  run_test("vault streams large samples", test_vault_streams_large_samples);
  run_test("atomic writer discard and commit", test_atomic_writer_discard);
  run_test("process runner", test_process_runner);
  run_test("config parse and validate", test_config_parse_and_validate);
  run_test("poll loop", test_poll_loop);
  run_test("error code names", test_error_code_names);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
