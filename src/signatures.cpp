#include "strata/signatures.hpp"

extern "C" {
#include <yara.h>
}

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <stdexcept>

#include "strata/log.hpp"

namespace fs = std::filesystem;

namespace strata {

namespace {

constexpr std::size_t kMaxStringsPerRule = 64;

struct ScanContext {
  std::vector<SignatureMatch>* out;
  const std::string* set_name;
};

int on_scan_message(YR_SCAN_CONTEXT* context, int message, void* message_data,
                    void* user_data) {
  if (message != CALLBACK_MSG_RULE_MATCHING) return CALLBACK_CONTINUE;
  auto* ctx = static_cast<ScanContext*>(user_data);
  auto* rule = static_cast<YR_RULE*>(message_data);

  SignatureMatch m;
  m.rule_name = rule->identifier ? rule->identifier : "";
  m.severity = severity_for_rule(m.rule_name);
  m.source_rule = *ctx->set_name;

  YR_STRING* string = nullptr;
  yr_rule_strings_foreach(rule, string) {
    YR_MATCH* match = nullptr;
    yr_string_matches_foreach(context, string, match) {
      if (m.matched_strings.size() >= kMaxStringsPerRule) break;
      char buf[32];
      std::snprintf(buf, sizeof(buf), "0x%llx:",
                    static_cast<unsigned long long>(match->base + match->offset));
      m.matched_strings.push_back(buf + std::string(string->identifier ? string->identifier : ""));
    }
  }
  ctx->out->push_back(std::move(m));
  return CALLBACK_CONTINUE;
}

void on_compile_message(int error_level, const char* file_name, int line_number,
                        const YR_RULE* /*rule*/, const char* message, void* user_data) {
  auto* diagnostics = static_cast<std::string*>(user_data);
  if (!diagnostics->empty()) diagnostics->append("; ");
  diagnostics->append(error_level == YARA_ERROR_LEVEL_WARNING ? "warning " : "error ");
  diagnostics->append(file_name ? file_name : "<source>");
  diagnostics->append(":" + std::to_string(line_number) + ": ");
  diagnostics->append(message ? message : "");
}

struct CompilerGuard {
  YR_COMPILER* c{nullptr};
  ~CompilerGuard() {
    if (c) yr_compiler_destroy(c);
  }
};

}  // namespace

std::string severity_for_rule(const std::string& rule_name) {
  std::string lower = rule_name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower.find("malware") != std::string::npos ? "HIGH" : "MEDIUM";
}

struct YaraSignatureEngine::RuleSet {
  std::string name;
  YR_RULES* rules{nullptr};
  ~RuleSet() {
    if (rules) yr_rules_destroy(rules);
  }
};

YaraSignatureEngine::YaraSignatureEngine(int scan_timeout_s) : scan_timeout_s_(scan_timeout_s) {
  const int rc = yr_initialize();
  if (rc != ERROR_SUCCESS) {
    throw std::runtime_error("yr_initialize failed: " + std::to_string(rc));
  }
}

YaraSignatureEngine::~YaraSignatureEngine() {
  sets_.clear();
  yr_finalize();
}

bool YaraSignatureEngine::add_source(const std::string& set_name, const std::string& source,
                                     std::string* error) {
  CompilerGuard guard;
  if (yr_compiler_create(&guard.c) != ERROR_SUCCESS) {
    if (error) *error = "yr_compiler_create failed";
    return false;
  }
  std::string diagnostics;
  yr_compiler_set_callback(guard.c, on_compile_message, &diagnostics);
  if (yr_compiler_add_string(guard.c, source.c_str(), nullptr) != 0) {
    if (error) *error = diagnostics;
    return false;
  }
  auto set = std::make_unique<RuleSet>();
  set->name = set_name;
  if (yr_compiler_get_rules(guard.c, &set->rules) != ERROR_SUCCESS) {
    if (error) *error = "yr_compiler_get_rules failed";
    return false;
  }
  sets_.push_back(std::move(set));
  return true;
}

std::size_t YaraSignatureEngine::load_directory(const std::string& dir) {
  auto logger = log::get("rules");
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    logger->warn("rules directory {} not found; signature matching disabled", dir);
    return 0;
  }

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    const auto ext = entry.path().extension().string();
    if (entry.is_regular_file() && (ext == ".yar" || ext == ".yara")) files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());

  std::size_t added = 0;
  for (const auto& f : files) {
    CompilerGuard guard;
    if (yr_compiler_create(&guard.c) != ERROR_SUCCESS) {
      logger->error("yr_compiler_create failed");
      break;
    }
    std::string diagnostics;
    yr_compiler_set_callback(guard.c, on_compile_message, &diagnostics);

    FILE* fp = std::fopen(f.c_str(), "rb");
    if (!fp) {
      logger->warn("cannot open rule file {}", f.string());
      continue;
    }
    const int errors = yr_compiler_add_file(guard.c, fp, nullptr, f.c_str());
    std::fclose(fp);
    if (errors != 0) {
      logger->warn("skipping rule file {}: {}", f.string(), diagnostics);
      continue;
    }

    auto set = std::make_unique<RuleSet>();
    set->name = f.stem().string();
    if (yr_compiler_get_rules(guard.c, &set->rules) != ERROR_SUCCESS) {
      logger->warn("skipping rule file {}: yr_compiler_get_rules failed", f.string());
      continue;
    }
    sets_.push_back(std::move(set));
    ++added;
  }
  logger->info("loaded {} rule set(s) from {}", added, dir);
  return added;
}

std::vector<SignatureMatch> YaraSignatureEngine::scan_file(const std::string& path) const {
  std::vector<SignatureMatch> out;
  std::size_t failures = 0;
  std::string last_error;
  for (const auto& set : sets_) {
    ScanContext ctx{&out, &set->name};
    const int rc = yr_rules_scan_file(set->rules, path.c_str(), 0, on_scan_message, &ctx,
                                      scan_timeout_s_);
    if (rc != ERROR_SUCCESS) {
      ++failures;
      last_error = "rule set " + set->name + " failed with yara error " + std::to_string(rc);
      log::get("rules")->warn("{} on {}", last_error, path);
    }
  }
  if (!sets_.empty() && failures == sets_.size()) throw std::runtime_error(last_error);
  return out;
}

}  // namespace strata
