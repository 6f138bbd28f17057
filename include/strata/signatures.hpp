#pragma once

// strata/signatures.hpp — Signature matching against compiled rule sets.
//
// ISignatureEngine is the seam between the analysis engine and the rule engine. The
// production implementation wraps libyara; tests may load rules from strings.
//
// Each rule file is compiled into its own rule set, so one file with a syntax error
// costs only that file. A match records the rule identifier, the severity derived from
// the identifier, the matched strings ("0x<offset>:<string identifier>") and the rule
// set it came from.

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace strata {

struct SignatureMatch {
  std::string rule_name;
  std::string severity;  // "HIGH" | "MEDIUM"
  std::vector<std::string> matched_strings;
  std::string source_rule;
};

// "HIGH" when the rule name mentions "malware" (case-insensitive), otherwise "MEDIUM".
std::string severity_for_rule(const std::string& rule_name);

class ISignatureEngine {
 public:
  virtual ~ISignatureEngine() = default;

  // Throws std::runtime_error when no rule set could scan the file.
  virtual std::vector<SignatureMatch> scan_file(const std::string& path) const = 0;
  virtual std::size_t rule_set_count() const = 0;
};

class YaraSignatureEngine final : public ISignatureEngine {
 public:
  // Calls yr_initialize(). Throws std::runtime_error when libyara cannot start.
  explicit YaraSignatureEngine(int scan_timeout_s = 60);
  ~YaraSignatureEngine() override;
  YaraSignatureEngine(const YaraSignatureEngine&) = delete;
  YaraSignatureEngine& operator=(const YaraSignatureEngine&) = delete;

  // Compile every *.yar / *.yara file in `dir` (non-recursive, sorted by name).
  // Returns the number of rule sets added. A missing directory adds none.
  std::size_t load_directory(const std::string& dir);

  // Compile `source` as a rule set named `set_name`. On failure returns false and sets
  // *error to the compiler diagnostics.
  bool add_source(const std::string& set_name, const std::string& source,
                  std::string* error = nullptr);

  std::vector<SignatureMatch> scan_file(const std::string& path) const override;
  std::size_t rule_set_count() const override { return sets_.size(); }

 private:
  struct RuleSet;
  std::vector<std::unique_ptr<RuleSet>> sets_;
  int scan_timeout_s_;
};

}  // namespace strata
