#pragma once

// strata/config.hpp — Pipeline configuration and on-disk layout.
//
// PRECEDENCE (later wins):
//   1. Built-in defaults below.
//   2. JSON config file: {"monitoring": {...}, "pipeline": {...}}.
//   3. Environment: STRATA_ROOT, STRATA_RULES_DIR, STRATA_LOG_LEVEL, STRATA_MAX_DEPTH.
//
// The core never reads configuration on its own: each process builds one Config at
// startup and hands the relevant pieces to the components it constructs.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "strata/types.hpp"

namespace strata {

// Directory layout derived from Config::root.
struct Layout {
  std::string root;
  std::string queue_file;      // <root>/queue/queue.json
  std::string lock_file;       // <root>/queue/queue.json.lock
  std::string intake_dir;      // <root>/queue/files
  std::string processing_dir;  // <root>/processing
  std::string output_dir;      // <root>/static-output
  std::string reports_dir;     // <root>/reports
  std::string scratch_dir;     // <root>/scratch
  std::string vault_dir;       // <root>/vault
  std::string logs_dir;        // <root>/logs
};

struct Config {
  // monitoring (consumed by the producer only)
  std::string watch_directory;
  std::vector<std::string> file_types{"*"};
  bool recursive{true};

  // pipeline
  std::string root{"/var/lib/strata"};
  std::string rules_dir;  // empty = <root>/rules
  std::uint32_t max_depth{3};
  std::size_t max_members{100};
  std::uint64_t max_total_bytes{512ull * 1024 * 1024};
  std::uint64_t poll_interval_ms{10000};
  std::uint64_t lock_timeout_ms{5000};
  std::uint64_t extractor_timeout_ms{60000};
  std::string extractor_search_path;  // empty = $PATH
  bool vault_enabled{true};
  std::string log_level{"info"};

  Layout layout() const;
  std::string effective_rules_dir() const;

  // Returns ErrorCode::config_invalid with a message in *why on a bad value.
  ErrorCode validate(std::string* why = nullptr) const;

  // Overlay environment variables onto `base`.
  static Config from_env(Config base);
};

// Parse a config document. Unknown keys are ignored. On a malformed document returns
// nullopt and sets *error.
std::optional<Config> parse_config(const std::string& json_text, std::string* error = nullptr);

// Load defaults -> file (when `path` exists) -> environment. A missing file is not an
// error; a malformed one is.
std::optional<Config> load_config(const std::string& path, std::string* error = nullptr);

// Create every directory of the layout. Returns false and sets *error on failure.
bool ensure_layout(const Layout& layout, std::string* error = nullptr);

}  // namespace strata
