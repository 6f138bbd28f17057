#include "strata/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "strata/jsonlite.hpp"
#include "strata/log.hpp"

namespace fs = std::filesystem;

namespace strata {

namespace {

std::string expand_home(const std::string& p) {
  if (p.empty() || p[0] != '~') return p;
  const char* home = std::getenv("HOME");
  if (!home || !home[0]) return p;
  return std::string(home) + p.substr(1);
}

std::string join(const std::string& a, const std::string& b) {
  return (fs::path(a) / b).string();
}

}  // namespace

Layout Config::layout() const {
  Layout l;
  l.root = root;
  l.queue_file = join(root, "queue/queue.json");
  l.lock_file = join(root, "queue/queue.json.lock");
  l.intake_dir = join(root, "queue/files");
  l.processing_dir = join(root, "processing");
  l.output_dir = join(root, "static-output");
  l.reports_dir = join(root, "reports");
  l.scratch_dir = join(root, "scratch");
  l.vault_dir = join(root, "vault");
  l.logs_dir = join(root, "logs");
  return l;
}

std::string Config::effective_rules_dir() const {
  return rules_dir.empty() ? join(root, "rules") : rules_dir;
}

ErrorCode Config::validate(std::string* why) const {
  auto fail = [&](const std::string& msg) {
    if (why) *why = msg;
    return ErrorCode::config_invalid;
  };
  if (root.empty()) return fail("pipeline.root must not be empty");
  if (max_depth > 16) return fail("pipeline.max_depth must be <= 16");
  if (max_members == 0) return fail("pipeline.max_members must be > 0");
  if (max_total_bytes == 0) return fail("pipeline.max_total_bytes must be > 0");
  if (poll_interval_ms == 0) return fail("pipeline.poll_interval_ms must be > 0");
  if (extractor_timeout_ms == 0) return fail("pipeline.extractor_timeout_ms must be > 0");
  return ErrorCode::none;
}

Config Config::from_env(Config base) {
  if (const char* e = std::getenv("STRATA_ROOT"); e && e[0]) base.root = expand_home(e);
  if (const char* e = std::getenv("STRATA_RULES_DIR"); e && e[0]) base.rules_dir = expand_home(e);
  if (const char* e = std::getenv("STRATA_LOG_LEVEL"); e && e[0]) base.log_level = e;
  if (const char* e = std::getenv("STRATA_MAX_DEPTH"); e && e[0]) {
    try {
      base.max_depth = static_cast<std::uint32_t>(std::stoul(e));
    } catch (const std::exception&) {
      log::get("config")->warn("ignoring STRATA_MAX_DEPTH={}: not a number", e);
    }
  }
  return base;
}

std::optional<Config> parse_config(const std::string& json_text, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const auto doc = jsonlite::parse(json_text, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return std::nullopt;
  }

  Config c;
  if (const auto* mon = jsonlite::get_object(doc, "monitoring")) {
    c.watch_directory = expand_home(jsonlite::get_string(*mon, "watch_directory", c.watch_directory));
    auto types = jsonlite::get_string_array(*mon, "file_types");
    if (!types.empty()) c.file_types = std::move(types);
    c.recursive = jsonlite::get_bool(*mon, "recursive", c.recursive);
    // The shared directory is where the queue lives; it doubles as the pipeline root.
    const auto shared = jsonlite::get_string(*mon, "shared_directory");
    if (!shared.empty()) c.root = expand_home(shared);
  }
  if (const auto* p = jsonlite::get_object(doc, "pipeline")) {
    c.root = expand_home(jsonlite::get_string(*p, "root", c.root));
    c.rules_dir = expand_home(jsonlite::get_string(*p, "rules_dir", c.rules_dir));
    c.max_depth = static_cast<std::uint32_t>(jsonlite::get_u64(*p, "max_depth", c.max_depth));
    c.max_members = static_cast<std::size_t>(jsonlite::get_u64(*p, "max_members", c.max_members));
    c.max_total_bytes = jsonlite::get_u64(*p, "max_total_bytes", c.max_total_bytes);
    c.poll_interval_ms = jsonlite::get_u64(*p, "poll_interval_ms", c.poll_interval_ms);
    c.lock_timeout_ms = jsonlite::get_u64(*p, "lock_timeout_ms", c.lock_timeout_ms);
    c.extractor_timeout_ms = jsonlite::get_u64(*p, "extractor_timeout_ms", c.extractor_timeout_ms);
    c.extractor_search_path = jsonlite::get_string(*p, "extractor_search_path", c.extractor_search_path);
    c.vault_enabled = jsonlite::get_bool(*p, "vault_enabled", c.vault_enabled);
    c.log_level = jsonlite::get_string(*p, "log_level", c.log_level);
  }
  return c;
}

std::optional<Config> load_config(const std::string& path, std::string* error) {
  Config c;
  std::error_code ec;
  if (!path.empty() && fs::is_regular_file(path, ec)) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
      if (error) *error = "cannot read config file: " + path;
      return std::nullopt;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    auto parsed = parse_config(ss.str(), error);
    if (!parsed) return std::nullopt;
    c = std::move(*parsed);
  }
  c = Config::from_env(std::move(c));

  std::string why;
  if (c.validate(&why) != ErrorCode::none) {
    if (error) *error = why;
    return std::nullopt;
  }
  return c;
}

bool ensure_layout(const Layout& layout, std::string* error) {
  const std::string dirs[] = {
      fs::path(layout.queue_file).parent_path().string(),
      layout.intake_dir,
      layout.processing_dir,
      layout.output_dir,
      layout.reports_dir,
      layout.scratch_dir,
      layout.vault_dir,
      layout.logs_dir,
  };
  for (const auto& d : dirs) {
    std::error_code ec;
    fs::create_directories(d, ec);
    if (ec) {
      if (error) *error = "cannot create " + d + ": " + ec.message();
      return false;
    }
  }
  return true;
}

}  // namespace strata
