#include "strata/log.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace strata::log {

namespace {
std::mutex g_registry_mu;
constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%l] %n: %v";
}  // namespace

void init(const std::string& component, const std::string& log_dir,
          spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lk(g_registry_mu);

  std::vector<spdlog::sink_ptr> sinks;
  std::string file_error;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
      file_error = log_dir + ": " + ec.message();
    } else {
      const auto file = (std::filesystem::path(log_dir) / (component + ".log")).string();
      try {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
      } catch (const spdlog::spdlog_ex& e) {
        file_error = e.what();
      }
    }
  }

  auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);

  spdlog::drop_all();
  spdlog::set_default_logger(logger);
  if (!file_error.empty()) logger->warn("file logging disabled: {}", file_error);
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
  std::lock_guard<std::mutex> lk(g_registry_mu);
  if (auto existing = spdlog::get(name)) return existing;
  auto child = spdlog::default_logger()->clone(name);
  spdlog::register_logger(child);
  return child;
}

spdlog::level::level_enum parse_level(const std::string& name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;
  return spdlog::level::info;
}

}  // namespace strata::log
