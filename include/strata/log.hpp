#pragma once

// strata/log.hpp — Process logging.
//
// Each strata process (producer, analyzer, reporter) calls init() once with its component
// name. Modules obtain named child loggers via get(); children share the sinks of the
// default logger, so every module of one process writes to the same stderr stream and
// the same <log_dir>/<component>.log file.

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace strata::log {

// Install the process default logger: colored stderr plus a file sink at
// <log_dir>/<component>.log (file sink skipped when log_dir is empty).
// Drops previously registered child loggers so they are re-created on the new sinks.
void init(const std::string& component, const std::string& log_dir,
          spdlog::level::level_enum level = spdlog::level::info);

// Named child logger sharing the default logger's sinks and level.
std::shared_ptr<spdlog::logger> get(const std::string& name);

// "trace", "debug", "info", "warn", "error", "critical", "off". Unknown names map to info.
spdlog::level::level_enum parse_level(const std::string& name);

}  // namespace strata::log
