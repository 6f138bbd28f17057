#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "strata/analysis.hpp"
#include "strata/config.hpp"
#include "strata/content_type.hpp"
#include "strata/extract.hpp"
#include "strata/hash.hpp"
#include "strata/log.hpp"
#include "strata/observability.hpp"
#include "strata/orchestrator.hpp"
#include "strata/poller.hpp"
#include "strata/producer.hpp"
#include "strata/queue_store.hpp"
#include "strata/report.hpp"
#include "strata/signatures.hpp"
#include "strata/vault.hpp"
#include "strata/version.hpp"

namespace {

constexpr const char* kDefaultConfigPath = "config/config.json";

std::atomic<bool> g_stop{false};

extern "C" void handle_stop_signal(int) { g_stop.store(true); }

void install_signal_handlers() {
  struct sigaction sa {};
  sa.sa_handler = handle_stop_signal;
  sigemptyset(&sa.sa_mask);
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
}

struct Args {
  std::string command;
  std::vector<std::string> positional;
  std::string config_path{kDefaultConfigPath};
  bool once{false};
  std::optional<std::uint32_t> max_depth;
};

void usage() {
  std::cerr << "usage: strata [--config <path>] <command> [args]\n"
               "  enqueue <file>...              add files to the queue\n"
               "  scan [<dir>]                   enqueue every eligible file once\n"
               "  analyzer [--once]              drain pending jobs\n"
               "  reporter [--once]              build reports for analyzed jobs\n"
               "  analyze <file> [--max-depth N] analyze one file, print the result\n"
               "  queue                          print the queue document\n"
               "  version                        print the version manifest\n";
}

bool parse_args(int argc, char** argv, Args& out) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" || arg == "--max-depth") {
      if (i + 1 >= argc) {
        std::cerr << "error: " << arg << " requires a value\n";
        return false;
      }
      const std::string value = argv[++i];
      if (arg == "--config") {
        out.config_path = value;
      } else {
        try {
          out.max_depth = static_cast<std::uint32_t>(std::stoul(value));
        } catch (const std::exception&) {
          std::cerr << "error: --max-depth expects a number, got '" << value << "'\n";
          return false;
        }
      }
    } else if (arg == "--once") {
      out.once = true;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "error: unknown option " << arg << "\n";
      return false;
    } else if (out.command.empty()) {
      out.command = arg;
    } else {
      out.positional.push_back(arg);
    }
  }
  return !out.command.empty();
}

// Components shared by the analyzing commands, built once at startup.
struct AnalysisStack {
  strata::MimeSniffer sniffer;
  strata::YaraSignatureEngine signatures;
  strata::ArchiveExtractor extractor;
  strata::AnalysisEngine engine;

  AnalysisStack(const strata::Config& cfg, const strata::Layout& layout,
                strata::PipelineStats* stats)
      : extractor(layout.scratch_dir,
                  strata::ExtractionLimits{cfg.max_members, cfg.max_total_bytes,
                                           cfg.extractor_timeout_ms,
                                           cfg.extractor_search_path}),
        engine(signatures, sniffer, extractor, cfg.max_depth, stats) {
    const std::string rules = cfg.effective_rules_dir();
    const std::size_t loaded = signatures.load_directory(rules);
    strata::log::get("rules")->info("{} rule sets loaded from {}", loaded, rules);
  }
};

strata::QueueStore open_queue(const strata::Config& cfg, const strata::Layout& layout) {
  return strata::QueueStore(layout.queue_file, layout.lock_file,
                            std::chrono::milliseconds(cfg.lock_timeout_ms));
}

int cmd_enqueue(const strata::Config& cfg, const strata::Layout& layout,
                const std::vector<std::string>& files) {
  if (files.empty()) {
    std::cerr << "error: enqueue needs at least one file\n";
    return 1;
  }
  const strata::MimeSniffer sniffer;
  const auto queue = open_queue(cfg, layout);
  const strata::Producer producer(queue, sniffer, layout.intake_dir);
  int rc = 0;
  for (const auto& f : files) {
    const auto res = producer.add(f);
    switch (res.outcome) {
      case strata::AddOutcome::added:
        std::cout << "queued " << res.job_id << " " << f << "\n";
        break;
      case strata::AddOutcome::duplicate:
        std::cout << "duplicate " << res.job_id << " " << f << "\n";
        break;
      case strata::AddOutcome::rejected:
        std::cerr << "rejected " << f << ": " << res.detail << "\n";
        rc = 3;
        break;
    }
  }
  return rc;
}

int cmd_scan(const strata::Config& cfg, const strata::Layout& layout,
             const std::vector<std::string>& args) {
  const std::string dir = args.empty() ? cfg.watch_directory : args.front();
  if (dir.empty()) {
    std::cerr << "error: no directory given and monitoring.watch_directory is unset\n";
    return 1;
  }
  const auto files = strata::scan_directory(dir, cfg.recursive, cfg.file_types);
  strata::log::get("producer")->info("scan of {} found {} eligible files", dir, files.size());
  if (files.empty()) return 0;
  return cmd_enqueue(cfg, layout, files);
}

int cmd_analyzer(const strata::Config& cfg, const strata::Layout& layout, bool once) {
  strata::PipelineStats stats;
  AnalysisStack stack(cfg, layout, &stats);
  const auto queue = open_queue(cfg, layout);
  std::unique_ptr<strata::SampleVault> vault;
  if (cfg.vault_enabled) vault = std::make_unique<strata::SampleVault>(layout.vault_dir);
  strata::AnalysisOrchestrator orchestrator(queue, stack.engine, layout.processing_dir,
                                            layout.output_dir, vault.get(), stats);
  if (once) {
    const auto handled = orchestrator.drain();
    strata::log::get("orchestrator")->info("{} jobs handled; stats {}", handled, stats.to_json());
    return 0;
  }
  install_signal_handlers();
  strata::run_poll_loop("orchestrator", g_stop, std::chrono::milliseconds(cfg.poll_interval_ms),
                        stats, [&] { orchestrator.drain(); });
  return 0;
}

int cmd_reporter(const strata::Config& cfg, const strata::Layout& layout, bool once) {
  strata::PipelineStats stats;
  const auto queue = open_queue(cfg, layout);
  strata::ReportBuilder builder(queue, layout.reports_dir, stats);
  if (once) {
    const auto n = builder.run_once();
    strata::log::get("report")->info("{} reports built", n);
    return 0;
  }
  install_signal_handlers();
  strata::run_poll_loop("report", g_stop, std::chrono::milliseconds(cfg.poll_interval_ms), stats,
                        [&] { builder.run_once(); });
  return 0;
}

int cmd_analyze(strata::Config cfg, const strata::Layout& layout, const Args& args) {
  if (args.positional.size() != 1) {
    std::cerr << "error: analyze takes exactly one file\n";
    return 1;
  }
  if (args.max_depth) cfg.max_depth = *args.max_depth;
  std::string why;
  if (cfg.validate(&why) != strata::ErrorCode::none) {
    std::cerr << "error: " << why << "\n";
    return 2;
  }
  const std::string& file = args.positional.front();
  const std::string hash = strata::hash_file_hex(file);
  if (hash.empty()) {
    std::cerr << "error: cannot read " << file << "\n";
    return 3;
  }
  AnalysisStack stack(cfg, layout, nullptr);
  const auto result = stack.engine.analyze(file, hash, 0);
  std::cout << strata::analysis_to_json_text(result) << "\n";
  return result.status == strata::NodeStatus::analyzed ? 0 : 4;
}

int cmd_queue(const strata::Config& cfg, const strata::Layout& layout) {
  const auto queue = open_queue(cfg, layout);
  std::cout << strata::queue_to_json(queue.load()) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  if (!parse_args(argc, argv, args)) {
    usage();
    return 1;
  }
  if (args.command == "version") {
    std::cout << strata::version::manifest_to_json(strata::version::current_manifest()) << "\n";
    return 0;
  }

  std::string error;
  auto cfg = strata::load_config(args.config_path, &error);
  if (!cfg) {
    std::cerr << "error: " << error << "\n";
    return 2;
  }
  if (cfg->validate(&error) != strata::ErrorCode::none) {
    std::cerr << "error: " << error << "\n";
    return 2;
  }
  const strata::Layout layout = cfg->layout();
  if (!strata::ensure_layout(layout, &error)) {
    std::cerr << "error: " << error << "\n";
    return 2;
  }

  const std::string component = (args.command == "analyzer")   ? "analyzer"
                                : (args.command == "reporter") ? "reporter"
                                : (args.command == "enqueue" || args.command == "scan")
                                    ? "producer"
                                    : "cli";
  strata::log::init(component, component == "cli" ? "" : layout.logs_dir,
                    strata::log::parse_level(cfg->log_level));

  try {
    if (args.command == "enqueue") return cmd_enqueue(*cfg, layout, args.positional);
    if (args.command == "scan") return cmd_scan(*cfg, layout, args.positional);
    if (args.command == "analyzer") return cmd_analyzer(*cfg, layout, args.once);
    if (args.command == "reporter") return cmd_reporter(*cfg, layout, args.once);
    if (args.command == "analyze") return cmd_analyze(*cfg, layout, args);
    if (args.command == "queue") return cmd_queue(*cfg, layout);
  } catch (const std::exception& e) {
    strata::log::get(component)->critical("{} failed: {}", args.command, e.what());
    return 3;
  }
  usage();
  return 1;
}
