#include "strata/poller.hpp"

#include <algorithm>
#include <thread>

#include "strata/log.hpp"

namespace strata {

void run_poll_loop(const std::string& component, const std::atomic<bool>& stop,
                   std::chrono::milliseconds interval, PipelineStats& stats,
                   const std::function<void()>& cycle) {
  auto logger = log::get(component);
  logger->info("polling every {} ms", interval.count());

  while (!stop.load()) {
    try {
      cycle();
    } catch (const std::exception& e) {
      logger->error("cycle failed: {}", e.what());
    }
    const auto n = stats.cycles.fetch_add(1, std::memory_order_relaxed) + 1;
    if (n % kStatsLogInterval == 0) logger->info("stats {}", stats.to_json());

    const auto deadline = std::chrono::steady_clock::now() + interval;
    while (!stop.load() && std::chrono::steady_clock::now() < deadline) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      std::this_thread::sleep_for(std::clamp(left, std::chrono::milliseconds(1),
                                             std::chrono::milliseconds(100)));
    }
  }
  logger->info("stopping; stats {}", stats.to_json());
}

}  // namespace strata
