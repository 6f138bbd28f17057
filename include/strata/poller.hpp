#pragma once

// strata/poller.hpp — Fixed-interval polling loop shared by the analyzer and reporter.
//
// Each cycle runs `cycle` once. An exception escaping a cycle is logged and the loop
// continues with the next cycle; a poller process never dies on a bad job. The loop
// checks `stop` at least every 100 ms while sleeping, so SIGINT/SIGTERM take effect
// after the current cycle.

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

#include "strata/observability.hpp"

namespace strata {

void run_poll_loop(const std::string& component, const std::atomic<bool>& stop,
                   std::chrono::milliseconds interval, PipelineStats& stats,
                   const std::function<void()>& cycle);

}  // namespace strata
