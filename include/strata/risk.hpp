#pragma once

// strata/risk.hpp — Risk scoring model.
//
// Per-artifact score is additive over three independent signals and does not depend on
// the order in which the signals were collected:
//   any signature match          +50
//   any executable-analysis flag +35
//   any extracted indicator      +15
//
// Per-artifact level, strict comparisons:
//   score > 70        HIGH    QUARANTINE
//   40 < score <= 70  MEDIUM  MONITOR
//   otherwise         LOW     MONITOR
//
// Job-level ladder used by reports (inclusive lower bounds):
//   >=140 CRITICAL, >=100 HIGH, >=60 MEDIUM, >=30 LOW, else INFO
//
// The cut points are constants. Nothing here is tunable per call.

#include <cstdint>
#include <string>

#include "strata/types.hpp"

namespace strata {

constexpr std::uint32_t kSignatureWeight = 50;
constexpr std::uint32_t kExecutableWeight = 35;
constexpr std::uint32_t kIndicatorWeight = 15;

constexpr std::uint32_t kHighAbove = 70;
constexpr std::uint32_t kMediumAbove = 40;

struct RiskSignals {
  bool signature_match{false};
  bool executable_flag{false};
  bool indicator{false};
};

struct RiskAssessment {
  std::uint32_t score{0};
  RiskLevel level{RiskLevel::low};
  std::string recommendation{"MONITOR"};
};

std::uint32_t score_signals(const RiskSignals& signals);
RiskLevel level_for_score(std::uint32_t score);
std::string recommendation_for(RiskLevel level);

RiskAssessment assess_score(std::uint32_t score);
RiskAssessment assess(const RiskSignals& signals);

// Job-level ladder: "CRITICAL", "HIGH", "MEDIUM", "LOW" or "INFO".
std::string overall_level(std::uint64_t score);

}  // namespace strata
