#include "strata/risk.hpp"

namespace strata {

std::uint32_t score_signals(const RiskSignals& signals) {
  std::uint32_t score = 0;
  if (signals.signature_match) score += kSignatureWeight;
  if (signals.executable_flag) score += kExecutableWeight;
  if (signals.indicator) score += kIndicatorWeight;
  return score;
}

RiskLevel level_for_score(std::uint32_t score) {
  if (score > kHighAbove) return RiskLevel::high;
  if (score > kMediumAbove) return RiskLevel::medium;
  return RiskLevel::low;
}

std::string recommendation_for(RiskLevel level) {
  switch (level) {
    case RiskLevel::high: return "QUARANTINE";
    case RiskLevel::medium: return "MONITOR";
    case RiskLevel::low: return "MONITOR";
  }
  return "MONITOR";
}

RiskAssessment assess_score(std::uint32_t score) {
  RiskAssessment r;
  r.score = score;
  r.level = level_for_score(score);
  r.recommendation = recommendation_for(r.level);
  return r;
}

RiskAssessment assess(const RiskSignals& signals) { return assess_score(score_signals(signals)); }

std::string overall_level(std::uint64_t score) {
  if (score >= 140) return "CRITICAL";
  if (score >= 100) return "HIGH";
  if (score >= 60) return "MEDIUM";
  if (score >= 30) return "LOW";
  return "INFO";
}

}  // namespace strata
