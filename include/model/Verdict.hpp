#pragma once
#include <array>
#include <cstddef>
#include <numeric>
#include <string>
#include <vector>

namespace vigil::model {

// Ordered by severity; OK and LOW are "no finding" outcomes.
enum class RiskTier { OK, LOW, WARNING, MEDIUM, HIGH, CRITICAL };

inline constexpr size_t kRiskTierCount = 6;

struct RiskVerdict {
  std::string subject;     // username, process name, service name, address
  RiskTier tier{RiskTier::OK};
  std::string reason;      // empty for OK
};

inline const char* tier_name(RiskTier t) {
  switch (t) {
    case RiskTier::OK:       return "OK";
    case RiskTier::LOW:      return "LOW";
    case RiskTier::WARNING:  return "WARNING";
    case RiskTier::MEDIUM:   return "MEDIUM";
    case RiskTier::HIGH:     return "HIGH";
    case RiskTier::CRITICAL: return "CRITICAL";
  }
  return "OK";
}

[[nodiscard]] inline bool is_finding(RiskTier t) {
  return t != RiskTier::OK && t != RiskTier::LOW;
}

// Per-tier counts for one run, produced by folding the run's verdicts.
struct VerdictSummary {
  std::array<size_t, kRiskTierCount> counts{};

  [[nodiscard]] size_t count(RiskTier t) const { return counts[static_cast<size_t>(t)]; }

  [[nodiscard]] size_t total() const {
    return std::accumulate(counts.begin(), counts.end(), size_t{0});
  }

  [[nodiscard]] size_t findings() const {
    return total() - count(RiskTier::OK) - count(RiskTier::LOW);
  }

  [[nodiscard]] VerdictSummary with(RiskTier t) const {
    VerdictSummary next = *this;
    ++next.counts[static_cast<size_t>(t)];
    return next;
  }
};

[[nodiscard]] inline VerdictSummary summarize(const std::vector<RiskVerdict>& verdicts) {
  return std::accumulate(verdicts.begin(), verdicts.end(), VerdictSummary{},
                         [](const VerdictSummary& acc, const RiskVerdict& v){ return acc.with(v.tier); });
}

} // namespace vigil::model
