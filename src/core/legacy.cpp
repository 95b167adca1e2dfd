#include "gradostroi/core/legacy.h"

#include <cstddef>
#include <utility>

namespace gradostroi {
namespace {

struct TitleStep {
  double threshold;
  const char* title;
};

using TitleTable = std::array<TitleStep, 3>;

// Descending thresholds per category.
const TitleTable& titles_for(VictoryCategory c) {
  static const std::array<TitleTable, kVictoryCategoryCount> kTitles = {{
      {{{90.0, "Great Innovator"}, {70.0, "Technology Leader"}, {50.0, "Inventor"}}},
      {{{1000.0, "King of Trade"}, {500.0, "Master of Economy"}, {200.0, "Successful Merchant"}}},
      {{{85.0, "Wise Keeper"}, {70.0, "Friend of Nature"}, {50.0, "Eco-Builder"}}},
      {{{80.0, "Cultural Icon"}, {60.0, "Enlightener"}, {40.0, "Collector of Knowledge"}}},
  }};
  return kTitles[static_cast<std::size_t>(c)];
}

std::size_t idx(VictoryCategory c) { return static_cast<std::size_t>(c); }

} // namespace

std::string legacy_title(VictoryCategory category, double score) {
  for (const auto& step : titles_for(category)) {
    if (score >= step.threshold) return step.title;
  }
  return "Survivor";
}

LegacyReport calculate_final_legacy(const LegacyInputs& in) {
  LegacyReport r;
  r.scores[idx(VictoryCategory::Technological)] = in.research;
  r.scores[idx(VictoryCategory::Economic)] = in.non_currency_wealth * 0.1 + in.currency * 0.05;
  r.scores[idx(VictoryCategory::Ecological)] = in.ecosystem_health;
  r.scores[idx(VictoryCategory::Cultural)] = static_cast<double>(in.unlocked_achievements) * 25.0;

  if (r.scores[idx(VictoryCategory::Ecological)] > kLegacyEcoBonusThreshold) {
    r.scores[idx(VictoryCategory::Economic)] *= 1.2;
    r.scores[idx(VictoryCategory::Cultural)] *= 1.1;
  }

  std::size_t best = 0;
  for (std::size_t i = 1; i < kVictoryCategoryCount; ++i) {
    if (r.scores[i] > r.scores[best]) best = i;
  }
  r.category = static_cast<VictoryCategory>(best);
  r.score = r.scores[best];
  r.title = legacy_title(r.category, r.score);
  return r;
}

std::optional<VictoryCategory> evaluate_victory(const LegacyInputs& in, const VictoryRules& rules) {
  if (in.research_complete) return VictoryCategory::Technological;
  if (in.non_currency_wealth > rules.wealth_threshold) return VictoryCategory::Economic;
  if (in.ecosystem_health > rules.ecology_threshold) return VictoryCategory::Ecological;
  if (in.discovered_secrets >= rules.secrets_threshold) return VictoryCategory::Cultural;
  return std::nullopt;
}

} // namespace gradostroi
