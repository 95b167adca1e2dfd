#pragma once

#include <array>
#include <optional>
#include <string>

#include "gradostroi/core/entities.h"

namespace gradostroi {

// Numbers the legacy and victory checks look at, pulled out of a GameState.
struct LegacyInputs {
  double research{0.0};
  bool research_complete{false};
  double non_currency_wealth{0.0};
  double currency{0.0};
  double ecosystem_health{0.0};
  int unlocked_achievements{0};
  int discovered_secrets{0};
};

struct LegacyReport {
  VictoryCategory category{VictoryCategory::Technological};
  std::string title;
  double score{0.0};

  // Every category's score, indexed by VictoryCategory.
  std::array<double, kVictoryCategoryCount> scores{};
};

struct VictoryRules {
  double wealth_threshold{650.0};
  double ecology_threshold{85.0};
  int secrets_threshold{2};
};

// Ecological score above which economic and cultural get a bonus.
inline constexpr double kLegacyEcoBonusThreshold = 70.0;

// Scores all four categories and picks the best (ties go to the earlier
// category).
LegacyReport calculate_final_legacy(const LegacyInputs& in);

// Highest title whose threshold `score` reaches, or "Survivor".
std::string legacy_title(VictoryCategory category, double score);

// First satisfied condition in priority order (technological, economic,
// ecological, cultural), or nullopt.
std::optional<VictoryCategory> evaluate_victory(const LegacyInputs& in, const VictoryRules& rules = {});

} // namespace gradostroi
