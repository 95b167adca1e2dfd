#pragma once

#include <string>
#include <variant>
#include <vector>

#include "gradostroi/core/entities.h"
#include "gradostroi/core/resources.h"

namespace gradostroi {

// Unlock effects. Floors raise a multiplier to at least `value` and are
// therefore idempotent; scales compound.
struct FoodProductionFloor {
  double value{1.0};
};
struct MiningEfficiencyFloor {
  double value{1.0};
};
struct IndustryPenaltyFloor {
  double value{1.0};
};
struct CraftSpeedScale {
  double factor{1.0};
};
struct MarketTrendScale {
  double factor{1.0};
};
struct HappinessBonus {
  double amount{0.0};
};

using Effect = std::variant<FoodProductionFloor, MiningEfficiencyFloor, IndustryPenaltyFloor, CraftSpeedScale,
                            MarketTrendScale, HappinessBonus, CharacterReaction>;

struct TechDef {
  std::string id;
  std::string name;
  std::string description;
  std::vector<std::string> prereqs;
  Cost cost;
  std::vector<Effect> effects;
};

// Lore secret: like a technology, but with no prerequisites and exactly one effect.
struct SecretDef {
  std::string id;
  std::string name;
  std::string description;
  Cost cost;
  Effect effect{HappinessBonus{}};
};

struct RecipeDef {
  std::string id;
  std::string name;
  ResourceBundle inputs;

  // Research consumed by the recipe (unlike technology thresholds).
  double research_input{0.0};

  ResourceBundle outputs;

  // Technology or secret id that must be unlocked first; empty = none.
  std::string required_unlock;
};

} // namespace gradostroi
