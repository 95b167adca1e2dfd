#include "gradostroi/core/progression.h"

#include <algorithm>
#include <cstddef>
#include <type_traits>

#include "gradostroi/core/enum_strings.h"
#include "gradostroi/core/relationships.h"
#include "gradostroi/util/sorted_keys.h"
#include "gradostroi/util/strings.h"

namespace gradostroi {

bool bundle_affordable(const ResourceStock& stock, const ResourceBundle& bundle, double scale) {
  for (const auto& ra : bundle) {
    if (stock[resource_index(ra.resource)] < ra.amount * scale) return false;
  }
  return true;
}

bool cost_affordable(const GameState& s, const Cost& cost) {
  return bundle_affordable(s.resources, cost.resources) && s.research >= cost.research;
}

UnlockState tech_state(const GameState& s, const TechDef& def) {
  if (has_researched(s, def.id)) return UnlockState::Unlocked;
  for (const auto& p : def.prereqs) {
    if (!has_researched(s, p)) return UnlockState::Locked;
  }
  return cost_affordable(s, def.cost) ? UnlockState::Available : UnlockState::Locked;
}

UnlockState secret_state(const GameState& s, const SecretDef& def) {
  if (has_discovered(s, def.id)) return UnlockState::Unlocked;
  return cost_affordable(s, def.cost) ? UnlockState::Available : UnlockState::Locked;
}

bool condition_met(const GameState& s, const Condition& c) {
  return std::visit(
      [&](const auto& cond) -> bool {
        using T = std::decay_t<decltype(cond)>;
        if constexpr (std::is_same_v<T, BuildingsAtLeast>) {
          return total_buildings(s) >= cond.count;
        } else if constexpr (std::is_same_v<T, ResourceAtLeast>) {
          return s.resources[resource_index(cond.resource)] >= cond.amount;
        } else if constexpr (std::is_same_v<T, BiomeAtLeast>) {
          return s.ecosystem.biomes[biome_index(cond.biome)] >= cond.health;
        } else if constexpr (std::is_same_v<T, EcosystemHealthAtLeast>) {
          return overall_health(s.ecosystem) >= cond.health;
        } else if constexpr (std::is_same_v<T, BiodiversityAtLeast>) {
          return s.ecosystem.biodiversity >= cond.value;
        } else if constexpr (std::is_same_v<T, ResearchAtLeast>) {
          return s.research >= cond.research;
        } else if constexpr (std::is_same_v<T, SecretsAtLeast>) {
          return static_cast<int>(s.discovered_secrets.size()) >= cond.count;
        } else {
          return false;
        }
      },
      c);
}

std::string describe_condition(const Condition& c) {
  return std::visit(
      [](const auto& cond) -> std::string {
        using T = std::decay_t<decltype(cond)>;
        if constexpr (std::is_same_v<T, BuildingsAtLeast>) {
          return "at least " + std::to_string(cond.count) + " buildings";
        } else if constexpr (std::is_same_v<T, ResourceAtLeast>) {
          return resource_to_string(cond.resource) + " >= " + format_fixed(cond.amount, 1);
        } else if constexpr (std::is_same_v<T, BiomeAtLeast>) {
          return biome_to_string(cond.biome) + " health >= " + format_fixed(cond.health, 1);
        } else if constexpr (std::is_same_v<T, EcosystemHealthAtLeast>) {
          return "ecosystem health >= " + format_fixed(cond.health, 1);
        } else if constexpr (std::is_same_v<T, BiodiversityAtLeast>) {
          return "biodiversity >= " + format_fixed(cond.value, 1);
        } else if constexpr (std::is_same_v<T, ResearchAtLeast>) {
          return "research >= " + format_fixed(cond.research, 1);
        } else if constexpr (std::is_same_v<T, SecretsAtLeast>) {
          return std::to_string(cond.count) + " secrets discovered";
        } else {
          return "?";
        }
      },
      c);
}

std::string describe_effect(const Effect& e) {
  return std::visit(
      [](const auto& eff) -> std::string {
        using T = std::decay_t<decltype(eff)>;
        if constexpr (std::is_same_v<T, FoodProductionFloor>) {
          return "food production x" + format_fixed(eff.value);
        } else if constexpr (std::is_same_v<T, MiningEfficiencyFloor>) {
          return "mining efficiency x" + format_fixed(eff.value);
        } else if constexpr (std::is_same_v<T, IndustryPenaltyFloor>) {
          return "industry eco penalty x" + format_fixed(eff.value);
        } else if constexpr (std::is_same_v<T, CraftSpeedScale>) {
          return "craft speed x" + format_fixed(eff.factor);
        } else if constexpr (std::is_same_v<T, MarketTrendScale>) {
          return "market trend x" + format_fixed(eff.factor);
        } else if constexpr (std::is_same_v<T, HappinessBonus>) {
          return "happiness +" + format_fixed(eff.amount, 1);
        } else if constexpr (std::is_same_v<T, CharacterReaction>) {
          std::string who = eff.trait ? (trait_to_string(*eff.trait) + "s") : std::string("everyone");
          return who + " react to " + player_action_to_string(eff.action);
        } else {
          return "?";
        }
      },
      e);
}

void broadcast_reaction(GameState& s, const ContentDB& content, const CharacterReaction& reaction) {
  for (const auto& id : util::sorted_keys(content.characters)) {
    const CharacterDef& def = content.characters.at(id);
    if (reaction.trait && !has_trait(def, *reaction.trait)) continue;
    CharacterState* st = find_ptr(s.characters, id);
    if (!st) continue;
    react_to_action(*st, def, reaction.action, content.action_impacts);
  }
}

std::string apply_effect(GameState& s, const ContentDB& content, const Effect& e) {
  std::visit(
      [&](const auto& eff) {
        using T = std::decay_t<decltype(eff)>;
        if constexpr (std::is_same_v<T, FoodProductionFloor>) {
          s.food_production = std::max(s.food_production, eff.value);
        } else if constexpr (std::is_same_v<T, MiningEfficiencyFloor>) {
          s.mining_efficiency = std::max(s.mining_efficiency, eff.value);
        } else if constexpr (std::is_same_v<T, IndustryPenaltyFloor>) {
          s.eco_industry_penalty = std::max(s.eco_industry_penalty, eff.value);
        } else if constexpr (std::is_same_v<T, CraftSpeedScale>) {
          s.craft_speed *= eff.factor;
        } else if constexpr (std::is_same_v<T, MarketTrendScale>) {
          s.market.trend *= eff.factor;
        } else if constexpr (std::is_same_v<T, HappinessBonus>) {
          s.happiness = std::clamp(s.happiness + eff.amount, 0.0, 100.0);
        } else if constexpr (std::is_same_v<T, CharacterReaction>) {
          broadcast_reaction(s, content, eff);
        }
      },
      e);
  return describe_effect(e);
}

std::string apply_achievement_reward(GameState& s, const AchievementReward& reward, double capacity) {
  return std::visit(
      [&](const auto& r) -> std::string {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, ResourceGrant>) {
          ResourceLedger ledger(s.resources, capacity);
          ledger.adjust(r.resource, r.amount);
          return "+" + format_fixed(r.amount, 1) + " " + resource_to_string(r.resource);
        } else if constexpr (std::is_same_v<T, CraftSpeedFloor>) {
          s.craft_speed = std::max(s.craft_speed, r.value);
          return "craft speed at least x" + format_fixed(r.value);
        } else if constexpr (std::is_same_v<T, ResearchBonusFloor>) {
          s.research_bonus = std::max(s.research_bonus, r.value);
          return "research bonus at least x" + format_fixed(r.value);
        } else if constexpr (std::is_same_v<T, BiomeRestoration>) {
          for (std::size_t i = 0; i < kBiomeCount; ++i) shift_biome(s.ecosystem, static_cast<Biome>(i), r.amount);
          return "every biome +" + format_fixed(r.amount, 1);
        } else {
          return "?";
        }
      },
      reward);
}

} // namespace gradostroi
