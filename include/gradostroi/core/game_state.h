#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "gradostroi/core/calendar.h"
#include "gradostroi/core/ecosystem.h"
#include "gradostroi/core/entities.h"
#include "gradostroi/core/legacy.h"
#include "gradostroi/core/market.h"
#include "gradostroi/core/resources.h"
#include "gradostroi/core/tech_tree.h"
#include "gradostroi/util/hash_rng.h"

namespace gradostroi {

// What a fresh settlement starts with (before difficulty adjustments).
struct StartingConditions {
  ResourceBundle resources;
  BiomeHealth biomes{5.0, 0.0, 8.0, 2.0};
  int storage_units{1};
};

// Static content: built-in defaults (default_content_db) or a JSON content file.
struct ContentDB {
  // Indexed by BuildingType.
  std::array<BuildingDef, kBuildingTypeCount> buildings;

  // Storage units are never price-scaled.
  ResourceBundle storage_cost;

  // Menu order matters for the CLI, so this is a list.
  std::vector<MiningActionDef> mining_actions;

  std::unordered_map<std::string, RecipeDef> recipes;
  std::unordered_map<std::string, TechDef> techs;
  std::unordered_map<std::string, SecretDef> secrets;
  std::unordered_map<std::string, CharacterDef> characters;
  std::unordered_map<std::string, QuestDef> quests;
  std::unordered_map<std::string, AchievementDef> achievements;

  std::vector<RandomEventDef> random_events;

  // Unlisted resources default to 1.0.
  PriceTable base_prices{};

  ActionImpactTable action_impacts{};

  StartingConditions start;
};

// A single save-game state.
struct GameState {
  int save_version{1};

  int day{0};

  // True once today's ecosystem/achievement/random-event phases have run.
  bool day_started{false};

  // Set by the first mining/building/crafting/research/market/character
  // action; difficulty can no longer change afterwards.
  bool player_acted{false};

  // One of kMultiplierSteps.
  int multiplier_mode{1};

  double research{0.0};
  bool research_complete{false};

  bool victory_achieved{false};
  std::optional<VictoryCategory> victory_category;

  double craft_speed{1.0};
  double research_bonus{1.0};
  double food_production{1.0};
  double mining_efficiency{1.0};

  // [0,100]; 50 is neutral.
  double happiness{50.0};

  // Scales building damage to the biomes.
  double eco_industry_penalty{1.0};

  Difficulty difficulty{Difficulty::Normal};

  ResourceStock resources{};
  BuildingCounts buildings{};

  // Workers assigned per building type. Invariant:
  // sum(workers) + idle_workers == population.
  BuildingCounts workers{};

  int storage_units{1};

  int population{8};
  int idle_workers{8};

  std::vector<std::string> researched_techs;
  std::vector<std::string> discovered_secrets;
  std::vector<std::string> unlocked_achievements;

  std::unordered_map<std::string, CharacterState> characters;

  EventCalendar calendar;
  EcosystemState ecosystem;
  MarketState market;

  // Per-world RNG; its state is part of the save.
  util::HashRng rng;

  // Monotonic id for SimEvent::seq.
  // Persisted so that clearing/pruning the event log does not reset the sequence.
  std::uint64_t next_event_seq{1};

  // Persistent simulation event log.
  std::vector<SimEvent> events;
};

int total_buildings(const GameState& s);
int total_workers(const GameState& s);

bool has_researched(const GameState& s, const std::string& tech_id);
bool has_discovered(const GameState& s, const std::string& secret_id);
bool has_achievement(const GameState& s, const std::string& achievement_id);

// Technology or secret.
bool is_unlocked(const GameState& s, const std::string& id);

LegacyInputs legacy_inputs(const GameState& s);

// Small helper for safe lookups.
template <typename Map>
auto* find_ptr(Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<decltype(&it->second)>(nullptr);
  return &it->second;
}

template <typename Map>
const auto* find_ptr(const Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<const decltype(&it->second)>(nullptr);
  return &it->second;
}

} // namespace gradostroi
