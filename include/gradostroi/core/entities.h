#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "gradostroi/core/ecosystem.h"
#include "gradostroi/core/resources.h"

namespace gradostroi {

// --- buildings ---

// Production buildings. Storage units are tracked separately
// (GameState::storage_units) because they produce nothing and never scale
// in price.
enum class BuildingType : std::uint8_t {
  Sawmill,   // "les"
  Herbalist, // "sob"
  Quarry,    // "kam"
  Farm,      // "pol"
  SandPit,   // "pes"
  ClayPit,   // "gli"
};

inline constexpr std::size_t kBuildingTypeCount = 6;

constexpr std::size_t building_index(BuildingType t) { return static_cast<std::size_t>(t); }

const std::array<BuildingType, kBuildingTypeCount>& all_building_types();

using BuildingCounts = std::array<int, kBuildingTypeCount>;

// --- characters ---

enum class Trait : std::uint8_t {
  Environmentalist,
  Wise,
  Patient,
  Pragmatic,
  Blacksmith,
  Progressive,
  Scholar,
  Curious,
  Traditionalist,
};

// Player deeds that characters have an opinion about.
enum class PlayerAction : std::uint8_t {
  Deforestation,
  BuildSawmill,
  BuildHerbalist,
  ResearchEcology,
  PolluteRiver,
  CleanupPollution,
  BuildForge,
};

inline constexpr std::size_t kPlayerActionCount = 7;

using ActionImpactTable = std::array<double, kPlayerActionCount>;

enum class RelationshipTier : std::uint8_t {
  Adores,
  Respects,
  Friendly,
  Neutral,
  Wary,
  Displeased,
  Hostile,
  Hates,
};

// "Every character with `trait` reacts to `action`". No trait means everyone.
struct CharacterReaction {
  std::optional<Trait> trait;
  PlayerAction action{PlayerAction::Deforestation};
};

struct TradeOffer {
  Resource resource{Resource::Wood};

  // Multiplier on the market price.
  double price_modifier{1.0};
};

struct SkillLevel {
  std::string skill;
  int level{0};
};

struct CharacterDef {
  std::string id;
  std::string name;
  std::string description;
  std::vector<SkillLevel> skills;
  std::vector<Trait> traits;
  double initial_score{0.0};
  std::vector<std::string> quests;
  std::vector<TradeOffer> offers;
};

// Runtime relationship state for one character.
struct CharacterState {
  // Clamped to [-100,100] on every update.
  double score{0.0};

  // Append-only.
  std::vector<std::string> memory;

  std::vector<std::string> open_quests;
};

// --- conditions shared by quests and achievements ---

struct BuildingsAtLeast {
  int count{0};
};
struct ResourceAtLeast {
  Resource resource{Resource::Wood};
  double amount{0.0};
};
struct BiomeAtLeast {
  Biome biome{Biome::Forest};
  double health{0.0};
};
struct EcosystemHealthAtLeast {
  double health{0.0};
};
struct BiodiversityAtLeast {
  double value{0.0};
};
struct ResearchAtLeast {
  double research{0.0};
};
struct SecretsAtLeast {
  int count{0};
};

using Condition = std::variant<BuildingsAtLeast, ResourceAtLeast, BiomeAtLeast, EcosystemHealthAtLeast,
                               BiodiversityAtLeast, ResearchAtLeast, SecretsAtLeast>;

struct QuestDef {
  std::string id;
  std::string title;
  Condition condition{EcosystemHealthAtLeast{}};
  double relationship_reward{0.0};
  ResourceBundle resource_reward;
};

// --- achievements ---

struct ResourceGrant {
  Resource resource{Resource::Wood};
  double amount{0.0};
};
struct CraftSpeedFloor {
  double value{1.0};
};
struct ResearchBonusFloor {
  double value{1.0};
};
struct BiomeRestoration {
  double amount{0.0};
};

using AchievementReward = std::variant<ResourceGrant, CraftSpeedFloor, ResearchBonusFloor, BiomeRestoration>;

struct AchievementDef {
  std::string id;
  std::string name;
  Condition condition{BuildingsAtLeast{}};
  AchievementReward reward{ResourceGrant{}};
};

// --- production ---

struct MiningActionDef {
  std::string id;
  std::string name;
  ResourceBundle output;
  std::optional<CharacterReaction> reaction;
};

struct BuildingDef {
  BuildingType type{BuildingType::Sawmill};

  // Persisted id ("les", "sob", ...).
  std::string id;
  std::string name;

  ResourceBundle base_cost;

  // Passive output per building per work shift.
  ResourceBundle output;

  std::vector<BiomeImpact> impacts;
  std::optional<CharacterReaction> on_build;
};

// Day-start flavor event.
struct RandomEventDef {
  std::string id;
  std::string message;
  ResourceBundle deltas;
  std::optional<BiomeImpact> biome_damage;
};

// --- log / outcome ---

enum class EventLevel : std::uint8_t { Info = 0, Warn = 1, Error = 2 };

enum class EventCategory : std::uint8_t {
  General = 0,
  Production = 1,
  Construction = 2,
  Market = 3,
  Research = 4,
  Lore = 5,
  Characters = 6,
  Ecology = 7,
  Population = 8,
  Achievement = 9,
  Victory = 10,
};

struct SimEvent {
  // Monotonic within a save.
  std::uint64_t seq{0};
  int day{0};
  EventLevel level{EventLevel::Info};
  EventCategory category{EventCategory::General};
  std::string message;
};

enum class VictoryCategory : std::uint8_t { Technological, Economic, Ecological, Cultural };

inline constexpr std::size_t kVictoryCategoryCount = 4;

enum class Difficulty : std::uint8_t { Easy, Normal, Hard };

// Technologies and secrets: Locked -> Available -> Unlocked. Only the
// Unlocked state is stored; the other two are derived from the state.
enum class UnlockState : std::uint8_t { Locked, Available, Unlocked };

} // namespace gradostroi
