#include "gradostroi/core/enum_strings.h"

#include <array>
#include <cstddef>
#include <utility>

#include "gradostroi/util/strings.h"

namespace gradostroi {
namespace {

template <typename E, std::size_t N>
std::optional<E> lookup(const std::array<const char*, N>& names, const std::string& raw) {
  const std::string s = to_lower(trim_copy(raw));
  for (std::size_t i = 0; i < N; ++i) {
    if (s == names[i]) return static_cast<E>(i);
  }
  return std::nullopt;
}

template <typename E, std::size_t N>
std::string name_of(const std::array<const char*, N>& names, E e) {
  const auto i = static_cast<std::size_t>(e);
  return i < N ? names[i] : std::string{};
}

// Index order must match the enum declarations.
constexpr std::array<const char*, kResourceCount> kResourceIds = {
    "wood",  "wine",  "rock",   "food",   "water",         "sand",     "clay",
    "iron",  "copper", "tin",   "nickel", "lead",          "salt",     "sulfur",
    "coal",  "steel", "bronze", "sulfuric_acid", "chlorine", "builder_materials", "instrument",
    "ancient_tool", "herbs",
};

constexpr std::array<const char*, kBiomeCount> kBiomeIds = {"forest", "rivers", "soil", "air"};

constexpr std::array<const char*, kBuildingTypeCount> kBuildingIds = {"les", "sob", "kam", "pol", "pes", "gli"};

constexpr std::array<const char*, 9> kTraitIds = {
    "environmentalist", "wise", "patient", "pragmatic", "blacksmith",
    "progressive",      "scholar", "curious", "traditionalist",
};

constexpr std::array<const char*, kPlayerActionCount> kActionIds = {
    "deforestation",     "build_sawmill", "build_herbalist", "research_ecology",
    "pollute_river",     "cleanup_pollution", "build_forge",
};

constexpr std::array<const char*, 3> kLevelIds = {"info", "warn", "error"};

constexpr std::array<const char*, 11> kCategoryIds = {
    "general", "production", "construction", "market",     "research", "lore",
    "characters", "ecology", "population",   "achievement", "victory",
};

constexpr std::array<const char*, kVictoryCategoryCount> kVictoryIds = {
    "technological", "economic", "ecological", "cultural"};

constexpr std::array<const char*, 3> kDifficultyIds = {"easy", "normal", "hard"};

} // namespace

std::string resource_to_string(Resource r) { return name_of(kResourceIds, r); }

std::optional<Resource> resource_from_string(const std::string& s) {
  if (auto r = lookup<Resource>(kResourceIds, s)) return r;
  static const std::array<std::pair<const char*, Resource>, 4> kLegacy = {{
      {"cooper", Resource::Copper},
      {"plumb", Resource::Lead},
      {"sulfur_acid", Resource::SulfuricAcid},
      {"clorine", Resource::Chlorine},
  }};
  const std::string low = to_lower(trim_copy(s));
  for (const auto& [name, r] : kLegacy) {
    if (low == name) return r;
  }
  return std::nullopt;
}

std::string biome_to_string(Biome b) { return name_of(kBiomeIds, b); }
std::optional<Biome> biome_from_string(const std::string& s) { return lookup<Biome>(kBiomeIds, s); }

std::string building_type_to_string(BuildingType t) { return name_of(kBuildingIds, t); }
std::optional<BuildingType> building_type_from_string(const std::string& s) {
  return lookup<BuildingType>(kBuildingIds, s);
}

std::string trait_to_string(Trait t) { return name_of(kTraitIds, t); }
std::optional<Trait> trait_from_string(const std::string& s) { return lookup<Trait>(kTraitIds, s); }

std::string player_action_to_string(PlayerAction a) { return name_of(kActionIds, a); }
std::optional<PlayerAction> player_action_from_string(const std::string& s) {
  return lookup<PlayerAction>(kActionIds, s);
}

std::string event_level_to_string(EventLevel l) { return name_of(kLevelIds, l); }
std::optional<EventLevel> event_level_from_string(const std::string& s) { return lookup<EventLevel>(kLevelIds, s); }

std::string event_category_to_string(EventCategory c) { return name_of(kCategoryIds, c); }
std::optional<EventCategory> event_category_from_string(const std::string& s) {
  return lookup<EventCategory>(kCategoryIds, s);
}

std::string victory_category_to_string(VictoryCategory c) { return name_of(kVictoryIds, c); }
std::optional<VictoryCategory> victory_category_from_string(const std::string& s) {
  return lookup<VictoryCategory>(kVictoryIds, s);
}

std::string difficulty_to_string(Difficulty d) { return name_of(kDifficultyIds, d); }
std::optional<Difficulty> difficulty_from_string(const std::string& s) {
  return lookup<Difficulty>(kDifficultyIds, s);
}

std::string relationship_tier_label(RelationshipTier t) {
  switch (t) {
    case RelationshipTier::Adores: return "Adores";
    case RelationshipTier::Respects: return "Respects";
    case RelationshipTier::Friendly: return "Friendly";
    case RelationshipTier::Neutral: return "Neutral";
    case RelationshipTier::Wary: return "Wary";
    case RelationshipTier::Displeased: return "Displeased";
    case RelationshipTier::Hostile: return "Hostile";
    case RelationshipTier::Hates: return "Hates";
  }
  return "Neutral";
}

std::string ecosystem_tier_label(EcosystemTier t) {
  switch (t) {
    case EcosystemTier::Healthy: return "Healthy";
    case EcosystemTier::Stable: return "Stable";
    case EcosystemTier::Degraded: return "Degraded";
    case EcosystemTier::Critical: return "Critical";
  }
  return "Critical";
}

std::string unlock_state_label(UnlockState s) {
  switch (s) {
    case UnlockState::Locked: return "locked";
    case UnlockState::Available: return "available";
    case UnlockState::Unlocked: return "unlocked";
  }
  return "locked";
}

std::string action_status_label(ActionStatus s) {
  switch (s) {
    case ActionStatus::Ok: return "ok";
    case ActionStatus::Unaffordable: return "unaffordable";
    case ActionStatus::InvalidReference: return "invalid reference";
    case ActionStatus::PrerequisiteUnmet: return "prerequisite unmet";
    case ActionStatus::InvalidQuantity: return "invalid quantity";
    case ActionStatus::AlreadyUnlocked: return "already unlocked";
  }
  return "ok";
}

} // namespace gradostroi
