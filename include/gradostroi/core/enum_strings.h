#pragma once

#include <optional>
#include <string>

#include "gradostroi/core/action_result.h"
#include "gradostroi/core/ecosystem.h"
#include "gradostroi/core/entities.h"
#include "gradostroi/core/resources.h"

namespace gradostroi {

// Shared string <-> enum conversion helpers.
//
// The *_to_string forms are the ids used in saves and content files; the
// parsers accept those ids case-insensitively (plus a few legacy spellings
// for resources) and return nullopt for anything else.

std::string resource_to_string(Resource r);
std::optional<Resource> resource_from_string(const std::string& s);

std::string biome_to_string(Biome b);
std::optional<Biome> biome_from_string(const std::string& s);

std::string building_type_to_string(BuildingType t);
std::optional<BuildingType> building_type_from_string(const std::string& s);

std::string trait_to_string(Trait t);
std::optional<Trait> trait_from_string(const std::string& s);

std::string player_action_to_string(PlayerAction a);
std::optional<PlayerAction> player_action_from_string(const std::string& s);

std::string event_level_to_string(EventLevel l);
std::optional<EventLevel> event_level_from_string(const std::string& s);

std::string event_category_to_string(EventCategory c);
std::optional<EventCategory> event_category_from_string(const std::string& s);

std::string victory_category_to_string(VictoryCategory c);
std::optional<VictoryCategory> victory_category_from_string(const std::string& s);

std::string difficulty_to_string(Difficulty d);
std::optional<Difficulty> difficulty_from_string(const std::string& s);

// Display labels only; never parsed.
std::string relationship_tier_label(RelationshipTier t);
std::string ecosystem_tier_label(EcosystemTier t);
std::string unlock_state_label(UnlockState s);
std::string action_status_label(ActionStatus s);

} // namespace gradostroi
