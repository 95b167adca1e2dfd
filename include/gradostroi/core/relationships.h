#pragma once

#include <string>

#include "gradostroi/core/entities.h"

namespace gradostroi {

// Score gates used by the character interactions.
inline constexpr double kTradeMinScore = 20.0;
inline constexpr double kLoyalMinScore = 60.0;
inline constexpr double kLoyalDiscount = 0.98;
inline constexpr double kQuestMinScore = 0.0;

// Talking only helps up to this score.
inline constexpr double kTalkCeiling = 80.0;
inline constexpr double kTalkGain = 5.0;

inline constexpr double kTradeRelationshipGain = 2.0;

// deforestation -25, build_sawmill -10, build_herbalist +15,
// research_ecology +20, pollute_river -30, cleanup_pollution +25,
// build_forge +10.
ActionImpactTable default_action_impacts();

bool has_trait(const CharacterDef& def, Trait t);

// Signed change to the score (clamped to [-100,100]). Returns the applied delta.
double adjust_relationship(CharacterState& st, double delta);

// Applies the table impact for `action` plus the character's trait modifiers
// and returns the applied delta.
double react_to_action(CharacterState& st, const CharacterDef& def, PlayerAction action,
                       const ActionImpactTable& impacts);

RelationshipTier relationship_tier(double score);

// What the character says when the player stops by.
std::string dialogue_line(double score);

} // namespace gradostroi
