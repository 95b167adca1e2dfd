#pragma once

#include <string>

#include "gradostroi/core/game_state.h"

namespace gradostroi {

bool bundle_affordable(const ResourceStock& stock, const ResourceBundle& bundle, double scale = 1.0);

// Resource part covered by the stock and the research counter at or above
// the threshold.
bool cost_affordable(const GameState& s, const Cost& cost);

// Locked / Available / Unlocked for a technology (prerequisites included).
UnlockState tech_state(const GameState& s, const TechDef& def);
UnlockState secret_state(const GameState& s, const SecretDef& def);

bool condition_met(const GameState& s, const Condition& c);

std::string describe_condition(const Condition& c);
std::string describe_effect(const Effect& e);

// Applies one unlock effect to the state. Floors use max(current, value);
// scales multiply. Returns a short description for the event log.
std::string apply_effect(GameState& s, const ContentDB& content, const Effect& e);

// One-shot achievement reward. Resource grants respect the storage cap.
std::string apply_achievement_reward(GameState& s, const AchievementReward& reward, double capacity);

// Every character matching the reaction's trait (or all of them when it has
// none) reacts to the action. Characters are visited in id order.
void broadcast_reaction(GameState& s, const ContentDB& content, const CharacterReaction& reaction);

} // namespace gradostroi
