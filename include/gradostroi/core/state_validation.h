#pragma once

#include <string>
#include <vector>

#include "gradostroi/core/game_state.h"

namespace gradostroi {

// Upper bounds accepted for counters read from a save. Anything larger is
// treated as corruption.
inline constexpr int kMaxCalendarParameter = 1000000;
inline constexpr int kMaxUnitCount = 1000000;

// Validate basic invariants of a GameState: value ranges, worker accounting,
// storage caps, the victory latch and the event log sequence.
//
// If `content` is provided, ids that refer to content definitions (techs,
// secrets, achievements, characters, quests) are checked too.
//
// Returns a sorted list of human-readable error strings.
// Empty => state is considered valid.
std::vector<std::string> validate_game_state(const GameState& s, const ContentDB* content = nullptr,
                                             const StorageRules& storage = {});

} // namespace gradostroi
