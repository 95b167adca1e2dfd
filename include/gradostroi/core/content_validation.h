#pragma once

#include <string>
#include <vector>

#include "gradostroi/core/game_state.h"

namespace gradostroi {

// Validate a ContentDB for internal consistency.
//
// Returns a list of human-readable error strings. An empty list means "valid".
//
// Checks key/id agreement, dangling references (prerequisites, recipe
// unlocks, character quests), prerequisite cycles, and that every amount,
// price and threshold is finite and in range.
std::vector<std::string> validate_content_db(const ContentDB& db);

} // namespace gradostroi
