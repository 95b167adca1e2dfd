#pragma once

#include <cstdint>

#include "gradostroi/core/game_state.h"

namespace gradostroi {

struct NewGameConfig {
  std::uint64_t seed{1};
  Difficulty difficulty{Difficulty::Normal};
  int base_population{8};
};

// Fresh settlement from the content's starting conditions: starting stock,
// biomes and storage, every character at its initial score with its quests
// open, a freshly rolled event calendar, and the difficulty applied.
GameState make_new_game(const NewGameConfig& cfg, const ContentDB& content, const StorageRules& storage = {});

// Easy: food +25, wood +20, wine +15, eco penalty 0.8, happiness +10.
// Hard: food -5 (not below 0), eco penalty 1.2, happiness -5.
// Normal changes nothing. Applying it twice stacks the stock bonuses.
void apply_difficulty(GameState& s, Difficulty d, const StorageRules& storage = {});

} // namespace gradostroi
