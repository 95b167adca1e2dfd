#pragma once

#include <string>

#include "gradostroi/core/game_state.h"
#include "gradostroi/util/json.h"

namespace gradostroi {

inline constexpr int kCurrentSaveVersion = 1;

// Serialize the game state into an in-memory JSON document.
json::Value serialize_game_to_json_value(const GameState& state);

// Serialize the game state into a JSON text document (pretty-printed).
std::string serialize_game_to_json(const GameState& state);

// Parse a saved game from JSON text.
//
// Throws std::runtime_error on malformed JSON, missing required fields,
// unknown ids or a save_version newer than kCurrentSaveVersion. The result is
// not validated; run validate_game_state() on it before use.
GameState deserialize_game_from_json(const std::string& json_text);

GameState load_game_from_file(const std::string& path);

// Crash-safe (temp file + rename).
void save_game_to_file(const std::string& path, const GameState& state);

} // namespace gradostroi
