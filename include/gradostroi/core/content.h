#pragma once

#include <string>

#include "gradostroi/core/game_state.h"
#include "gradostroi/util/json.h"

namespace gradostroi {

// Built-in content: six production buildings, six mining actions, seven
// recipes, four technologies, three secrets, three characters with their
// quests, four achievements, five random events and the base price table.
ContentDB default_content_db();

// Builds a ContentDB from a parsed content document. Sections present in the
// document replace the corresponding built-in section; absent sections keep
// the defaults. Throws std::runtime_error on unknown ids or malformed entries.
ContentDB content_db_from_json(const json::Value& root);

// Loads a content file (see data/content/settlement.json).
ContentDB load_content_db_from_file(const std::string& path);

} // namespace gradostroi
