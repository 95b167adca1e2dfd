#include "gradostroi/core/scenario.h"

#include <algorithm>
#include <utility>

#include "gradostroi/util/sorted_keys.h"

namespace gradostroi {

GameState make_new_game(const NewGameConfig& cfg, const ContentDB& content, const StorageRules& storage) {
  GameState s;
  s.rng = util::HashRng(cfg.seed);
  s.calendar = roll_event_calendar(s.rng);

  s.storage_units = std::max(0, content.start.storage_units);
  ResourceLedger ledger(s.resources, storage_capacity(s.storage_units, storage));
  ledger.credit(content.start.resources);

  s.ecosystem.biomes = content.start.biomes;

  s.population = std::max(1, cfg.base_population);
  s.idle_workers = s.population;

  for (const auto& id : util::sorted_keys(content.characters)) {
    const CharacterDef& def = content.characters.at(id);
    CharacterState c;
    c.score = std::clamp(def.initial_score, -100.0, 100.0);
    c.open_quests = def.quests;
    s.characters[id] = std::move(c);
  }

  apply_difficulty(s, cfg.difficulty, storage);
  return s;
}

void apply_difficulty(GameState& s, Difficulty d, const StorageRules& storage) {
  s.difficulty = d;
  ResourceLedger ledger(s.resources, storage_capacity(s.storage_units, storage));
  switch (d) {
    case Difficulty::Easy:
      ledger.adjust(Resource::Food, 25.0);
      ledger.adjust(Resource::Wood, 20.0);
      ledger.adjust(Resource::Wine, 15.0);
      s.eco_industry_penalty = 0.8;
      s.happiness = std::min(100.0, s.happiness + 10.0);
      break;
    case Difficulty::Normal:
      break;
    case Difficulty::Hard:
      ledger.adjust(Resource::Food, -5.0);
      s.eco_industry_penalty = 1.2;
      s.happiness = std::max(0.0, s.happiness - 5.0);
      break;
  }
}

} // namespace gradostroi
