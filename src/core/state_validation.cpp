#include "gradostroi/core/state_validation.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "gradostroi/core/enum_strings.h"
#include "gradostroi/core/production.h"
#include "gradostroi/util/sorted_keys.h"

namespace gradostroi {

namespace {

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

// Stock slack for accumulated floating point error.
constexpr double kCapEpsilon = 1e-6;

bool in_range(double v, double lo, double hi) { return std::isfinite(v) && v >= lo && v <= hi; }

void check_unique(std::vector<std::string>& errors, const std::vector<std::string>& ids, const std::string& kind) {
  std::unordered_set<std::string> seen;
  for (const auto& id : ids) {
    if (id.empty()) push(errors, join(kind, " list contains an empty id"));
    if (!seen.insert(id).second) push(errors, join(kind, " '", id, "' is listed twice"));
  }
}

template <typename Map>
void check_known(std::vector<std::string>& errors, const std::vector<std::string>& ids, const Map& defs,
                 const std::string& kind) {
  for (const auto& id : ids) {
    if (!defs.count(id)) push(errors, join(kind, " '", id, "' is not defined in content"));
  }
}

} // namespace

std::vector<std::string> validate_game_state(const GameState& s, const ContentDB* content,
                                             const StorageRules& storage) {
  std::vector<std::string> errors;

  // --- Scalars ---
  if (s.save_version < 1) push(errors, join("Unsupported save_version ", s.save_version));
  if (s.day < 0) push(errors, join("Negative day ", s.day));
  if (std::find(kMultiplierSteps.begin(), kMultiplierSteps.end(), s.multiplier_mode) == kMultiplierSteps.end()) {
    push(errors, join("multiplier_mode ", s.multiplier_mode, " is not one of 1/10/100"));
  }
  if (!in_range(s.research, 0.0, 1e12)) push(errors, join("Invalid research counter ", s.research));
  if (s.victory_achieved != s.victory_category.has_value()) {
    push(errors, "victory_achieved and victory_category disagree");
  }
  const std::pair<const char*, double> multipliers[] = {
      {"craft_speed", s.craft_speed},
      {"research_bonus", s.research_bonus},
      {"food_production", s.food_production},
      {"mining_efficiency", s.mining_efficiency},
      {"eco_industry_penalty", s.eco_industry_penalty},
  };
  for (const auto& [name, v] : multipliers) {
    if (!(v > 0.0) || !std::isfinite(v)) push(errors, join(name, " must be a positive number (got ", v, ")"));
  }
  if (!in_range(s.happiness, 0.0, 100.0)) push(errors, join("happiness ", s.happiness, " outside [0,100]"));

  // --- Stock ---
  if (s.storage_units < 0) push(errors, join("Negative storage unit count ", s.storage_units));
  if (s.storage_units > kMaxUnitCount) push(errors, join("Storage unit count ", s.storage_units, " is too large"));
  const double cap = storage_capacity(s.storage_units, storage);
  for (Resource r : all_resources()) {
    const double v = s.resources[resource_index(r)];
    if (!std::isfinite(v) || v < 0.0) {
      push(errors, join("Resource ", resource_to_string(r), " has invalid amount ", v));
    } else if (r != kCurrencyResource && v > cap + kCapEpsilon) {
      push(errors, join("Resource ", resource_to_string(r), " amount ", v, " exceeds storage capacity ", cap));
    }
  }

  // --- Buildings / workers ---
  std::int64_t assigned = 0;
  for (BuildingType t : all_building_types()) {
    const std::size_t i = building_index(t);
    const int count = s.buildings[i];
    const int w = s.workers[i];
    if (count < 0) push(errors, join("Building ", building_type_to_string(t), " has negative count ", count));
    if (w < 0) push(errors, join("Building ", building_type_to_string(t), " has negative workers ", w));
    if (count > kMaxUnitCount || w > kMaxUnitCount) {
      push(errors, join("Building ", building_type_to_string(t), " count or workers too large"));
    }
    if (w > 0 && count <= 0) {
      push(errors, join(w, " workers assigned to ", building_type_to_string(t), " which is not built"));
    }
    assigned += w;
  }
  if (s.population < 1) push(errors, join("Population ", s.population, " must be at least 1"));
  if (s.idle_workers < 0) push(errors, join("Negative idle workers ", s.idle_workers));
  if (s.population > kMaxUnitCount || s.idle_workers > kMaxUnitCount) {
    push(errors, join("Population ", s.population, " or idle workers ", s.idle_workers, " too large"));
  }
  if (assigned + s.idle_workers != static_cast<std::int64_t>(s.population)) {
    push(errors, join("Worker accounting broken: assigned ", assigned, " + idle ", s.idle_workers,
                      " != population ", s.population));
  }

  // --- Progression lists ---
  check_unique(errors, s.researched_techs, "Tech");
  check_unique(errors, s.discovered_secrets, "Secret");
  check_unique(errors, s.unlocked_achievements, "Achievement");

  // --- Characters ---
  for (const auto& id : util::sorted_keys(s.characters)) {
    const CharacterState& c = s.characters.at(id);
    if (!in_range(c.score, -100.0, 100.0)) {
      push(errors, join("Character '", id, "' score ", c.score, " outside [-100,100]"));
    }
    check_unique(errors, c.open_quests, join("Character '", id, "' quest"));
  }

  // --- Ecosystem ---
  for (std::size_t i = 0; i < kBiomeCount; ++i) {
    const double h = s.ecosystem.biomes[i];
    if (!in_range(h, 0.0, 100.0)) {
      push(errors, join("Biome ", biome_to_string(static_cast<Biome>(i)), " health ", h, " outside [0,100]"));
    }
  }
  if (!in_range(s.ecosystem.pollution, 0.0, 100.0)) {
    push(errors, join("Pollution ", s.ecosystem.pollution, " outside [0,100]"));
  }
  if (!in_range(s.ecosystem.biodiversity, 0.0, 100.0)) {
    push(errors, join("Biodiversity ", s.ecosystem.biodiversity, " outside [0,100]"));
  }

  // --- Calendar ---
  const std::pair<const char*, int> calendar_params[] = {
      {"primary_start", s.calendar.primary_start},
      {"secondary_start", s.calendar.secondary_start},
      {"duration", s.calendar.duration},
  };
  for (const auto& [name, v] : calendar_params) {
    if (v < 0 || v > kMaxCalendarParameter) {
      push(errors, join("Event calendar ", name, " ", v, " outside [0,", kMaxCalendarParameter, "]"));
    }
  }

  // --- Market ---
  if (!(s.market.trend > 0.0) || !std::isfinite(s.market.trend)) {
    push(errors, join("Market trend must be positive (got ", s.market.trend, ")"));
  }
  for (Resource r : all_resources()) {
    const auto& h = s.market.history[resource_index(r)];
    if (h.size() > kPriceHistoryWindow) {
      push(errors, join("Price history for ", resource_to_string(r), " has ", h.size(), " samples"));
    }
    for (double p : h) {
      if (!(p > 0.0) || !std::isfinite(p)) {
        push(errors, join("Price history for ", resource_to_string(r), " contains invalid price ", p));
        break;
      }
    }
  }

  // --- Event log ---
  std::uint64_t prev_seq = 0;
  for (const auto& ev : s.events) {
    if (ev.seq == 0 || ev.seq <= prev_seq) {
      push(errors, join("Event log sequence is not increasing at seq ", ev.seq));
      break;
    }
    prev_seq = ev.seq;
  }
  if (prev_seq != 0 && s.next_event_seq <= prev_seq) {
    push(errors, join("next_event_seq ", s.next_event_seq, " is not past the last event seq ", prev_seq));
  }

  // --- Content references ---
  if (content) {
    check_known(errors, s.researched_techs, content->techs, "Tech");
    check_known(errors, s.discovered_secrets, content->secrets, "Secret");
    check_known(errors, s.unlocked_achievements, content->achievements, "Achievement");
    for (const auto& id : util::sorted_keys(s.characters)) {
      if (!content->characters.count(id)) {
        push(errors, join("Character '", id, "' is not defined in content"));
        continue;
      }
      check_known(errors, s.characters.at(id).open_quests, content->quests, join("Character '", id, "' quest"));
    }
    for (const auto& id : util::sorted_keys(content->characters)) {
      if (!s.characters.count(id)) push(errors, join("Character '", id, "' is missing from the state"));
    }
  }

  std::sort(errors.begin(), errors.end());
  return errors;
}

} // namespace gradostroi
