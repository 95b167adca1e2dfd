#include "gradostroi/core/simulation.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "gradostroi/core/enum_strings.h"
#include "gradostroi/core/production.h"
#include "gradostroi/core/progression.h"
#include "gradostroi/util/log.h"
#include "gradostroi/util/sorted_keys.h"
#include "gradostroi/util/strings.h"

namespace gradostroi {

namespace {

// Takes one worker off the payroll after a death: an idle one if there is
// one, otherwise from the most staffed building.
void release_one_worker(GameState& s) {
  if (s.idle_workers > 0) {
    s.idle_workers -= 1;
    return;
  }
  std::size_t best = 0;
  for (std::size_t i = 1; i < s.workers.size(); ++i) {
    if (s.workers[i] > s.workers[best]) best = i;
  }
  if (s.workers[best] > 0) s.workers[best] -= 1;
}

} // namespace

Simulation::Simulation(ContentDB content, SimConfig cfg) : content_(std::move(content)), cfg_(cfg) {
  new_game();
}

void Simulation::new_game(const NewGameConfig& cfg) {
  state_ = make_new_game(cfg, content_, cfg_.storage);
  log::debug("New game: seed " + std::to_string(cfg.seed) + ", difficulty " + difficulty_to_string(cfg.difficulty));
}

void Simulation::load_game(GameState loaded) {
  state_ = std::move(loaded);

  {
    std::uint64_t max_seq = 0;
    for (const auto& ev : state_.events) max_seq = std::max(max_seq, ev.seq);
    if (state_.next_event_seq == 0) state_.next_event_seq = 1;
    if (state_.next_event_seq <= max_seq) state_.next_event_seq = max_seq + 1;
  }

  // Characters added to the content after the save was made start fresh.
  for (const auto& id : util::sorted_keys(content_.characters)) {
    if (state_.characters.count(id)) continue;
    const CharacterDef& def = content_.characters.at(id);
    CharacterState c;
    c.score = def.initial_score;
    c.open_quests = def.quests;
    state_.characters[id] = std::move(c);
  }
}

// --- Day cycle ---

void Simulation::begin_day() {
  if (state_.day_started) return;
  state_.day_started = true;
  tick_ecosystem();
  check_achievements();
  roll_random_event();
}

bool Simulation::end_day() {
  begin_day();
  end_of_day();
  return check_victory();
}

void Simulation::advance_days(int days) {
  if (days <= 0) return;
  for (int i = 0; i < days; ++i) end_day();
}

void Simulation::tick_ecosystem() {
  std::vector<IndustrySource> industry;
  industry.reserve(kBuildingTypeCount);
  for (BuildingType t : all_building_types()) {
    const std::size_t i = building_index(t);
    industry.push_back(IndustrySource{state_.buildings[i], content_.buildings[i].impacts});
  }
  gradostroi::tick_ecosystem(state_.ecosystem, industry, total_workers(state_), state_.eco_industry_penalty,
                             cfg_.ecosystem);
}

std::vector<std::string> Simulation::check_achievements() {
  std::vector<std::string> unlocked;
  for (const auto& id : util::sorted_keys(content_.achievements)) {
    if (has_achievement(state_, id)) continue;
    const AchievementDef& def = content_.achievements.at(id);
    if (!condition_met(state_, def.condition)) continue;

    state_.unlocked_achievements.push_back(id);
    const std::string reward = apply_achievement_reward(state_, def.reward, storage_capacity());
    push_event(EventLevel::Info, EventCategory::Achievement, "Achievement unlocked: " + def.name + " (" + reward + ")");
    unlocked.push_back(id);
  }
  return unlocked;
}

bool Simulation::roll_random_event() {
  if (!state_.rng.chance(cfg_.random_event_chance)) return false;
  if (content_.random_events.empty()) return false;

  const RandomEventDef& ev = content_.random_events[state_.rng.index(content_.random_events.size())];
  ResourceLedger ledger(state_.resources, storage_capacity());
  for (const auto& d : ev.deltas) ledger.adjust(d.resource, d.amount);
  if (ev.biome_damage) shift_biome(state_.ecosystem, ev.biome_damage->biome, ev.biome_damage->per_unit);

  push_event(EventLevel::Info, EventCategory::General, "Event: " + ev.message);
  return true;
}

void Simulation::end_of_day() {
  state_.day += 1;
  state_.day_started = false;

  ResourceLedger ledger(state_.resources, storage_capacity());
  const double need = static_cast<double>(state_.population) * cfg_.food_per_capita;
  const double food = ledger.get(Resource::Food);
  if (food >= need) {
    ledger.adjust(Resource::Food, -need);
    state_.happiness = std::min(100.0, state_.happiness + cfg_.fed_happiness_gain);
  } else {
    const double deficit = need - food;
    state_.resources[resource_index(Resource::Food)] = 0.0;
    state_.happiness =
        std::max(0.0, state_.happiness - cfg_.hunger_happiness_base - deficit * cfg_.hunger_happiness_per_deficit);
    push_event(EventLevel::Warn, EventCategory::Population, "Hunger: food short by " + format_fixed(deficit));

    if (state_.rng.chance(cfg_.starvation_death_chance) && state_.population > 1) {
      state_.population -= 1;
      release_one_worker(state_);
      push_event(EventLevel::Warn, EventCategory::Population,
                 "Starvation claimed a villager (population " + std::to_string(state_.population) + ")");
    }
  }

  const double base = cfg_.happiness_baseline;
  if (state_.happiness > base) {
    state_.happiness = std::max(base, state_.happiness - cfg_.happiness_decay);
  } else if (state_.happiness < base) {
    state_.happiness = std::min(base, state_.happiness + cfg_.happiness_decay);
  }

  if (state_.happiness >= cfg_.birth_happiness_threshold && state_.rng.chance(cfg_.birth_chance)) {
    state_.population += 1;
    state_.idle_workers += 1;
    push_event(EventLevel::Info, EventCategory::Population,
               "A child was born (population " + std::to_string(state_.population) + ")");
  }

  if (cfg_.autosave_interval_days > 0 && state_.day % cfg_.autosave_interval_days == 0 && autosave_hook_) {
    autosave_hook_(state_);
  }
}

bool Simulation::check_victory() {
  if (state_.victory_achieved) return false;
  const auto category = evaluate_victory(legacy_inputs(state_), cfg_.victory);
  if (!category) return false;

  state_.victory_achieved = true;
  state_.victory_category = *category;
  push_event(EventLevel::Info, EventCategory::Victory, "Victory: " + victory_category_to_string(*category));
  return true;
}

// --- Derived values ---

double Simulation::storage_capacity() const {
  return gradostroi::storage_capacity(state_.storage_units, cfg_.storage);
}

double Simulation::hostility() const { return hostility_modifier(state_.calendar, state_.day); }

double Simulation::production_modifier() const { return gradostroi::production_modifier(state_.ecosystem); }

double Simulation::happiness_modifier() const { return gradostroi::happiness_modifier(state_.happiness); }

double Simulation::quote_price(Resource r) const {
  return quote_market_price(r, state_.market, state_.resources, storage_capacity(), content_.base_prices,
                            market_event_modifier(state_.calendar, state_.day));
}

UnlockState Simulation::tech_state(const std::string& tech_id) const {
  const auto* def = find_ptr(content_.techs, tech_id);
  if (!def) return UnlockState::Locked;
  return gradostroi::tech_state(state_, *def);
}

UnlockState Simulation::secret_state(const std::string& secret_id) const {
  const auto* def = find_ptr(content_.secrets, secret_id);
  if (!def) return UnlockState::Locked;
  return gradostroi::secret_state(state_, *def);
}

SettlementSnapshot Simulation::snapshot() const {
  SettlementSnapshot snap;
  snap.day = state_.day;
  snap.multiplier = multiplier();
  snap.storage_capacity = storage_capacity();
  snap.storage_units = state_.storage_units;
  snap.population = state_.population;
  snap.idle_workers = state_.idle_workers;
  snap.happiness = state_.happiness;
  snap.research = state_.research;
  snap.research_complete = state_.research_complete;
  snap.victory_achieved = state_.victory_achieved;
  snap.victory_category = state_.victory_category;
  snap.ecosystem_health = overall_health(state_.ecosystem);
  snap.ecosystem_tier = ecosystem_tier(snap.ecosystem_health);
  snap.production_modifier = production_modifier();
  snap.hostility = hostility();
  snap.market_event_active = in_primary_window(state_.calendar, state_.day);
  snap.ecosystem = state_.ecosystem;
  snap.resources = state_.resources;
  snap.buildings = state_.buildings;
  snap.workers = state_.workers;
  for (Resource r : all_resources()) snap.prices[resource_index(r)] = quote_price(r);
  return snap;
}

LegacyReport Simulation::final_legacy() const { return calculate_final_legacy(legacy_inputs(state_)); }

// --- Settings ---

int Simulation::toggle_multiplier() {
  state_.multiplier_mode = next_multiplier(state_.multiplier_mode);
  return state_.multiplier_mode;
}

ActionResult Simulation::set_difficulty(Difficulty d) {
  if (state_.player_acted) {
    return ActionResult::failure(ActionStatus::PrerequisiteUnmet,
                                 "difficulty can only change before the first action");
  }
  if (state_.difficulty != Difficulty::Normal) {
    return ActionResult::failure(ActionStatus::AlreadyUnlocked,
                                 "difficulty already set to " + difficulty_to_string(state_.difficulty));
  }
  apply_difficulty(state_, d, cfg_.storage);
  push_event(EventLevel::Info, EventCategory::General, "Difficulty: " + difficulty_to_string(d));
  return ActionResult::success("difficulty set to " + difficulty_to_string(d));
}

// --- Event log ---

void Simulation::push_event(EventLevel level, std::string message) {
  push_event(level, EventCategory::General, std::move(message));
}

void Simulation::push_event(EventLevel level, EventCategory category, std::string message) {
  const std::string line = "Day " + std::to_string(state_.day) + ": " + message;
  switch (level) {
    case EventLevel::Info: log::info(line); break;
    case EventLevel::Warn: log::warn(line); break;
    case EventLevel::Error: log::error(line); break;
  }

  SimEvent ev;
  ev.seq = state_.next_event_seq;
  state_.next_event_seq += 1;
  if (state_.next_event_seq == 0) state_.next_event_seq = 1;

  ev.day = state_.day;
  ev.level = level;
  ev.category = category;
  ev.message = std::move(message);
  state_.events.push_back(std::move(ev));

  const int max_events = cfg_.max_events;
  if (max_events > 0 && static_cast<int>(state_.events.size()) > max_events + 128) {
    const std::size_t keep = static_cast<std::size_t>(max_events);
    const std::size_t cut = state_.events.size() - keep;
    state_.events.erase(state_.events.begin(), state_.events.begin() + static_cast<std::ptrdiff_t>(cut));
  }
}

} // namespace gradostroi
