#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gradostroi/core/action_result.h"
#include "gradostroi/core/game_state.h"
#include "gradostroi/core/legacy.h"
#include "gradostroi/core/scenario.h"

namespace gradostroi {

struct SimConfig {
  StorageRules storage;
  EcosystemRules ecosystem;
  MarketRules market;
  VictoryRules victory;

  // Food eaten per inhabitant per day.
  double food_per_capita{0.4};

  // Happiness gained on a day everyone ate.
  double fed_happiness_gain{0.5};

  // Hunger penalty: base + per_deficit * (food short).
  double hunger_happiness_base{2.5};
  double hunger_happiness_per_deficit{0.5};

  // Daily pull of happiness toward the baseline.
  double happiness_baseline{50.0};
  double happiness_decay{0.25};

  double random_event_chance{0.12};
  double starvation_death_chance{0.1};

  // Births only happen at or above the threshold.
  double birth_chance{0.12};
  double birth_happiness_threshold{70.0};

  // research gained = stock * research_per_unit * research_bonus
  double research_per_unit{0.02};
  double research_goal{100.0};

  // 0 disables the autosave hook.
  int autosave_interval_days{5};

  // Maximum number of persistent simulation events to keep in GameState::events.
  // 0 means "unlimited" (not recommended for very long runs).
  int max_events{1000};
};

// Read-only view for displays. Prices are noise-free quotes.
struct SettlementSnapshot {
  int day{0};
  int multiplier{1};
  double storage_capacity{0.0};
  int storage_units{0};

  int population{0};
  int idle_workers{0};
  double happiness{0.0};

  double research{0.0};
  bool research_complete{false};
  bool victory_achieved{false};
  std::optional<VictoryCategory> victory_category;

  double ecosystem_health{0.0};
  EcosystemTier ecosystem_tier{EcosystemTier::Critical};
  double production_modifier{1.0};
  double hostility{1.0};
  bool market_event_active{false};
  EcosystemState ecosystem;

  ResourceStock resources{};
  BuildingCounts buildings{};
  BuildingCounts workers{};
  PriceTable prices{};
};

// Invoked with the state whenever a day ends on a multiple of
// SimConfig::autosave_interval_days.
using AutosaveHook = std::function<void(const GameState&)>;

// The engine. Owns its content, configuration and state; independent
// instances never share anything.
//
// Every action returns an ActionResult; a failed action leaves the state as it
// was (a failed trade still records the observed market price).
class Simulation {
 public:
  Simulation(ContentDB content, SimConfig cfg);

  ContentDB& content() { return content_; }
  const ContentDB& content() const { return content_; }

  const SimConfig& cfg() const { return cfg_; }

  GameState& state() { return state_; }
  const GameState& state() const { return state_; }

  void new_game(const NewGameConfig& cfg = {});
  void load_game(GameState loaded);

  void set_autosave_hook(AutosaveHook hook) { autosave_hook_ = std::move(hook); }

  // --- Day cycle ---
  //
  // EcosystemTick -> AchievementCheck -> RandomEvent -> (player actions) ->
  // EndOfDay -> VictoryCheck.

  // Runs the three start-of-day phases once per day; later calls the same
  // day are no-ops.
  void begin_day();

  // Closes the day (running begin_day() first if needed). Returns true iff
  // victory latched at the end of this day.
  bool end_day();

  // Runs `days` full days.
  void advance_days(int days);

  // Individual phases (begin_day()/end_day() call these).
  void tick_ecosystem();
  std::vector<std::string> check_achievements();
  bool roll_random_event();
  bool check_victory();

  // --- Derived values ---
  int multiplier() const { return state_.multiplier_mode; }
  double storage_capacity() const;
  double hostility() const;
  double production_modifier() const;
  double happiness_modifier() const;

  double quote_price(Resource r) const;
  UnlockState tech_state(const std::string& tech_id) const;
  UnlockState secret_state(const std::string& secret_id) const;

  SettlementSnapshot snapshot() const;
  LegacyReport final_legacy() const;

  // --- Settings ---
  // Cycles 1 -> 10 -> 100 -> 1 and returns the new multiplier.
  int toggle_multiplier();

  // Only before the first player action, and only on a game created at
  // Normal difficulty.
  ActionResult set_difficulty(Difficulty d);

  // --- Production ---
  ActionResult mine(const std::string& action_id);

  // One work shift of passive building output.
  void collect_building_output();

  ActionResult build(BuildingType type);
  ActionResult build_storage();
  ActionResult assign_workers(BuildingType type, int workers);
  ActionResult craft(const std::string& recipe_id);

  // Converts the whole stock of `r` into research.
  ActionResult research_resource(Resource r);

  // --- Progression ---
  ActionResult research_technology(const std::string& tech_id);
  ActionResult discover_secret(const std::string& secret_id);

  // --- Market ---
  // Observes (and records) the current market price.
  double current_price(Resource r);
  ActionResult trade(Resource r, double amount, bool buying);

  // --- Characters ---
  // The result message is the character's line.
  ActionResult talk(const std::string& character_id);
  ActionResult trade_with_character(const std::string& character_id, Resource r, double amount);
  ActionResult complete_quest(const std::string& character_id, const std::string& quest_id);

 private:
  void end_of_day();
  void note_player_action() { state_.player_acted = true; }

  void push_event(EventLevel level, std::string message);
  void push_event(EventLevel level, EventCategory category, std::string message);

  ContentDB content_;
  SimConfig cfg_;
  GameState state_;
  AutosaveHook autosave_hook_;
};

} // namespace gradostroi
