#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "gradostroi/core/content.h"
#include "gradostroi/core/simulation.h"

#define GD_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool approx(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

gradostroi::SimConfig quiet_config() {
  gradostroi::SimConfig cfg;
  cfg.random_event_chance = 0.0;
  cfg.starvation_death_chance = 0.0;
  cfg.birth_chance = 0.0;
  return cfg;
}

double food(const gradostroi::Simulation& sim) {
  return sim.state().resources[gradostroi::resource_index(gradostroi::Resource::Food)];
}

bool workers_balanced(const gradostroi::GameState& s) {
  int sum = s.idle_workers;
  for (int w : s.workers) sum += w;
  return sum == s.population;
}

} // namespace

int test_simulation() {
  using namespace gradostroi;

  // Fresh settlement.
  {
    Simulation sim(default_content_db(), quiet_config());
    const GameState& s = sim.state();
    GD_ASSERT(s.day == 0);
    GD_ASSERT(s.population == 8);
    GD_ASSERT(s.idle_workers == 8);
    GD_ASSERT(approx(s.happiness, 50.0));
    GD_ASSERT(s.characters.size() == 3);
    GD_ASSERT(s.characters.at("forest_elder").open_quests.size() == 2);

    const SettlementSnapshot snap = sim.snapshot();
    GD_ASSERT(approx(snap.storage_capacity, 125.0));
    GD_ASSERT(snap.ecosystem_tier == EcosystemTier::Critical);
    GD_ASSERT(approx(snap.production_modifier, 0.6));
    GD_ASSERT(!snap.market_event_active);
    for (double p : snap.prices) GD_ASSERT(p >= 0.1);
    // Quotes do not touch the market history.
    for (const auto& h : sim.state().market.history) GD_ASSERT(h.empty());
  }

  // A fed day: eat 0.4 per head, happiness +0.5 then drifts 0.25 back.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(!sim.end_day());
    GD_ASSERT(sim.state().day == 1);
    GD_ASSERT(approx(food(sim), 12.0 - 8 * 0.4));
    GD_ASSERT(approx(sim.state().happiness, 50.25));
    GD_ASSERT(!sim.state().day_started);
  }

  // Happiness above the baseline relaxes toward it.
  {
    Simulation sim(default_content_db(), quiet_config());
    sim.state().happiness = 60.0;
    sim.end_day();
    GD_ASSERT(approx(sim.state().happiness, 60.25));
  }

  // Hunger: stock drops to zero, happiness pays for the deficit.
  {
    Simulation sim(default_content_db(), quiet_config());
    sim.state().resources[resource_index(Resource::Food)] = 1.0;
    sim.end_day();
    GD_ASSERT(approx(food(sim), 0.0));
    GD_ASSERT(approx(sim.state().happiness, 50.0 - 2.5 - 2.2 * 0.5 + 0.25));
    GD_ASSERT(sim.state().population == 8);

    bool warned = false;
    for (const auto& ev : sim.state().events) {
      if (ev.category == EventCategory::Population && ev.level == EventLevel::Warn) warned = true;
    }
    GD_ASSERT(warned);
  }

  // Starvation takes idle workers first, then staffed ones.
  {
    SimConfig cfg = quiet_config();
    cfg.starvation_death_chance = 1.0;
    Simulation sim(default_content_db(), cfg);
    GameState& s = sim.state();
    s.resources[resource_index(Resource::Food)] = 0.0;
    s.buildings[building_index(BuildingType::Quarry)] = 1;
    s.workers[building_index(BuildingType::Quarry)] = 7;
    s.idle_workers = 1;

    sim.end_day();
    GD_ASSERT(s.population == 7);
    GD_ASSERT(s.idle_workers == 0);
    GD_ASSERT(workers_balanced(s));

    sim.end_day();
    GD_ASSERT(s.population == 6);
    GD_ASSERT(s.workers[building_index(BuildingType::Quarry)] == 6);
    GD_ASSERT(workers_balanced(s));
  }

  // The last villager never starves.
  {
    SimConfig cfg = quiet_config();
    cfg.starvation_death_chance = 1.0;
    Simulation sim(default_content_db(), cfg);
    sim.state().resources[resource_index(Resource::Food)] = 0.0;
    sim.state().population = 1;
    sim.state().idle_workers = 1;
    sim.advance_days(3);
    GD_ASSERT(sim.state().population == 1);
    GD_ASSERT(sim.state().happiness >= 0.0);
  }

  // Births need a happy settlement.
  {
    SimConfig cfg = quiet_config();
    cfg.birth_chance = 1.0;
    Simulation sim(default_content_db(), cfg);
    sim.state().happiness = 69.0;
    sim.end_day();
    GD_ASSERT(sim.state().population == 8);

    sim.state().happiness = 80.0;
    sim.end_day();
    GD_ASSERT(sim.state().population == 9);
    GD_ASSERT(sim.state().idle_workers == 9);
  }

  // The start-of-day phases run once per day.
  {
    SimConfig cfg = quiet_config();
    cfg.random_event_chance = 1.0;
    Simulation sim(default_content_db(), cfg);
    sim.begin_day();
    GD_ASSERT(sim.state().day_started);
    const std::size_t events = sim.state().events.size();
    GD_ASSERT(events == 1);
    sim.begin_day();
    GD_ASSERT(sim.state().events.size() == events);
    sim.end_day();
    GD_ASSERT(sim.state().day == 1);
    GD_ASSERT(!sim.state().day_started);

    sim.advance_days(0);
    sim.advance_days(-4);
    GD_ASSERT(sim.state().day == 1);
  }

  // Random events apply their deltas through the storage rules.
  {
    ContentDB content = default_content_db();
    std::vector<RandomEventDef> only_fire;
    for (const auto& ev : content.random_events) {
      if (ev.id == "forest_fire") only_fire.push_back(ev);
    }
    GD_ASSERT(only_fire.size() == 1);
    content.random_events = only_fire;

    SimConfig cfg = quiet_config();
    cfg.random_event_chance = 1.0;
    Simulation sim(content, cfg);
    GD_ASSERT(sim.roll_random_event());
    GD_ASSERT(approx(sim.state().resources[resource_index(Resource::Wood)], 0.0));
    GD_ASSERT(approx(food(sim), 8.0));
    GD_ASSERT(approx(sim.state().ecosystem.biomes[biome_index(Biome::Forest)], 0.0));
    GD_ASSERT(sim.state().events.back().message.find("Event: ") == 0);

    content.random_events.clear();
    Simulation empty(content, cfg);
    GD_ASSERT(!empty.roll_random_event());
  }

  // Autosave hook fires on every interval boundary.
  {
    SimConfig cfg = quiet_config();
    cfg.autosave_interval_days = 5;
    Simulation sim(default_content_db(), cfg);
    std::vector<int> days;
    sim.set_autosave_hook([&](const GameState& s) { days.push_back(s.day); });
    sim.advance_days(12);
    GD_ASSERT(days.size() == 2);
    GD_ASSERT(days[0] == 5);
    GD_ASSERT(days[1] == 10);
  }

  // Difficulty.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(sim.set_difficulty(Difficulty::Easy).ok());
    GD_ASSERT(approx(food(sim), 37.0));
    GD_ASSERT(approx(sim.state().resources[resource_index(Resource::Wood)], 30.0));
    GD_ASSERT(approx(sim.state().resources[resource_index(Resource::Wine)], 25.0));
    GD_ASSERT(approx(sim.state().eco_industry_penalty, 0.8));
    GD_ASSERT(approx(sim.state().happiness, 60.0));
    GD_ASSERT(sim.set_difficulty(Difficulty::Hard).status == ActionStatus::AlreadyUnlocked);
  }
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(sim.mine("quarry_stone").ok());
    GD_ASSERT(sim.set_difficulty(Difficulty::Easy).status == ActionStatus::PrerequisiteUnmet);
    GD_ASSERT(sim.state().difficulty == Difficulty::Normal);
  }
  {
    Simulation sim(default_content_db(), quiet_config());
    NewGameConfig ng;
    ng.difficulty = Difficulty::Hard;
    sim.new_game(ng);
    GD_ASSERT(approx(food(sim), 7.0));
    GD_ASSERT(approx(sim.state().happiness, 45.0));
    GD_ASSERT(approx(sim.state().eco_industry_penalty, 1.2));
  }

  // Multiplier cycling.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(sim.multiplier() == 1);
    GD_ASSERT(sim.toggle_multiplier() == 10);
    GD_ASSERT(sim.toggle_multiplier() == 100);
    GD_ASSERT(sim.toggle_multiplier() == 1);
  }

  // Loading repairs a stale event sequence.
  {
    Simulation sim(default_content_db(), quiet_config());
    GameState s = sim.state();
    SimEvent ev;
    ev.seq = 10;
    ev.message = "old";
    s.events.push_back(ev);
    s.next_event_seq = 3;
    s.characters.erase("lore_keeper");
    sim.load_game(s);
    GD_ASSERT(sim.state().next_event_seq == 11);
    GD_ASSERT(sim.state().characters.count("lore_keeper") == 1);
    GD_ASSERT(approx(sim.state().characters.at("lore_keeper").score, 40.0));
  }

  // The event log is trimmed but sequence numbers keep increasing.
  {
    SimConfig cfg = quiet_config();
    cfg.max_events = 5;
    cfg.random_event_chance = 1.0;
    Simulation sim(default_content_db(), cfg);
    sim.advance_days(400);
    const auto& events = sim.state().events;
    GD_ASSERT(!events.empty());
    GD_ASSERT(events.size() <= 5 + 128);
    for (std::size_t i = 1; i < events.size(); ++i) GD_ASSERT(events[i].seq > events[i - 1].seq);
    GD_ASSERT(sim.state().next_event_seq > events.back().seq);
  }

  return 0;
}
