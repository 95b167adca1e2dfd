#include <algorithm>
#include <climits>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "gradostroi/core/calendar.h"
#include "gradostroi/core/content.h"
#include "gradostroi/core/serialization.h"
#include "gradostroi/core/simulation.h"
#include "gradostroi/core/state_validation.h"

#define GD_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool has_error(const std::vector<std::string>& errors, const std::string& needle) {
  return std::any_of(errors.begin(), errors.end(),
                     [&](const std::string& e) { return e.find(needle) != std::string::npos; });
}

} // namespace

int test_state_validation() {
  using namespace gradostroi;

  Simulation sim(default_content_db(), SimConfig{});
  sim.advance_days(30);
  const ContentDB& content = sim.content();

  // A played game stays valid.
  {
    const auto errors = validate_game_state(sim.state(), &content);
    for (const auto& e : errors) std::cerr << "state error: " << e << "\n";
    GD_ASSERT(errors.empty());
  }

  // Worker accounting.
  {
    GameState s = sim.state();
    s.idle_workers += 1;
    GD_ASSERT(has_error(validate_game_state(s), "Worker accounting broken"));

    GameState t = sim.state();
    t.workers[building_index(BuildingType::ClayPit)] = 1;
    t.idle_workers -= 1;
    GD_ASSERT(has_error(validate_game_state(t), "which is not built"));
  }

  // Storage cap applies to everything but the currency.
  {
    GameState s = sim.state();
    s.resources[resource_index(Resource::Wine)] = 10000.0;
    GD_ASSERT(validate_game_state(s).empty());
    s.resources[resource_index(Resource::Wood)] = 500.0;
    GD_ASSERT(has_error(validate_game_state(s), "exceeds storage capacity"));
    s.resources[resource_index(Resource::Wood)] = -1.0;
    GD_ASSERT(has_error(validate_game_state(s), "invalid amount"));
  }

  // Ranges and the victory latch.
  {
    GameState s = sim.state();
    s.happiness = 101.0;
    s.ecosystem.biomes[biome_index(Biome::Soil)] = -3.0;
    s.characters.at("mine_master").score = 120.0;
    s.multiplier_mode = 5;
    s.victory_achieved = true;
    const auto errors = validate_game_state(s);
    GD_ASSERT(has_error(errors, "happiness"));
    GD_ASSERT(has_error(errors, "Biome soil"));
    GD_ASSERT(has_error(errors, "mine_master"));
    GD_ASSERT(has_error(errors, "multiplier_mode"));
    GD_ASSERT(has_error(errors, "victory_achieved and victory_category disagree"));
    GD_ASSERT(std::is_sorted(errors.begin(), errors.end()));
  }

  // Content references are only checked when content is supplied.
  {
    GameState s = sim.state();
    s.researched_techs.push_back("time_travel");
    s.researched_techs.push_back("time_travel");
    GD_ASSERT(has_error(validate_game_state(s), "listed twice"));
    GD_ASSERT(!has_error(validate_game_state(s), "not defined in content"));
    GD_ASSERT(has_error(validate_game_state(s, &content), "Tech 'time_travel' is not defined in content"));

    GameState t = sim.state();
    t.characters.erase("forest_elder");
    GD_ASSERT(has_error(validate_game_state(t, &content), "missing from the state"));
  }

  // Oversized calendar parameters survive a save round trip but not
  // validation; the window arithmetic itself stays in range.
  {
    GameState s = sim.state();
    s.calendar.primary_start = 30;
    s.calendar.secondary_start = 1000000000;
    s.calendar.duration = 1000000000;
    const GameState loaded = deserialize_game_from_json(serialize_game_to_json(s));
    GD_ASSERT(loaded.calendar.duration == 1000000000);
    const auto errors = validate_game_state(loaded, &content);
    GD_ASSERT(has_error(errors, "Event calendar secondary_start"));
    GD_ASSERT(has_error(errors, "Event calendar duration"));
    GD_ASSERT(!has_error(errors, "Event calendar primary_start"));

    GD_ASSERT(std::fabs(hostility_modifier(loaded.calendar, 0) - 1.0) < 1e-12);
    GD_ASSERT(std::fabs(hostility_modifier(loaded.calendar, 2000000000) - 0.1) < 1e-12);

    GameState edge = sim.state();
    edge.calendar.duration = kMaxCalendarParameter;
    GD_ASSERT(!has_error(validate_game_state(edge), "Event calendar"));
    edge.calendar.duration = kMaxCalendarParameter + 1;
    GD_ASSERT(has_error(validate_game_state(edge), "Event calendar duration"));
  }

  // Worker and population counts are bounded before they are summed.
  {
    GameState s = sim.state();
    s.buildings[building_index(BuildingType::Sawmill)] = 1;
    s.buildings[building_index(BuildingType::Quarry)] = 1;
    s.workers[building_index(BuildingType::Sawmill)] = INT_MAX;
    s.workers[building_index(BuildingType::Quarry)] = INT_MAX;
    s.idle_workers = INT_MAX;
    s.population = INT_MAX;
    const auto errors = validate_game_state(s);
    GD_ASSERT(has_error(errors, "count or workers too large"));
    GD_ASSERT(has_error(errors, "too large"));
    GD_ASSERT(has_error(errors, "Worker accounting broken"));

    GameState t = sim.state();
    t.storage_units = kMaxUnitCount + 1;
    GD_ASSERT(has_error(validate_game_state(t), "Storage unit count"));
  }

  // Event log sequence.
  {
    GameState s = sim.state();
    SimEvent a;
    a.seq = 50;
    SimEvent b;
    b.seq = 40;
    s.events.push_back(a);
    s.events.push_back(b);
    GD_ASSERT(has_error(validate_game_state(s), "not increasing"));
  }

  return 0;
}
