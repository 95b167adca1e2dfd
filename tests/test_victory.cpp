#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "gradostroi/core/content.h"
#include "gradostroi/core/legacy.h"
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

} // namespace

int test_victory() {
  using namespace gradostroi;

  // Priority order: technological, economic, ecological, cultural.
  {
    LegacyInputs in;
    GD_ASSERT(!evaluate_victory(in).has_value());

    in.discovered_secrets = 2;
    GD_ASSERT(evaluate_victory(in) == VictoryCategory::Cultural);
    in.ecosystem_health = 85.0;
    GD_ASSERT(evaluate_victory(in) == VictoryCategory::Cultural);
    in.ecosystem_health = 85.1;
    GD_ASSERT(evaluate_victory(in) == VictoryCategory::Ecological);
    in.non_currency_wealth = 650.0;
    GD_ASSERT(evaluate_victory(in) == VictoryCategory::Ecological);
    in.non_currency_wealth = 651.0;
    GD_ASSERT(evaluate_victory(in) == VictoryCategory::Economic);
    in.research_complete = true;
    GD_ASSERT(evaluate_victory(in) == VictoryCategory::Technological);
  }

  // Currency does not count as wealth.
  {
    LegacyInputs in;
    in.currency = 100000.0;
    GD_ASSERT(!evaluate_victory(in).has_value());
  }

  // Legacy scoring and titles.
  {
    LegacyInputs in;
    const LegacyReport none = calculate_final_legacy(in);
    GD_ASSERT(none.category == VictoryCategory::Technological);
    GD_ASSERT(none.title == "Survivor");

    in.research = 95.0;
    const LegacyReport tech = calculate_final_legacy(in);
    GD_ASSERT(tech.category == VictoryCategory::Technological);
    GD_ASSERT(tech.title == "Great Innovator");
    GD_ASSERT(approx(tech.score, 95.0));
  }
  {
    // A healthy ecosystem boosts the economic score.
    LegacyInputs in;
    in.non_currency_wealth = 2000.0;
    in.currency = 0.0;
    in.ecosystem_health = 80.0;
    const LegacyReport r = calculate_final_legacy(in);
    GD_ASSERT(r.category == VictoryCategory::Economic);
    GD_ASSERT(approx(r.scores[static_cast<std::size_t>(VictoryCategory::Economic)], 240.0));
    GD_ASSERT(r.title == "Successful Merchant");
  }
  {
    LegacyInputs in;
    in.unlocked_achievements = 4;
    const LegacyReport r = calculate_final_legacy(in);
    GD_ASSERT(r.category == VictoryCategory::Cultural);
    GD_ASSERT(approx(r.score, 100.0));
    GD_ASSERT(r.title == "Cultural Icon");
  }
  {
    // Ties go to the earlier category.
    LegacyInputs in;
    in.research = 50.0;
    in.ecosystem_health = 50.0;
    const LegacyReport r = calculate_final_legacy(in);
    GD_ASSERT(r.category == VictoryCategory::Technological);
    GD_ASSERT(r.title == "Inventor");
  }
  GD_ASSERT(legacy_title(VictoryCategory::Ecological, 85.0) == "Wise Keeper");
  GD_ASSERT(legacy_title(VictoryCategory::Economic, 499.0) == "Successful Merchant");
  GD_ASSERT(legacy_title(VictoryCategory::Cultural, 39.0) == "Survivor");

  // Fresh settlement legacy.
  {
    Simulation sim(default_content_db(), quiet_config());
    const LegacyReport r = sim.final_legacy();
    GD_ASSERT(r.category == VictoryCategory::Ecological);
    GD_ASSERT(approx(r.score, 3.75));
    GD_ASSERT(approx(r.scores[static_cast<std::size_t>(VictoryCategory::Economic)], 3.7));
  }

  // Victory latches once and the game keeps going.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(!sim.end_day());
    sim.state().research_complete = true;
    GD_ASSERT(sim.end_day());
    GD_ASSERT(sim.state().victory_achieved);
    GD_ASSERT(sim.state().victory_category == VictoryCategory::Technological);

    GD_ASSERT(!sim.end_day());
    GD_ASSERT(sim.state().victory_achieved);
    GD_ASSERT(sim.state().day == 3);

    int victory_events = 0;
    for (const auto& ev : sim.state().events) {
      if (ev.category == EventCategory::Victory) ++victory_events;
    }
    GD_ASSERT(victory_events == 1);
  }

  {
    Simulation sim(default_content_db(), quiet_config());
    sim.state().ecosystem.biomes = {90.0, 90.0, 90.0, 90.0};
    GD_ASSERT(sim.check_victory());
    GD_ASSERT(sim.state().victory_category == VictoryCategory::Ecological);
    GD_ASSERT(!sim.check_victory());
  }

  {
    Simulation sim(default_content_db(), quiet_config());
    for (Resource r : {Resource::Wood, Resource::Rock, Resource::Food, Resource::Water, Resource::Sand,
                       Resource::Clay}) {
      sim.state().resources[resource_index(r)] = 110.0;
    }
    GD_ASSERT(sim.check_victory());
    GD_ASSERT(sim.state().victory_category == VictoryCategory::Economic);
  }

  // Achievements unlock once and pay out.
  {
    Simulation sim(default_content_db(), quiet_config());
    sim.state().buildings[building_index(BuildingType::Quarry)] = 3;

    const std::vector<std::string> first = sim.check_achievements();
    GD_ASSERT(first.size() == 1);
    GD_ASSERT(first[0] == "first_settlement");
    GD_ASSERT(approx(sim.state().resources[resource_index(Resource::BuilderMaterials)], 10.0));
    GD_ASSERT(sim.check_achievements().empty());
    GD_ASSERT(approx(sim.state().resources[resource_index(Resource::BuilderMaterials)], 10.0));

    sim.state().research = 50.0;
    const std::vector<std::string> second = sim.check_achievements();
    GD_ASSERT(second.size() == 1);
    GD_ASSERT(second[0] == "tech_pioneer");
    GD_ASSERT(approx(sim.state().research_bonus, 1.5));
    GD_ASSERT(sim.state().unlocked_achievements.size() == 2);
  }

  return 0;
}
