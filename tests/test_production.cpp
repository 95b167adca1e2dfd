#include <cmath>
#include <iostream>

#include "gradostroi/core/content.h"
#include "gradostroi/core/production.h"
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
  return cfg;
}

double stock(const gradostroi::Simulation& sim, gradostroi::Resource r) {
  return sim.state().resources[gradostroi::resource_index(r)];
}

void set_stock(gradostroi::Simulation& sim, gradostroi::Resource r, double v) {
  sim.state().resources[gradostroi::resource_index(r)] = v;
}

} // namespace

int test_production() {
  using namespace gradostroi;

  // Pure helpers.
  GD_ASSERT(approx(happiness_modifier(50.0), 1.0));
  GD_ASSERT(approx(happiness_modifier(70.0), 1.1));
  GD_ASSERT(approx(happiness_modifier(100.0), 1.2));
  GD_ASSERT(approx(happiness_modifier(0.0), 0.8));
  GD_ASSERT(approx(worker_bonus(0), 1.0));
  GD_ASSERT(approx(worker_bonus(2), 1.3));
  GD_ASSERT(approx(worker_bonus(9), 1.75));
  GD_ASSERT(approx(building_cost_scale(0), 1.0));
  GD_ASSERT(approx(building_cost_scale(3), 1.3));
  GD_ASSERT(next_multiplier(1) == 10);
  GD_ASSERT(next_multiplier(10) == 100);
  GD_ASSERT(next_multiplier(100) == 1);
  GD_ASSERT(next_multiplier(7) == 1);

  // Construction: all or nothing, and each copy costs 10% more.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(approx(stock(sim, Resource::Wood), 10.0));
    GD_ASSERT(approx(stock(sim, Resource::Rock), 10.0));

    const ActionResult poor = sim.build(BuildingType::Sawmill);
    GD_ASSERT(poor.status == ActionStatus::Unaffordable);
    GD_ASSERT(approx(stock(sim, Resource::Wood), 10.0));
    GD_ASSERT(approx(stock(sim, Resource::Rock), 10.0));
    GD_ASSERT(sim.state().buildings[building_index(BuildingType::Sawmill)] == 0);
    GD_ASSERT(!sim.state().player_acted);

    set_stock(sim, Resource::Wood, 20.0);
    GD_ASSERT(sim.build(BuildingType::Sawmill).ok());
    GD_ASSERT(approx(stock(sim, Resource::Wood), 5.0));
    GD_ASSERT(approx(stock(sim, Resource::Rock), 5.0));
    GD_ASSERT(sim.state().buildings[building_index(BuildingType::Sawmill)] == 1);
    GD_ASSERT(sim.state().player_acted);

    // Environmentalists dislike sawmills.
    GD_ASSERT(approx(sim.state().characters.at("forest_elder").score, 40.0));

    set_stock(sim, Resource::Wood, 16.4);
    set_stock(sim, Resource::Rock, 10.0);
    GD_ASSERT(sim.build(BuildingType::Sawmill).status == ActionStatus::Unaffordable);
    set_stock(sim, Resource::Wood, 16.6);
    GD_ASSERT(sim.build(BuildingType::Sawmill).ok());
    GD_ASSERT(approx(stock(sim, Resource::Wood), 0.1));
    GD_ASSERT(approx(stock(sim, Resource::Rock), 4.5));
  }

  // Storage units raise the cap and are never price-scaled.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(approx(sim.storage_capacity(), 125.0));
    set_stock(sim, Resource::Wood, 40.0);
    set_stock(sim, Resource::Rock, 30.0);
    GD_ASSERT(sim.build_storage().ok());
    GD_ASSERT(sim.build_storage().ok());
    GD_ASSERT(sim.state().storage_units == 3);
    GD_ASSERT(approx(sim.storage_capacity(), 275.0));
    GD_ASSERT(approx(stock(sim, Resource::Wood), 0.0));
    GD_ASSERT(approx(stock(sim, Resource::Rock), 0.0));
    GD_ASSERT(sim.build_storage().status == ActionStatus::Unaffordable);
  }

  // Worker assignment keeps sum(workers) + idle == population.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(sim.assign_workers(BuildingType::Quarry, 2).status == ActionStatus::PrerequisiteUnmet);

    set_stock(sim, Resource::Wood, 20.0);
    GD_ASSERT(sim.build(BuildingType::Sawmill).ok());

    const auto invariant = [&]() {
      int sum = sim.state().idle_workers;
      for (int w : sim.state().workers) sum += w;
      return sum == sim.state().population;
    };

    GD_ASSERT(sim.assign_workers(BuildingType::Sawmill, 3).ok());
    GD_ASSERT(sim.state().idle_workers == 5);
    GD_ASSERT(invariant());

    GD_ASSERT(sim.assign_workers(BuildingType::Sawmill, 9).status == ActionStatus::InvalidQuantity);
    GD_ASSERT(sim.state().workers[building_index(BuildingType::Sawmill)] == 3);

    GD_ASSERT(sim.assign_workers(BuildingType::Sawmill, 8).ok());
    GD_ASSERT(sim.state().idle_workers == 0);
    GD_ASSERT(sim.assign_workers(BuildingType::Sawmill, 0).ok());
    GD_ASSERT(sim.state().idle_workers == 8);
    GD_ASSERT(sim.assign_workers(BuildingType::Sawmill, -1).status == ActionStatus::InvalidQuantity);
    GD_ASSERT(invariant());
  }

  // Mining: output * multiplier * hostility * happiness * ecosystem * efficiency.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(approx(sim.hostility(), 1.0));
    GD_ASSERT(approx(sim.production_modifier(), 0.6));

    GD_ASSERT(sim.mine("no_such_action").status == ActionStatus::InvalidReference);
    GD_ASSERT(!sim.state().player_acted);

    GD_ASSERT(sim.mine("fell_timber").ok());
    GD_ASSERT(approx(stock(sim, Resource::Wood), 13.0));
    GD_ASSERT(approx(stock(sim, Resource::Wine), 10.6));

    GD_ASSERT(sim.toggle_multiplier() == 10);
    GD_ASSERT(sim.mine("quarry_stone").ok());
    GD_ASSERT(approx(stock(sim, Resource::Rock), 10.0 + 3.0 * 10.0 * 0.6));

    sim.state().mining_efficiency = 1.6;
    sim.state().happiness = 70.0;
    GD_ASSERT(sim.mine("forage").ok());
    GD_ASSERT(approx(stock(sim, Resource::Water), 3.0 * 10.0 * 1.1 * 0.6 * 1.6));
  }

  // Output never exceeds the storage cap.
  {
    Simulation sim(default_content_db(), quiet_config());
    sim.state().multiplier_mode = 100;
    GD_ASSERT(sim.mine("quarry_stone").ok());
    GD_ASSERT(approx(stock(sim, Resource::Rock), 125.0));
  }

  // Buildings produce one shift of output on every mining action.
  {
    Simulation sim(default_content_db(), quiet_config());
    GameState& s = sim.state();
    s.buildings[building_index(BuildingType::Farm)] = 2;
    s.workers[building_index(BuildingType::Farm)] = 2;
    s.idle_workers = 6;
    s.ecosystem.biomes = {85.0, 85.0, 85.0, 85.0};

    sim.collect_building_output();
    GD_ASSERT(approx(stock(sim, Resource::Food), 12.0 + 3.0 * 2.0 * 1.2 * 1.3));

    s.food_production = 1.5;
    set_stock(sim, Resource::Food, 0.0);
    sim.collect_building_output();
    GD_ASSERT(approx(stock(sim, Resource::Food), 3.0 * 2.0 * 1.2 * 1.3 * 1.5));

    set_stock(sim, Resource::Food, 0.0);
    GD_ASSERT(sim.mine("dig_sand").ok());
    GD_ASSERT(approx(stock(sim, Resource::Food), 3.0 * 2.0 * 1.2 * 1.3 * 1.5));
  }

  // Crafting.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(sim.craft("nope").status == ActionStatus::InvalidReference);

    GD_ASSERT(sim.craft("coal").ok());
    GD_ASSERT(approx(stock(sim, Resource::Wood), 9.0));
    GD_ASSERT(approx(stock(sim, Resource::Coal), 1.0));

    // Missing iron: nothing is consumed.
    GD_ASSERT(sim.craft("steel").status == ActionStatus::Unaffordable);
    GD_ASSERT(approx(stock(sim, Resource::Coal), 1.0));

    sim.state().craft_speed = 1.5;
    GD_ASSERT(sim.craft("coal").ok());
    GD_ASSERT(approx(stock(sim, Resource::Wood), 7.5));
    GD_ASSERT(approx(stock(sim, Resource::Coal), 2.5));

    // Hostile days double throughput.
    sim.state().craft_speed = 1.0;
    sim.state().day = sim.state().calendar.primary_start;
    GD_ASSERT(approx(sim.hostility(), 2.0));
    GD_ASSERT(sim.craft("coal").ok());
    GD_ASSERT(approx(stock(sim, Resource::Wood), 5.5));
    GD_ASSERT(approx(stock(sim, Resource::Coal), 4.5));
  }

  // Recipes gated by an unlock, consuming research.
  {
    Simulation sim(default_content_db(), quiet_config());
    set_stock(sim, Resource::Instrument, 2.0);
    set_stock(sim, Resource::Steel, 1.0);
    sim.state().research = 25.0;

    GD_ASSERT(sim.craft("ancient_tool").status == ActionStatus::PrerequisiteUnmet);
    sim.state().discovered_secrets.push_back("forge_of_souls");

    sim.state().research = 10.0;
    GD_ASSERT(sim.craft("ancient_tool").status == ActionStatus::Unaffordable);
    GD_ASSERT(approx(stock(sim, Resource::Instrument), 2.0));

    sim.state().research = 25.0;
    GD_ASSERT(sim.craft("ancient_tool").ok());
    GD_ASSERT(approx(sim.state().research, 5.0));
    GD_ASSERT(approx(stock(sim, Resource::AncientTool), 1.0));
    GD_ASSERT(approx(stock(sim, Resource::Instrument), 0.0));
    GD_ASSERT(approx(stock(sim, Resource::Steel), 0.0));
  }

  // Studying a resource converts the whole stock into research.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(sim.research_resource(Resource::Wood).ok());
    GD_ASSERT(approx(sim.state().research, 0.2));
    GD_ASSERT(approx(stock(sim, Resource::Wood), 0.0));
    GD_ASSERT(sim.research_resource(Resource::Wood).status == ActionStatus::Unaffordable);

    sim.state().research_bonus = 1.5;
    GD_ASSERT(sim.research_resource(Resource::Rock).ok());
    GD_ASSERT(approx(sim.state().research, 0.5));

    GD_ASSERT(!sim.state().research_complete);
    sim.state().research = 99.9;
    GD_ASSERT(sim.research_resource(Resource::Food).ok());
    GD_ASSERT(sim.state().research_complete);
  }

  return 0;
}
