#include <cmath>
#include <iostream>
#include <string>

#include "gradostroi/core/content.h"
#include "gradostroi/core/progression.h"
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

double& stock(gradostroi::Simulation& sim, gradostroi::Resource r) {
  return sim.state().resources[gradostroi::resource_index(r)];
}

} // namespace

int test_progression() {
  using namespace gradostroi;

  // Research is a threshold, not a price.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(sim.tech_state("basic_agriculture") == UnlockState::Locked);
    GD_ASSERT(sim.research_technology("basic_agriculture").status == ActionStatus::Unaffordable);
    GD_ASSERT(sim.state().researched_techs.empty());
    GD_ASSERT(!sim.state().player_acted);

    sim.state().research = 20.0;
    GD_ASSERT(sim.tech_state("basic_agriculture") == UnlockState::Available);
    GD_ASSERT(sim.research_technology("basic_agriculture").ok());
    GD_ASSERT(sim.tech_state("basic_agriculture") == UnlockState::Unlocked);
    GD_ASSERT(approx(sim.state().food_production, 1.5));
    GD_ASSERT(approx(sim.state().research, 20.0));

    GD_ASSERT(sim.research_technology("basic_agriculture").status == ActionStatus::AlreadyUnlocked);
    GD_ASSERT(sim.state().researched_techs.size() == 1);

    GD_ASSERT(sim.research_technology("no_such_tech").status == ActionStatus::InvalidReference);
    GD_ASSERT(sim.tech_state("no_such_tech") == UnlockState::Locked);

    bool logged = false;
    for (const auto& ev : sim.state().events) {
      if (ev.category == EventCategory::Research) logged = true;
    }
    GD_ASSERT(logged);
  }

  // Prerequisites come before cost.
  {
    Simulation sim(default_content_db(), quiet_config());
    sim.state().research = 100.0;
    GD_ASSERT(sim.tech_state("ecology") == UnlockState::Locked);
    GD_ASSERT(sim.research_technology("ecology").status == ActionStatus::PrerequisiteUnmet);

    GD_ASSERT(sim.research_technology("basic_agriculture").ok());
    GD_ASSERT(sim.research_technology("ecology").ok());
    GD_ASSERT(approx(sim.state().happiness, 52.0));
    // Environmentalists approve of ecology research.
    GD_ASSERT(approx(sim.state().characters.at("forest_elder").score, 70.0));
    GD_ASSERT(approx(sim.state().characters.at("mine_master").score, 30.0));
  }

  // Resource costs are debited; a failed attempt debits nothing.
  {
    Simulation sim(default_content_db(), quiet_config());
    sim.state().research = 40.0;
    GD_ASSERT(sim.research_technology("basic_agriculture").ok());

    GD_ASSERT(sim.research_technology("advanced_mining").status == ActionStatus::Unaffordable);
    stock(sim, Resource::Instrument) = 5.0;
    GD_ASSERT(sim.research_technology("advanced_mining").ok());
    GD_ASSERT(approx(stock(sim, Resource::Instrument), 0.0));
    GD_ASSERT(approx(sim.state().mining_efficiency, 1.6));
    GD_ASSERT(approx(sim.state().research, 40.0));
  }

  // Secrets.
  {
    Simulation sim(default_content_db(), quiet_config());
    GD_ASSERT(sim.secret_state("seed_of_prosperity") == UnlockState::Locked);
    GD_ASSERT(sim.discover_secret("seed_of_prosperity").status == ActionStatus::Unaffordable);
    GD_ASSERT(approx(stock(sim, Resource::Food), 12.0));

    stock(sim, Resource::Food) = 60.0;
    sim.state().research = 10.0;
    GD_ASSERT(sim.secret_state("seed_of_prosperity") == UnlockState::Available);
    GD_ASSERT(sim.discover_secret("seed_of_prosperity").ok());
    GD_ASSERT(approx(stock(sim, Resource::Food), 10.0));
    GD_ASSERT(approx(sim.state().research, 10.0));
    GD_ASSERT(approx(sim.state().food_production, 2.0));
    GD_ASSERT(sim.discover_secret("seed_of_prosperity").status == ActionStatus::AlreadyUnlocked);
    GD_ASSERT(sim.discover_secret("no_such_secret").status == ActionStatus::InvalidReference);

    // A lower floor does not undo a higher one.
    sim.state().research = 20.0;
    GD_ASSERT(sim.research_technology("basic_agriculture").ok());
    GD_ASSERT(approx(sim.state().food_production, 2.0));

    stock(sim, Resource::Rock) = 30.0;
    stock(sim, Resource::Water) = 20.0;
    GD_ASSERT(sim.discover_secret("memory_crystal").ok());
    GD_ASSERT(approx(sim.state().market.trend, 0.98));
    GD_ASSERT(sim.state().discovered_secrets.size() == 2);
  }

  // Floors are idempotent, scales compound.
  {
    const ContentDB content = default_content_db();
    GameState s;
    apply_effect(s, content, FoodProductionFloor{1.5});
    apply_effect(s, content, FoodProductionFloor{1.5});
    GD_ASSERT(approx(s.food_production, 1.5));

    apply_effect(s, content, CraftSpeedScale{1.5});
    apply_effect(s, content, CraftSpeedScale{1.5});
    GD_ASSERT(approx(s.craft_speed, 2.25));

    s.happiness = 99.0;
    apply_effect(s, content, HappinessBonus{2.0});
    GD_ASSERT(approx(s.happiness, 100.0));

    GD_ASSERT(describe_effect(MiningEfficiencyFloor{1.6}).find("mining efficiency") != std::string::npos);
  }

  // Conditions and achievement rewards.
  {
    GameState s;
    s.buildings[building_index(BuildingType::Quarry)] = 2;
    s.buildings[building_index(BuildingType::Farm)] = 1;
    GD_ASSERT(condition_met(s, BuildingsAtLeast{3}));
    GD_ASSERT(!condition_met(s, BuildingsAtLeast{4}));

    s.resources[resource_index(Resource::Iron)] = 30.0;
    GD_ASSERT(condition_met(s, ResourceAtLeast{Resource::Iron, 30.0}));
    GD_ASSERT(!condition_met(s, SecretsAtLeast{1}));
    GD_ASSERT(describe_condition(ResearchAtLeast{40.0}) == "research >= 40.0");

    s.resources[resource_index(Resource::BuilderMaterials)] = 120.0;
    apply_achievement_reward(s, ResourceGrant{Resource::BuilderMaterials, 10.0}, 125.0);
    GD_ASSERT(approx(s.resources[resource_index(Resource::BuilderMaterials)], 125.0));

    s.ecosystem.biomes = {90.0, 10.0, 50.0, 0.0};
    apply_achievement_reward(s, BiomeRestoration{20.0}, 125.0);
    GD_ASSERT(approx(s.ecosystem.biomes[0], 100.0));
    GD_ASSERT(approx(s.ecosystem.biomes[1], 30.0));
    GD_ASSERT(approx(s.ecosystem.biomes[3], 20.0));

    apply_achievement_reward(s, ResearchBonusFloor{1.5}, 125.0);
    apply_achievement_reward(s, ResearchBonusFloor{1.2}, 125.0);
    GD_ASSERT(approx(s.research_bonus, 1.5));
  }

  return 0;
}
