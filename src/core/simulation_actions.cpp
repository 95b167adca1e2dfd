#include "gradostroi/core/simulation.h"

#include <cstddef>
#include <string>

#include "gradostroi/core/enum_strings.h"
#include "gradostroi/core/production.h"
#include "gradostroi/core/progression.h"
#include "gradostroi/util/log.h"
#include "gradostroi/util/strings.h"

namespace gradostroi {

namespace {

std::string describe_bundle(const ResourceBundle& bundle, double scale = 1.0) {
  std::string out;
  for (const auto& e : bundle) {
    if (!out.empty()) out += ", ";
    out += format_fixed(e.amount * scale) + " " + resource_to_string(e.resource);
  }
  return out.empty() ? std::string("nothing") : out;
}

const MiningActionDef* find_mining_action(const ContentDB& content, const std::string& id) {
  for (const auto& a : content.mining_actions) {
    if (a.id == id) return &a;
  }
  return nullptr;
}

} // namespace

// --- Production ---

ActionResult Simulation::mine(const std::string& action_id) {
  const MiningActionDef* def = find_mining_action(content_, action_id);
  if (!def) return ActionResult::failure(ActionStatus::InvalidReference, "unknown mining action '" + action_id + "'");

  note_player_action();

  const double eco = production_modifier();
  const double scale =
      static_cast<double>(multiplier()) * hostility() * happiness_modifier() * eco * state_.mining_efficiency;

  if (def->reaction) broadcast_reaction(state_, content_, *def->reaction);

  {
    ResourceLedger ledger(state_.resources, storage_capacity());
    ledger.credit(def->output, scale);
  }
  collect_building_output();

  log::debug(def->name + ": +" + describe_bundle(def->output, scale));
  return ActionResult::success(def->name + ": +" + describe_bundle(def->output, scale));
}

void Simulation::collect_building_output() {
  const double eco = production_modifier();
  ResourceLedger ledger(state_.resources, storage_capacity());
  for (BuildingType t : all_building_types()) {
    const std::size_t i = building_index(t);
    const int count = state_.buildings[i];
    if (count <= 0) continue;

    const double per_shift = static_cast<double>(count) * eco * worker_bonus(state_.workers[i]);
    for (const auto& out : content_.buildings[i].output) {
      double amount = out.amount * per_shift;
      if (out.resource == Resource::Food) amount *= state_.food_production;
      ledger.adjust(out.resource, amount);
    }
  }
}

ActionResult Simulation::build(BuildingType type) {
  const std::size_t i = building_index(type);
  const BuildingDef& def = content_.buildings[i];
  const double scale = building_cost_scale(state_.buildings[i]);

  ResourceLedger ledger(state_.resources, storage_capacity());
  if (!ledger.affordable(def.base_cost, scale)) {
    return ActionResult::failure(ActionStatus::Unaffordable,
                                 def.name + " needs " + describe_bundle(def.base_cost, scale));
  }

  note_player_action();
  ledger.debit(def.base_cost, scale);
  state_.buildings[i] += 1;
  if (def.on_build) broadcast_reaction(state_, content_, *def.on_build);

  push_event(EventLevel::Info, EventCategory::Construction,
             "Built " + def.name + " (" + std::to_string(state_.buildings[i]) + " standing)");
  return ActionResult::success("Built " + def.name + " for " + describe_bundle(def.base_cost, scale));
}

ActionResult Simulation::build_storage() {
  ResourceLedger ledger(state_.resources, storage_capacity());
  if (!ledger.affordable(content_.storage_cost)) {
    return ActionResult::failure(ActionStatus::Unaffordable,
                                 "storage needs " + describe_bundle(content_.storage_cost));
  }

  note_player_action();
  ledger.debit(content_.storage_cost);
  state_.storage_units += 1;

  push_event(EventLevel::Info, EventCategory::Construction,
             "Built storage (capacity " + format_fixed(storage_capacity(), 0) + ")");
  return ActionResult::success("Storage capacity is now " + format_fixed(storage_capacity(), 0));
}

ActionResult Simulation::assign_workers(BuildingType type, int workers) {
  const std::size_t i = building_index(type);
  const std::string& name = content_.buildings[i].name;
  if (workers < 0) return ActionResult::failure(ActionStatus::InvalidQuantity, "worker count must be >= 0");
  if (state_.buildings[i] <= 0) {
    return ActionResult::failure(ActionStatus::PrerequisiteUnmet, "no " + name + " has been built");
  }

  const int delta = workers - state_.workers[i];
  if (delta > state_.idle_workers) {
    return ActionResult::failure(ActionStatus::InvalidQuantity,
                                 "only " + std::to_string(state_.idle_workers) + " idle workers");
  }

  note_player_action();
  state_.workers[i] = workers;
  state_.idle_workers -= delta;
  return ActionResult::success(std::to_string(workers) + " workers at " + name + ", " +
                               std::to_string(state_.idle_workers) + " idle");
}

ActionResult Simulation::craft(const std::string& recipe_id) {
  const RecipeDef* def = find_ptr(content_.recipes, recipe_id);
  if (!def) return ActionResult::failure(ActionStatus::InvalidReference, "unknown recipe '" + recipe_id + "'");

  if (!def->required_unlock.empty() && !is_unlocked(state_, def->required_unlock)) {
    return ActionResult::failure(ActionStatus::PrerequisiteUnmet,
                                 def->name + " requires " + def->required_unlock);
  }

  const double scale = static_cast<double>(multiplier()) * hostility() * state_.craft_speed;
  const double research_needed = def->research_input * scale;

  ResourceLedger ledger(state_.resources, storage_capacity());
  if (!ledger.affordable(def->inputs, scale) || state_.research < research_needed) {
    std::string need = describe_bundle(def->inputs, scale);
    if (research_needed > 0.0) need += ", " + format_fixed(research_needed) + " research";
    return ActionResult::failure(ActionStatus::Unaffordable, def->name + " needs " + need);
  }

  note_player_action();
  ledger.debit(def->inputs, scale);
  state_.research -= research_needed;
  ledger.credit(def->outputs, scale);

  push_event(EventLevel::Info, EventCategory::Production,
             "Crafted " + def->name + ": +" + describe_bundle(def->outputs, scale));
  return ActionResult::success("Crafted " + describe_bundle(def->outputs, scale));
}

ActionResult Simulation::research_resource(Resource r) {
  double& stock = state_.resources[resource_index(r)];
  if (stock <= 0.0) {
    return ActionResult::failure(ActionStatus::Unaffordable, "no " + resource_to_string(r) + " to study");
  }

  note_player_action();
  const double gained = stock * cfg_.research_per_unit * state_.research_bonus;
  state_.research += gained;
  stock = 0.0;

  if (!state_.research_complete && state_.research >= cfg_.research_goal) {
    state_.research_complete = true;
    push_event(EventLevel::Info, EventCategory::Research, "Research goal reached");
  }
  return ActionResult::success("+" + format_fixed(gained) + " research (" + format_fixed(state_.research) + ")");
}

// --- Market ---

double Simulation::current_price(Resource r) {
  ResourceLedger ledger(state_.resources, storage_capacity());
  MarketModel model(state_.market, ledger, content_.base_prices, market_event_modifier(state_.calendar, state_.day),
                    state_.rng, cfg_.market);
  return model.current_price(r);
}

ActionResult Simulation::trade(Resource r, double amount, bool buying) {
  ResourceLedger ledger(state_.resources, storage_capacity());
  MarketModel model(state_.market, ledger, content_.base_prices, market_event_modifier(state_.calendar, state_.day),
                    state_.rng, cfg_.market);
  ActionResult res = model.trade(r, amount, buying);
  if (!res.ok()) return res;

  note_player_action();
  push_event(EventLevel::Info, EventCategory::Market, res.message);
  return res;
}

} // namespace gradostroi
