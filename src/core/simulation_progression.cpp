#include "gradostroi/core/simulation.h"

#include <algorithm>
#include <string>
#include <vector>

#include "gradostroi/core/enum_strings.h"
#include "gradostroi/core/progression.h"
#include "gradostroi/core/relationships.h"
#include "gradostroi/util/strings.h"

namespace gradostroi {

namespace {

std::string join_descriptions(const std::vector<std::string>& parts) {
  std::string out;
  for (const auto& p : parts) {
    if (!out.empty()) out += "; ";
    out += p;
  }
  return out;
}

ActionResult cost_failure(const std::string& what, const Cost& cost) {
  std::string need;
  for (const auto& e : cost.resources) {
    if (!need.empty()) need += ", ";
    need += format_fixed(e.amount) + " " + resource_to_string(e.resource);
  }
  if (cost.research > 0.0) {
    if (!need.empty()) need += ", ";
    need += "research " + format_fixed(cost.research);
  }
  return ActionResult::failure(ActionStatus::Unaffordable, what + " needs " + need);
}

} // namespace

// --- Technologies and secrets ---

ActionResult Simulation::research_technology(const std::string& tech_id) {
  const TechDef* def = find_ptr(content_.techs, tech_id);
  if (!def) return ActionResult::failure(ActionStatus::InvalidReference, "unknown technology '" + tech_id + "'");
  if (has_researched(state_, tech_id)) {
    return ActionResult::failure(ActionStatus::AlreadyUnlocked, def->name + " is already researched");
  }
  for (const auto& p : def->prereqs) {
    if (!has_researched(state_, p)) {
      return ActionResult::failure(ActionStatus::PrerequisiteUnmet, def->name + " requires " + p);
    }
  }
  if (!cost_affordable(state_, def->cost)) return cost_failure(def->name, def->cost);

  note_player_action();
  {
    ResourceLedger ledger(state_.resources, storage_capacity());
    ledger.debit(def->cost.resources);
  }
  state_.researched_techs.push_back(tech_id);

  std::vector<std::string> applied;
  for (const auto& e : def->effects) applied.push_back(apply_effect(state_, content_, e));

  const std::string msg = "Researched " + def->name + " (" + join_descriptions(applied) + ")";
  push_event(EventLevel::Info, EventCategory::Research, msg);
  return ActionResult::success(msg);
}

ActionResult Simulation::discover_secret(const std::string& secret_id) {
  const SecretDef* def = find_ptr(content_.secrets, secret_id);
  if (!def) return ActionResult::failure(ActionStatus::InvalidReference, "unknown secret '" + secret_id + "'");
  if (has_discovered(state_, secret_id)) {
    return ActionResult::failure(ActionStatus::AlreadyUnlocked, def->name + " is already discovered");
  }
  if (!cost_affordable(state_, def->cost)) return cost_failure(def->name, def->cost);

  note_player_action();
  {
    ResourceLedger ledger(state_.resources, storage_capacity());
    ledger.debit(def->cost.resources);
  }
  state_.discovered_secrets.push_back(secret_id);

  const std::string msg = "Discovered " + def->name + " (" + apply_effect(state_, content_, def->effect) + ")";
  push_event(EventLevel::Info, EventCategory::Lore, msg);
  return ActionResult::success(msg);
}

// --- Characters ---

ActionResult Simulation::talk(const std::string& character_id) {
  const CharacterDef* def = find_ptr(content_.characters, character_id);
  CharacterState* st = find_ptr(state_.characters, character_id);
  if (!def || !st) {
    return ActionResult::failure(ActionStatus::InvalidReference, "unknown character '" + character_id + "'");
  }

  note_player_action();
  const std::string line = dialogue_line(st->score);
  if (st->score < kTalkCeiling) adjust_relationship(*st, kTalkGain);
  return ActionResult::success(def->name + ": \"" + line + "\"");
}

ActionResult Simulation::trade_with_character(const std::string& character_id, Resource r, double amount) {
  const CharacterDef* def = find_ptr(content_.characters, character_id);
  CharacterState* st = find_ptr(state_.characters, character_id);
  if (!def || !st) {
    return ActionResult::failure(ActionStatus::InvalidReference, "unknown character '" + character_id + "'");
  }
  if (st->score < kTradeMinScore) {
    return ActionResult::failure(ActionStatus::PrerequisiteUnmet, def->name + " does not trust you enough to trade");
  }

  const auto offer = std::find_if(def->offers.begin(), def->offers.end(),
                                  [&](const TradeOffer& o) { return o.resource == r; });
  if (offer == def->offers.end()) {
    return ActionResult::failure(ActionStatus::InvalidReference,
                                 def->name + " does not offer " + resource_to_string(r));
  }
  if (!(amount > 0.0)) return ActionResult::failure(ActionStatus::InvalidQuantity, "trade amount must be positive");

  double price = current_price(r) * offer->price_modifier;
  if (st->score >= kLoyalMinScore) price *= kLoyalDiscount;

  ResourceLedger ledger(state_.resources, storage_capacity());
  MarketModel model(state_.market, ledger, content_.base_prices, market_event_modifier(state_.calendar, state_.day),
                    state_.rng, cfg_.market);
  ActionResult res = model.buy_at(r, amount, price);
  if (!res.ok()) return res;

  note_player_action();
  adjust_relationship(*st, kTradeRelationshipGain);
  res.message = def->name + ": " + res.message;
  push_event(EventLevel::Info, EventCategory::Characters, res.message);
  return res;
}

ActionResult Simulation::complete_quest(const std::string& character_id, const std::string& quest_id) {
  const CharacterDef* def = find_ptr(content_.characters, character_id);
  CharacterState* st = find_ptr(state_.characters, character_id);
  if (!def || !st) {
    return ActionResult::failure(ActionStatus::InvalidReference, "unknown character '" + character_id + "'");
  }

  const auto open = std::find(st->open_quests.begin(), st->open_quests.end(), quest_id);
  const QuestDef* quest = find_ptr(content_.quests, quest_id);
  if (open == st->open_quests.end() || !quest) {
    return ActionResult::failure(ActionStatus::InvalidReference,
                                 def->name + " has no open quest '" + quest_id + "'");
  }
  if (st->score < kQuestMinScore) {
    return ActionResult::failure(ActionStatus::PrerequisiteUnmet, def->name + " refuses to deal with you");
  }
  if (!condition_met(state_, quest->condition)) {
    return ActionResult::failure(ActionStatus::PrerequisiteUnmet,
                                 quest->title + " needs " + describe_condition(quest->condition));
  }

  note_player_action();
  st->open_quests.erase(open);
  adjust_relationship(*st, quest->relationship_reward);
  st->memory.push_back("completed_quest:" + quest_id);
  {
    ResourceLedger ledger(state_.resources, storage_capacity());
    ledger.credit(quest->resource_reward);
  }

  const std::string msg = def->name + ": quest \"" + quest->title + "\" completed";
  push_event(EventLevel::Info, EventCategory::Characters, msg);
  return ActionResult::success(msg);
}

} // namespace gradostroi
