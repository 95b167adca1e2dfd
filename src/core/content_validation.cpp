#include "gradostroi/core/content_validation.h"

#include <cmath>
#include <cstddef>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "gradostroi/core/enum_strings.h"
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

bool is_non_negative(double v) { return v >= 0.0 && std::isfinite(v); }

void check_bundle(std::vector<std::string>& errors, const ResourceBundle& b, const std::string& where,
                  bool allow_negative = false) {
  for (const auto& ra : b) {
    if (!std::isfinite(ra.amount) || (!allow_negative && ra.amount < 0.0)) {
      push(errors, join(where, ": invalid amount ", ra.amount, " for ", resource_to_string(ra.resource)));
    }
  }
}

template <typename Map>
void check_key_ids(std::vector<std::string>& errors, const Map& m, const std::string& kind) {
  for (const auto& key : util::sorted_keys(m)) {
    const auto& def = m.at(key);
    if (key.empty()) push(errors, join(kind, " map contains an empty key"));
    if (def.id != key) push(errors, join(kind, " key/id mismatch: key '", key, "' != id '", def.id, "'"));
  }
}

// 0 = unvisited, 1 = on stack, 2 = done.
bool has_cycle_from(const ContentDB& db, const std::string& id, std::unordered_map<std::string, int>& mark) {
  auto& m = mark[id];
  if (m == 1) return true;
  if (m == 2) return false;
  m = 1;
  if (const auto* t = find_ptr(db.techs, id)) {
    for (const auto& p : t->prereqs) {
      if (db.techs.count(p) && has_cycle_from(db, p, mark)) return true;
    }
  }
  mark[id] = 2;
  return false;
}

} // namespace

std::vector<std::string> validate_content_db(const ContentDB& db) {
  std::vector<std::string> errors;

  // --- Buildings ---
  for (BuildingType t : all_building_types()) {
    const BuildingDef& b = db.buildings[building_index(t)];
    const std::string tid = building_type_to_string(t);
    const std::string where = join("Building '", tid, "'");
    if (b.type != t || b.id != tid) push(errors, join(where, " has mismatched id '", b.id, "'"));
    if (b.base_cost.empty()) push(errors, join(where, " has no construction cost"));
    if (b.output.empty()) push(errors, join(where, " produces nothing"));
    check_bundle(errors, b.base_cost, where);
    check_bundle(errors, b.output, where);
    for (const auto& imp : b.impacts) {
      if (!std::isfinite(imp.per_unit) || imp.per_unit > 0.0) {
        push(errors, join(where, " has a non-damaging impact on ", biome_to_string(imp.biome)));
      }
    }
  }
  check_bundle(errors, db.storage_cost, "Storage");

  // --- Mining actions ---
  std::unordered_set<std::string> seen_actions;
  for (const auto& a : db.mining_actions) {
    const std::string where = join("Mining action '", a.id, "'");
    if (a.id.empty()) push(errors, "Mining action with an empty id");
    if (!seen_actions.insert(a.id).second) push(errors, join(where, " is defined twice"));
    if (a.output.empty()) push(errors, join(where, " produces nothing"));
    check_bundle(errors, a.output, where);
  }
  if (db.mining_actions.empty()) push(errors, "No mining actions defined");

  // --- Recipes ---
  check_key_ids(errors, db.recipes, "Recipe");
  for (const auto& id : util::sorted_keys(db.recipes)) {
    const RecipeDef& r = db.recipes.at(id);
    const std::string where = join("Recipe '", id, "'");
    if (r.outputs.empty()) push(errors, join(where, " has no outputs"));
    check_bundle(errors, r.inputs, where);
    check_bundle(errors, r.outputs, where);
    if (!is_non_negative(r.research_input)) push(errors, join(where, " has an invalid research input"));
    if (!r.required_unlock.empty() && !db.techs.count(r.required_unlock) && !db.secrets.count(r.required_unlock)) {
      push(errors, join(where, " requires unknown tech/secret '", r.required_unlock, "'"));
    }
  }

  // --- Technologies ---
  check_key_ids(errors, db.techs, "Tech");
  for (const auto& id : util::sorted_keys(db.techs)) {
    const TechDef& t = db.techs.at(id);
    const std::string where = join("Tech '", id, "'");
    for (const auto& p : t.prereqs) {
      if (p == id) {
        push(errors, join(where, " lists itself as a prerequisite"));
      } else if (!db.techs.count(p)) {
        push(errors, join(where, " has unknown prerequisite '", p, "'"));
      }
    }
    check_bundle(errors, t.cost.resources, where);
    if (!is_non_negative(t.cost.research)) push(errors, join(where, " has an invalid research threshold"));
    if (t.effects.empty()) push(errors, join(where, " has no effects"));
  }
  {
    std::unordered_map<std::string, int> mark;
    for (const auto& id : util::sorted_keys(db.techs)) {
      if (mark[id] == 0 && has_cycle_from(db, id, mark)) {
        push(errors, join("Tech prerequisite cycle through '", id, "'"));
        break;
      }
    }
  }

  // --- Secrets ---
  check_key_ids(errors, db.secrets, "Secret");
  for (const auto& id : util::sorted_keys(db.secrets)) {
    const SecretDef& s = db.secrets.at(id);
    check_bundle(errors, s.cost.resources, join("Secret '", id, "'"));
    if (!is_non_negative(s.cost.research)) push(errors, join("Secret '", id, "' has an invalid research threshold"));
    if (db.techs.count(id)) push(errors, join("Secret '", id, "' shares its id with a tech"));
  }

  // --- Characters ---
  check_key_ids(errors, db.characters, "Character");
  for (const auto& id : util::sorted_keys(db.characters)) {
    const CharacterDef& c = db.characters.at(id);
    const std::string where = join("Character '", id, "'");
    if (!(c.initial_score >= -100.0 && c.initial_score <= 100.0)) {
      push(errors, join(where, " has initial score ", c.initial_score, " outside [-100,100]"));
    }
    for (const auto& q : c.quests) {
      if (!db.quests.count(q)) push(errors, join(where, " offers unknown quest '", q, "'"));
    }
    for (const auto& o : c.offers) {
      if (o.resource == kCurrencyResource) push(errors, join(where, " offers the currency itself"));
      if (!(o.price_modifier > 0.0) || !std::isfinite(o.price_modifier)) {
        push(errors, join(where, " has an invalid price modifier for ", resource_to_string(o.resource)));
      }
    }
  }

  // --- Quests ---
  check_key_ids(errors, db.quests, "Quest");
  for (const auto& id : util::sorted_keys(db.quests)) {
    const QuestDef& q = db.quests.at(id);
    if (!std::isfinite(q.relationship_reward)) push(errors, join("Quest '", id, "' has an invalid reward"));
    check_bundle(errors, q.resource_reward, join("Quest '", id, "'"));
  }

  // --- Achievements ---
  check_key_ids(errors, db.achievements, "Achievement");

  // --- Random events ---
  std::unordered_set<std::string> seen_events;
  for (const auto& e : db.random_events) {
    if (e.id.empty()) push(errors, "Random event with an empty id");
    if (!seen_events.insert(e.id).second) push(errors, join("Random event '", e.id, "' is defined twice"));
    check_bundle(errors, e.deltas, join("Random event '", e.id, "'"), /*allow_negative=*/true);
  }

  // --- Prices ---
  for (Resource r : all_resources()) {
    const double p = db.base_prices[resource_index(r)];
    if (!(p > 0.0) || !std::isfinite(p)) push(errors, join("Base price for ", resource_to_string(r), " must be > 0"));
  }

  // --- Start ---
  check_bundle(errors, db.start.resources, "Start");
  if (db.start.storage_units < 0) push(errors, "Start: negative storage units");
  for (std::size_t i = 0; i < kBiomeCount; ++i) {
    const double h = db.start.biomes[i];
    if (!(h >= 0.0 && h <= 100.0)) {
      push(errors, join("Start: biome ", biome_to_string(static_cast<Biome>(i)), " health ", h, " outside [0,100]"));
    }
  }

  return errors;
}

} // namespace gradostroi
