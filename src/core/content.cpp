#include "gradostroi/core/content.h"

#include <climits>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>

#include "gradostroi/core/enum_strings.h"
#include "gradostroi/core/relationships.h"
#include "gradostroi/util/file_io.h"
#include "gradostroi/util/sorted_keys.h"

namespace gradostroi {
namespace {

// --- built-in tables ---

BuildingDef make_building(BuildingType type, std::string name, ResourceBundle cost, ResourceBundle output,
                          std::vector<BiomeImpact> impacts, std::optional<CharacterReaction> on_build = std::nullopt) {
  BuildingDef b;
  b.type = type;
  b.id = building_type_to_string(type);
  b.name = std::move(name);
  b.base_cost = std::move(cost);
  b.output = std::move(output);
  b.impacts = std::move(impacts);
  b.on_build = std::move(on_build);
  return b;
}

void add_recipe(ContentDB& db, std::string id, std::string name, ResourceBundle inputs, ResourceBundle outputs,
                double research_input = 0.0, std::string required_unlock = {}) {
  RecipeDef r;
  r.id = id;
  r.name = std::move(name);
  r.inputs = std::move(inputs);
  r.research_input = research_input;
  r.outputs = std::move(outputs);
  r.required_unlock = std::move(required_unlock);
  db.recipes[id] = std::move(r);
}

void add_tech(ContentDB& db, std::string id, std::string name, std::string desc, std::vector<std::string> prereqs,
              Cost cost, std::vector<Effect> effects) {
  TechDef t;
  t.id = id;
  t.name = std::move(name);
  t.description = std::move(desc);
  t.prereqs = std::move(prereqs);
  t.cost = std::move(cost);
  t.effects = std::move(effects);
  db.techs[id] = std::move(t);
}

void add_secret(ContentDB& db, std::string id, std::string name, std::string desc, Cost cost, Effect effect) {
  SecretDef s;
  s.id = id;
  s.name = std::move(name);
  s.description = std::move(desc);
  s.cost = std::move(cost);
  s.effect = std::move(effect);
  db.secrets[id] = std::move(s);
}

void add_quest(ContentDB& db, std::string id, std::string title, Condition cond, double relationship,
               ResourceBundle reward) {
  QuestDef q;
  q.id = id;
  q.title = std::move(title);
  q.condition = std::move(cond);
  q.relationship_reward = relationship;
  q.resource_reward = std::move(reward);
  db.quests[id] = std::move(q);
}

void add_achievement(ContentDB& db, std::string id, std::string name, Condition cond, AchievementReward reward) {
  AchievementDef a;
  a.id = id;
  a.name = std::move(name);
  a.condition = std::move(cond);
  a.reward = std::move(reward);
  db.achievements[id] = std::move(a);
}

void set_price(PriceTable& t, Resource r, double p) { t[resource_index(r)] = p; }

// --- JSON parsing ---

const json::Object& as_object(const json::Value& v, const std::string& where) {
  if (!v.is_object()) throw std::runtime_error("Content: expected an object for " + where);
  return v.object();
}

const json::Array& as_array(const json::Value& v, const std::string& where) {
  if (!v.is_array()) throw std::runtime_error("Content: expected an array for " + where);
  return v.array();
}

std::string str_or(const json::Object& o, const std::string& key, const std::string& def) {
  const auto* v = json::find(o, key);
  return v ? v->string_value(def) : def;
}

double num_or(const json::Object& o, const std::string& key, double def) {
  const auto* v = json::find(o, key);
  return v ? v->number_value(def) : def;
}

int int_value_checked(const json::Value& v, const std::string& where) {
  const double r = std::round(v.number_value(0.0));
  if (!std::isfinite(r) || r < static_cast<double>(INT_MIN) || r > static_cast<double>(INT_MAX)) {
    throw std::runtime_error("Content: whole number out of range in " + where);
  }
  return static_cast<int>(r);
}

int int_or(const json::Object& o, const std::string& key, int def, const std::string& where) {
  const auto* v = json::find(o, key);
  return v ? int_value_checked(*v, where + "." + key) : def;
}

Resource parse_resource(const std::string& s, const std::string& where) {
  if (auto r = resource_from_string(s)) return *r;
  throw std::runtime_error("Content: unknown resource '" + s + "' in " + where);
}

Biome parse_biome(const std::string& s, const std::string& where) {
  if (auto b = biome_from_string(s)) return *b;
  throw std::runtime_error("Content: unknown biome '" + s + "' in " + where);
}

Trait parse_trait(const std::string& s, const std::string& where) {
  if (auto t = trait_from_string(s)) return *t;
  throw std::runtime_error("Content: unknown trait '" + s + "' in " + where);
}

PlayerAction parse_action(const std::string& s, const std::string& where) {
  if (auto a = player_action_from_string(s)) return *a;
  throw std::runtime_error("Content: unknown player action '" + s + "' in " + where);
}

// {"wood": 15, "rock": 5}. A "research" key is only legal where the caller
// passes `research`.
ResourceBundle parse_bundle(const json::Value& v, const std::string& where, double* research = nullptr) {
  const auto& o = as_object(v, where);
  ResourceBundle out;
  for (const auto& key : util::sorted_keys(o)) {
    const double amount = o.at(key).number_value(0.0);
    if (key == "research") {
      if (!research) throw std::runtime_error("Content: 'research' is not a resource (" + where + ")");
      *research = amount;
      continue;
    }
    out.push_back(ResourceAmount{parse_resource(key, where), amount});
  }
  return out;
}

Cost parse_cost(const json::Value& v, const std::string& where) {
  Cost c;
  c.resources = parse_bundle(v, where, &c.research);
  return c;
}

CharacterReaction parse_reaction(const json::Value& v, const std::string& where) {
  const auto& o = as_object(v, where);
  CharacterReaction r;
  const std::string trait = str_or(o, "trait", "");
  if (!trait.empty()) r.trait = parse_trait(trait, where);
  r.action = parse_action(str_or(o, "action", ""), where);
  return r;
}

std::vector<BiomeImpact> parse_impacts(const json::Value& v, const std::string& where) {
  const auto& o = as_object(v, where);
  std::vector<BiomeImpact> out;
  for (const auto& key : util::sorted_keys(o)) {
    out.push_back(BiomeImpact{parse_biome(key, where), o.at(key).number_value(0.0)});
  }
  return out;
}

Condition parse_condition(const json::Value& v, const std::string& where) {
  const auto& o = as_object(v, where);
  const std::string type = str_or(o, "type", "");
  if (type == "buildings_at_least") {
    return BuildingsAtLeast{int_or(o, "count", 0, where)};
  }
  if (type == "resource_at_least") {
    return ResourceAtLeast{parse_resource(str_or(o, "resource", ""), where), num_or(o, "amount", 0.0)};
  }
  if (type == "biome_at_least") {
    return BiomeAtLeast{parse_biome(str_or(o, "biome", ""), where), num_or(o, "health", 0.0)};
  }
  if (type == "ecosystem_health_at_least") return EcosystemHealthAtLeast{num_or(o, "health", 0.0)};
  if (type == "biodiversity_at_least") return BiodiversityAtLeast{num_or(o, "value", 0.0)};
  if (type == "research_at_least") return ResearchAtLeast{num_or(o, "research", 0.0)};
  if (type == "secrets_at_least") return SecretsAtLeast{int_or(o, "count", 0, where)};
  throw std::runtime_error("Content: unknown condition type '" + type + "' in " + where);
}

Effect parse_effect(const json::Value& v, const std::string& where) {
  const auto& o = as_object(v, where);
  const std::string type = str_or(o, "type", "");
  if (type == "food_production_floor") return FoodProductionFloor{num_or(o, "value", 1.0)};
  if (type == "mining_efficiency_floor") return MiningEfficiencyFloor{num_or(o, "value", 1.0)};
  if (type == "industry_penalty_floor") return IndustryPenaltyFloor{num_or(o, "value", 1.0)};
  if (type == "craft_speed_scale") return CraftSpeedScale{num_or(o, "factor", 1.0)};
  if (type == "market_trend_scale") return MarketTrendScale{num_or(o, "factor", 1.0)};
  if (type == "happiness_bonus") return HappinessBonus{num_or(o, "amount", 0.0)};
  if (type == "character_reaction") return parse_reaction(v, where);
  throw std::runtime_error("Content: unknown effect type '" + type + "' in " + where);
}

AchievementReward parse_reward(const json::Value& v, const std::string& where) {
  const auto& o = as_object(v, where);
  const std::string type = str_or(o, "type", "");
  if (type == "resource_grant") {
    return ResourceGrant{parse_resource(str_or(o, "resource", ""), where), num_or(o, "amount", 0.0)};
  }
  if (type == "craft_speed_floor") return CraftSpeedFloor{num_or(o, "value", 1.0)};
  if (type == "research_bonus_floor") return ResearchBonusFloor{num_or(o, "value", 1.0)};
  if (type == "biome_restoration") return BiomeRestoration{num_or(o, "amount", 0.0)};
  throw std::runtime_error("Content: unknown reward type '" + type + "' in " + where);
}

std::vector<std::string> parse_string_list(const json::Value& v, const std::string& where) {
  std::vector<std::string> out;
  for (const auto& e : as_array(v, where)) out.push_back(e.string_value(""));
  return out;
}

void load_buildings(ContentDB& db, const json::Value& v) {
  const auto& o = as_object(v, "buildings");
  for (const auto& [id, bv] : o) {
    const std::string where = "building '" + id + "'";
    auto type = building_type_from_string(id);
    if (!type) throw std::runtime_error("Content: unknown building type '" + id + "'");
    const auto& bj = as_object(bv, where);

    BuildingDef b;
    b.type = *type;
    b.id = building_type_to_string(*type);
    b.name = str_or(bj, "name", b.id);
    if (const auto* c = json::find(bj, "cost")) b.base_cost = parse_bundle(*c, where);
    if (const auto* out = json::find(bj, "output")) b.output = parse_bundle(*out, where);
    if (const auto* imp = json::find(bj, "impacts")) b.impacts = parse_impacts(*imp, where);
    if (const auto* r = json::find(bj, "on_build")) b.on_build = parse_reaction(*r, where);
    db.buildings[building_index(*type)] = std::move(b);
  }
}

void load_mining_actions(ContentDB& db, const json::Value& v) {
  db.mining_actions.clear();
  for (const auto& av : as_array(v, "mining_actions")) {
    const auto& aj = as_object(av, "mining action");
    MiningActionDef a;
    a.id = str_or(aj, "id", "");
    a.name = str_or(aj, "name", a.id);
    const std::string where = "mining action '" + a.id + "'";
    if (const auto* out = json::find(aj, "output")) a.output = parse_bundle(*out, where);
    if (const auto* r = json::find(aj, "reaction")) a.reaction = parse_reaction(*r, where);
    db.mining_actions.push_back(std::move(a));
  }
}

void load_recipes(ContentDB& db, const json::Value& v) {
  db.recipes.clear();
  for (const auto& [id, rv] : as_object(v, "recipes")) {
    const std::string where = "recipe '" + id + "'";
    const auto& rj = as_object(rv, where);
    RecipeDef r;
    r.id = id;
    r.name = str_or(rj, "name", id);
    if (const auto* in = json::find(rj, "inputs")) r.inputs = parse_bundle(*in, where, &r.research_input);
    if (const auto* out = json::find(rj, "outputs")) r.outputs = parse_bundle(*out, where);
    r.required_unlock = str_or(rj, "requires", "");
    db.recipes[id] = std::move(r);
  }
}

void load_techs(ContentDB& db, const json::Value& v) {
  db.techs.clear();
  for (const auto& [id, tv] : as_object(v, "techs")) {
    const std::string where = "tech '" + id + "'";
    const auto& tj = as_object(tv, where);
    TechDef t;
    t.id = id;
    t.name = str_or(tj, "name", id);
    t.description = str_or(tj, "description", "");
    if (const auto* p = json::find(tj, "prereqs")) t.prereqs = parse_string_list(*p, where);
    if (const auto* c = json::find(tj, "cost")) t.cost = parse_cost(*c, where);
    if (const auto* e = json::find(tj, "effects")) {
      for (const auto& ev : as_array(*e, where)) t.effects.push_back(parse_effect(ev, where));
    }
    db.techs[id] = std::move(t);
  }
}

void load_secrets(ContentDB& db, const json::Value& v) {
  db.secrets.clear();
  for (const auto& [id, sv] : as_object(v, "secrets")) {
    const std::string where = "secret '" + id + "'";
    const auto& sj = as_object(sv, where);
    SecretDef s;
    s.id = id;
    s.name = str_or(sj, "name", id);
    s.description = str_or(sj, "description", "");
    if (const auto* c = json::find(sj, "cost")) s.cost = parse_cost(*c, where);
    const auto* e = json::find(sj, "effect");
    if (!e) throw std::runtime_error("Content: " + where + " has no effect");
    s.effect = parse_effect(*e, where);
    db.secrets[id] = std::move(s);
  }
}

void load_characters(ContentDB& db, const json::Value& v) {
  db.characters.clear();
  for (const auto& [id, cv] : as_object(v, "characters")) {
    const std::string where = "character '" + id + "'";
    const auto& cj = as_object(cv, where);
    CharacterDef c;
    c.id = id;
    c.name = str_or(cj, "name", id);
    c.description = str_or(cj, "description", "");
    if (const auto* sk = json::find(cj, "skills")) {
      const auto& so = as_object(*sk, where);
      for (const auto& skill : util::sorted_keys(so)) {
        c.skills.push_back(SkillLevel{skill, int_value_checked(so.at(skill), where + ".skills")});
      }
    }
    if (const auto* tr = json::find(cj, "traits")) {
      for (const auto& t : parse_string_list(*tr, where)) c.traits.push_back(parse_trait(t, where));
    }
    c.initial_score = num_or(cj, "initial_score", 0.0);
    if (const auto* q = json::find(cj, "quests")) c.quests = parse_string_list(*q, where);
    if (const auto* of = json::find(cj, "offers")) {
      for (const auto& ov : as_array(*of, where)) {
        const auto& oj = as_object(ov, where);
        c.offers.push_back(TradeOffer{parse_resource(str_or(oj, "resource", ""), where), num_or(oj, "modifier", 1.0)});
      }
    }
    db.characters[id] = std::move(c);
  }
}

void load_quests(ContentDB& db, const json::Value& v) {
  db.quests.clear();
  for (const auto& [id, qv] : as_object(v, "quests")) {
    const std::string where = "quest '" + id + "'";
    const auto& qj = as_object(qv, where);
    QuestDef q;
    q.id = id;
    q.title = str_or(qj, "title", id);
    const auto* c = json::find(qj, "condition");
    if (!c) throw std::runtime_error("Content: " + where + " has no condition");
    q.condition = parse_condition(*c, where);
    q.relationship_reward = num_or(qj, "relationship_reward", 0.0);
    if (const auto* r = json::find(qj, "resource_reward")) q.resource_reward = parse_bundle(*r, where);
    db.quests[id] = std::move(q);
  }
}

void load_achievements(ContentDB& db, const json::Value& v) {
  db.achievements.clear();
  for (const auto& [id, av] : as_object(v, "achievements")) {
    const std::string where = "achievement '" + id + "'";
    const auto& aj = as_object(av, where);
    AchievementDef a;
    a.id = id;
    a.name = str_or(aj, "name", id);
    const auto* c = json::find(aj, "condition");
    const auto* r = json::find(aj, "reward");
    if (!c || !r) throw std::runtime_error("Content: " + where + " needs a condition and a reward");
    a.condition = parse_condition(*c, where);
    a.reward = parse_reward(*r, where);
    db.achievements[id] = std::move(a);
  }
}

void load_random_events(ContentDB& db, const json::Value& v) {
  db.random_events.clear();
  for (const auto& ev : as_array(v, "random_events")) {
    const auto& ej = as_object(ev, "random event");
    RandomEventDef e;
    e.id = str_or(ej, "id", "");
    e.message = str_or(ej, "message", e.id);
    const std::string where = "random event '" + e.id + "'";
    if (const auto* d = json::find(ej, "deltas")) e.deltas = parse_bundle(*d, where);
    if (const auto* bd = json::find(ej, "biome_damage")) {
      const auto& bj = as_object(*bd, where);
      e.biome_damage = BiomeImpact{parse_biome(str_or(bj, "biome", ""), where), num_or(bj, "amount", 0.0)};
    }
    db.random_events.push_back(std::move(e));
  }
}

void load_action_impacts(ContentDB& db, const json::Value& v) {
  for (const auto& [key, iv] : as_object(v, "action_impacts")) {
    const PlayerAction a = parse_action(key, "action_impacts");
    db.action_impacts[static_cast<std::size_t>(a)] = iv.number_value(0.0);
  }
}

void load_start(ContentDB& db, const json::Value& v) {
  const auto& sj = as_object(v, "start");
  if (const auto* r = json::find(sj, "resources")) db.start.resources = parse_bundle(*r, "start");
  if (const auto* b = json::find(sj, "biomes")) {
    for (const auto& [key, bv] : as_object(*b, "start.biomes")) {
      db.start.biomes[biome_index(parse_biome(key, "start.biomes"))] = bv.number_value(0.0);
    }
  }
  db.start.storage_units = int_or(sj, "storage_units", db.start.storage_units, "start");
}

} // namespace

ContentDB default_content_db() {
  ContentDB db;

  const CharacterReaction env_sawmill{Trait::Environmentalist, PlayerAction::BuildSawmill};
  const CharacterReaction scholar_herbalist{Trait::Scholar, PlayerAction::BuildHerbalist};

  db.buildings[building_index(BuildingType::Sawmill)] =
      make_building(BuildingType::Sawmill, "Sawmill", {{Resource::Wood, 15}, {Resource::Rock, 5}},
                    {{Resource::Wood, 2}}, {{Biome::Forest, -0.6}, {Biome::Air, -0.15}}, env_sawmill);
  db.buildings[building_index(BuildingType::Herbalist)] = make_building(
      BuildingType::Herbalist, "Herbalist hut", {{Resource::Wood, 10}, {Resource::Rock, 3}, {Resource::Herbs, 2}},
      {{Resource::Wine, 1}, {Resource::Herbs, 0.5}}, {}, scholar_herbalist);
  db.buildings[building_index(BuildingType::Quarry)] =
      make_building(BuildingType::Quarry, "Quarry", {{Resource::Wood, 8}, {Resource::Rock, 10}},
                    {{Resource::Rock, 2}}, {{Biome::Soil, -0.4}, {Biome::Air, -0.25}});
  db.buildings[building_index(BuildingType::Farm)] = make_building(
      BuildingType::Farm, "Wheat field", {{Resource::Wood, 5}, {Resource::Water, 10}}, {{Resource::Food, 3}}, {});
  db.buildings[building_index(BuildingType::SandPit)] =
      make_building(BuildingType::SandPit, "Sand pit", {{Resource::Wood, 12}, {Resource::Rock, 8}},
                    {{Resource::Sand, 2}}, {{Biome::Soil, -0.55}, {Biome::Rivers, -0.35}});
  db.buildings[building_index(BuildingType::ClayPit)] =
      make_building(BuildingType::ClayPit, "Clay pit", {{Resource::Wood, 10}, {Resource::Rock, 6}},
                    {{Resource::Clay, 2}}, {{Biome::Soil, -0.35}});

  db.storage_cost = {{Resource::Wood, 20}, {Resource::Rock, 15}};

  db.mining_actions = {
      {"fell_timber", "Fell timber", {{Resource::Wood, 5}, {Resource::Wine, 1}},
       CharacterReaction{Trait::Environmentalist, PlayerAction::Deforestation}},
      {"tend_vineyard", "Tend the vineyard", {{Resource::Wood, 1}, {Resource::Wine, 3}}, std::nullopt},
      {"quarry_stone", "Quarry stone", {{Resource::Rock, 3}}, std::nullopt},
      {"forage", "Forage and draw water", {{Resource::Food, 3}, {Resource::Water, 3}}, std::nullopt},
      {"dig_sand", "Dig sand", {{Resource::Sand, 3}}, std::nullopt},
      {"dig_clay", "Dig clay", {{Resource::Clay, 3}}, std::nullopt},
  };

  add_recipe(db, "coal", "Coal", {{Resource::Wood, 1}}, {{Resource::Coal, 1}});
  add_recipe(db, "steel", "Steel", {{Resource::Coal, 1}, {Resource::Iron, 1}}, {{Resource::Steel, 1.5}});
  add_recipe(db, "bronze", "Bronze", {{Resource::Copper, 7}, {Resource::Tin, 3}, {Resource::Food, 1}},
             {{Resource::Bronze, 10}});
  add_recipe(db, "acid", "Sulfuric acid", {{Resource::Sulfur, 1}, {Resource::Water, 1}},
             {{Resource::SulfuricAcid, 0.5}});
  add_recipe(db, "chlorine", "Chlorine", {{Resource::Salt, 1}}, {{Resource::Chlorine, 1}});
  add_recipe(db, "instr", "Instruments", {{Resource::Bronze, 1}, {Resource::Wood, 1}}, {{Resource::Instrument, 1}});
  add_recipe(db, "ancient_tool", "Ancient tool", {{Resource::Instrument, 2}, {Resource::Steel, 1}},
             {{Resource::AncientTool, 1}}, 20.0, "forge_of_souls");

  add_tech(db, "basic_agriculture", "Basic agriculture", "Better ways to grow food", {}, Cost{{}, 20.0},
           {FoodProductionFloor{1.5}});
  add_tech(db, "advanced_mining", "Advanced mining", "Efficient extraction methods", {"basic_agriculture"},
           Cost{{{Resource::Instrument, 5}}, 40.0}, {MiningEfficiencyFloor{1.6}});
  add_tech(db, "ecology", "Ecology", "Understanding the balance of nature", {"basic_agriculture"}, Cost{{}, 60.0},
           {HappinessBonus{2.0}, CharacterReaction{Trait::Environmentalist, PlayerAction::ResearchEcology}});
  add_tech(db, "industrial_revolution", "Industrial revolution", "Mass production and automation",
           {"advanced_mining"}, Cost{{{Resource::Steel, 20}, {Resource::Coal, 30}}, 100.0},
           {CraftSpeedScale{1.5}, IndustryPenaltyFloor{1.2}});

  add_secret(db, "seed_of_prosperity", "Seed of prosperity", "Ancient technique for richer harvests",
             Cost{{{Resource::Food, 50}}, 10.0}, FoodProductionFloor{2.0});
  add_secret(db, "memory_crystal", "Memory crystal", "Lets you see the past of the land",
             Cost{{{Resource::Rock, 30}, {Resource::Water, 20}}, 0.0}, MarketTrendScale{0.98});
  add_secret(db, "forge_of_souls", "Forge of souls", "Legendary art of artifact making",
             Cost{{{Resource::Steel, 10}, {Resource::Coal, 20}}, 30.0}, CraftSpeedScale{1.1});

  CharacterDef elder;
  elder.id = "forest_elder";
  elder.name = "Forest Elder";
  elder.description = "Ancient keeper of the woods, keenly aware of the ecology";
  elder.skills = {{"diplomacy", 7}, {"ecology", 9}, {"wisdom", 8}};
  elder.traits = {Trait::Environmentalist, Trait::Wise, Trait::Patient};
  elder.initial_score = 50.0;
  elder.quests = {"protect_sacred_grove", "restore_biodiversity"};
  elder.offers = {{Resource::Wood, 0.85}, {Resource::Herbs, 1.25}};
  db.characters[elder.id] = elder;

  CharacterDef miner;
  miner.id = "mine_master";
  miner.name = "Master of the Mines";
  miner.description = "Miner and geologist who values technology";
  miner.skills = {{"crafting", 7}, {"mining", 9}, {"strength", 8}};
  miner.traits = {Trait::Pragmatic, Trait::Blacksmith, Trait::Progressive};
  miner.initial_score = 30.0;
  miner.quests = {"find_rare_ores", "improve_tools"};
  miner.offers = {{Resource::Rock, 0.75}, {Resource::Instrument, 1.45}};
  db.characters[miner.id] = miner;

  CharacterDef keeper;
  keeper.id = "lore_keeper";
  keeper.name = "Keeper of Knowledge";
  keeper.description = "Guards the secrets of ancient civilizations";
  keeper.skills = {{"knowledge", 10}, {"medicine", 6}, {"research", 8}};
  keeper.traits = {Trait::Scholar, Trait::Curious, Trait::Traditionalist};
  keeper.initial_score = 40.0;
  keeper.quests = {"explore_ruins", "recover_lost_knowledge"};
  keeper.offers = {{Resource::Food, 1.1}, {Resource::AncientTool, 3.2}};
  db.characters[keeper.id] = keeper;

  add_quest(db, "protect_sacred_grove", "Protect the sacred grove", BiomeAtLeast{Biome::Forest, 80.0}, 25.0,
            {{Resource::AncientTool, 1}});
  add_quest(db, "restore_biodiversity", "Restore biodiversity", BiodiversityAtLeast{70.0}, 20.0,
            {{Resource::Herbs, 10}});
  add_quest(db, "find_rare_ores", "Find rare ores", ResourceAtLeast{Resource::Iron, 30.0}, 20.0,
            {{Resource::Instrument, 2}});
  add_quest(db, "improve_tools", "Improve the tools", ResourceAtLeast{Resource::Instrument, 10.0}, 15.0,
            {{Resource::Steel, 5}});
  add_quest(db, "explore_ruins", "Explore the ancient ruins", ResearchAtLeast{40.0}, 20.0,
            {{Resource::AncientTool, 1}});
  add_quest(db, "recover_lost_knowledge", "Recover lost knowledge", SecretsAtLeast{1}, 25.0,
            {{Resource::BuilderMaterials, 10}});

  add_achievement(db, "first_settlement", "First settlement", BuildingsAtLeast{3},
                  ResourceGrant{Resource::BuilderMaterials, 10.0});
  add_achievement(db, "master_crafter", "Master crafter", ResourceAtLeast{Resource::Instrument, 20.0},
                  CraftSpeedFloor{1.2});
  add_achievement(db, "ecological_balance", "Ecological balance", EcosystemHealthAtLeast{80.0},
                  BiomeRestoration{20.0});
  add_achievement(db, "tech_pioneer", "Technology pioneer", ResearchAtLeast{50.0}, ResearchBonusFloor{1.5});

  db.random_events = {
      {"heavy_rains", "Heavy rains: the harvest improves", {{Resource::Food, 8}}, std::nullopt},
      {"storm", "A storm damaged the buildings", {{Resource::Wood, -5}, {Resource::Rock, -4}}, std::nullopt},
      {"caravan", "A caravan brings a profitable deal", {{Resource::Wine, 14}}, std::nullopt},
      {"forest_fire", "Forest fire", {{Resource::Wood, -10}, {Resource::Food, -4}},
       BiomeImpact{Biome::Forest, -5.0}},
      {"new_deposit", "A new deposit was found", {{Resource::Iron, 6}, {Resource::Coal, 4}}, std::nullopt},
  };

  db.base_prices.fill(1.0);
  set_price(db.base_prices, Resource::Wood, 1.0);
  set_price(db.base_prices, Resource::Wine, 2.0);
  set_price(db.base_prices, Resource::Rock, 1.5);
  set_price(db.base_prices, Resource::Food, 1.0);
  set_price(db.base_prices, Resource::Water, 0.5);
  set_price(db.base_prices, Resource::Coal, 3.0);
  set_price(db.base_prices, Resource::Steel, 8.0);
  set_price(db.base_prices, Resource::Bronze, 6.0);
  set_price(db.base_prices, Resource::Instrument, 12.0);
  set_price(db.base_prices, Resource::Sand, 0.8);
  set_price(db.base_prices, Resource::Clay, 0.9);
  set_price(db.base_prices, Resource::Herbs, 2.5);
  set_price(db.base_prices, Resource::Iron, 3.5);
  set_price(db.base_prices, Resource::Tin, 3.0);
  set_price(db.base_prices, Resource::Copper, 3.0);
  set_price(db.base_prices, Resource::Nickel, 3.5);
  set_price(db.base_prices, Resource::Lead, 2.5);
  set_price(db.base_prices, Resource::Sulfur, 1.4);
  set_price(db.base_prices, Resource::Salt, 0.7);
  set_price(db.base_prices, Resource::SulfuricAcid, 5.0);
  set_price(db.base_prices, Resource::Chlorine, 4.0);
  set_price(db.base_prices, Resource::AncientTool, 40.0);

  db.action_impacts = default_action_impacts();

  db.start.resources = {{Resource::Wood, 10}, {Resource::Wine, 10}, {Resource::Rock, 10}, {Resource::Food, 12}};
  db.start.biomes = {5.0, 0.0, 8.0, 2.0};
  db.start.storage_units = 1;

  return db;
}

ContentDB content_db_from_json(const json::Value& root_value) {
  const auto& root = as_object(root_value, "content root");

  ContentDB db = default_content_db();

  if (const auto* v = json::find(root, "buildings")) load_buildings(db, *v);
  if (const auto* v = json::find(root, "storage_cost")) db.storage_cost = parse_bundle(*v, "storage_cost");
  if (const auto* v = json::find(root, "mining_actions")) load_mining_actions(db, *v);
  if (const auto* v = json::find(root, "recipes")) load_recipes(db, *v);
  if (const auto* v = json::find(root, "techs")) load_techs(db, *v);
  if (const auto* v = json::find(root, "secrets")) load_secrets(db, *v);
  if (const auto* v = json::find(root, "characters")) load_characters(db, *v);
  if (const auto* v = json::find(root, "quests")) load_quests(db, *v);
  if (const auto* v = json::find(root, "achievements")) load_achievements(db, *v);
  if (const auto* v = json::find(root, "random_events")) load_random_events(db, *v);
  if (const auto* v = json::find(root, "base_prices")) {
    for (const auto& [key, pv] : as_object(*v, "base_prices")) {
      db.base_prices[resource_index(parse_resource(key, "base_prices"))] = pv.number_value(1.0);
    }
  }
  if (const auto* v = json::find(root, "action_impacts")) load_action_impacts(db, *v);
  if (const auto* v = json::find(root, "start")) load_start(db, *v);

  return db;
}

ContentDB load_content_db_from_file(const std::string& path) {
  const auto txt = read_text_file(path);
  try {
    return content_db_from_json(json::parse(txt));
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load content '" + path + "': " + e.what());
  }
}

} // namespace gradostroi
