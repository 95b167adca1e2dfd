#include "gradostroi/core/serialization.h"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstdio>
#include <stdexcept>
#include <utility>

#include "gradostroi/core/enum_strings.h"
#include "gradostroi/util/file_io.h"
#include "gradostroi/util/sorted_keys.h"

namespace gradostroi {

namespace {

using json::Array;
using json::Object;
using json::Value;

Array string_vector_to_json(const std::vector<std::string>& v) {
  Array a;
  a.reserve(v.size());
  for (const auto& x : v) a.push_back(x);
  return a;
}

std::vector<std::string> string_vector_from_json(const Value& v) {
  std::vector<std::string> out;
  for (const auto& x : v.array()) out.push_back(x.string_value());
  return out;
}

Array number_vector_to_json(const std::vector<double>& v) {
  Array a;
  a.reserve(v.size());
  for (double x : v) a.push_back(x);
  return a;
}

// RNG state is a full 64-bit word; JSON numbers only carry 53 bits exactly.
std::string u64_to_hex(std::uint64_t v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "0x%016llx", static_cast<unsigned long long>(v));
  return buf;
}

std::uint64_t u64_from_hex(const std::string& s) {
  if (s.empty()) throw std::runtime_error("Empty rng_state");
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s.c_str(), &end, 16);
  if (errno != 0 || end == s.c_str() || *end != '\0') {
    throw std::runtime_error("Invalid rng_state '" + s + "'");
  }
  return static_cast<std::uint64_t>(v);
}

Resource resource_key(const std::string& key) {
  if (auto r = resource_from_string(key)) return *r;
  throw std::runtime_error("Unknown resource '" + key + "' in save");
}

BuildingType building_key(const std::string& key) {
  if (auto t = building_type_from_string(key)) return *t;
  throw std::runtime_error("Unknown building type '" + key + "' in save");
}

Object building_counts_to_json(const BuildingCounts& counts) {
  Object o;
  for (BuildingType t : all_building_types()) {
    o[building_type_to_string(t)] = static_cast<double>(counts[building_index(t)]);
  }
  return o;
}

double num_or(const Object& o, const std::string& key, double def) {
  const auto* v = json::find(o, key);
  return v ? v->number_value(def) : def;
}

// Whole-number fields. Values that do not fit an int are rejected, never
// wrapped.
int int_field(const Value& v, const std::string& key) {
  if (!v.is_number()) throw std::runtime_error("Field '" + key + "' is not a number");
  const double r = std::round(v.number_value());
  if (!std::isfinite(r) || r < static_cast<double>(INT_MIN) || r > static_cast<double>(INT_MAX)) {
    throw std::runtime_error("Field '" + key + "' is out of range");
  }
  return static_cast<int>(r);
}

int int_field(const Object& o, const std::string& key, int def) {
  const auto* v = json::find(o, key);
  return v ? int_field(*v, key) : def;
}

// Event sequence numbers; doubles are exact up to 2^53.
std::uint64_t seq_field(const Value& v, const std::string& key) {
  if (!v.is_number()) throw std::runtime_error("Field '" + key + "' is not a number");
  const double r = std::round(v.number_value());
  if (!std::isfinite(r) || r < 0.0 || r > 9007199254740992.0) {
    throw std::runtime_error("Field '" + key + "' is out of range");
  }
  return static_cast<std::uint64_t>(r);
}

BuildingCounts building_counts_from_json(const Value& v) {
  BuildingCounts out{};
  for (const auto& [key, cv] : v.object()) {
    out[building_index(building_key(key))] = int_field(cv, key);
  }
  return out;
}

} // namespace

json::Value serialize_game_to_json_value(const GameState& s) {
  Object root;
  root["save_version"] = static_cast<double>(s.save_version);
  root["day"] = static_cast<double>(s.day);
  root["day_started"] = s.day_started;
  root["player_acted"] = s.player_acted;
  root["multiplier_mode"] = static_cast<double>(s.multiplier_mode);
  root["research"] = s.research;
  root["research_complete"] = s.research_complete;
  root["victory_achieved"] = s.victory_achieved;
  root["victory_category"] =
      s.victory_category ? Value(victory_category_to_string(*s.victory_category)) : Value(nullptr);

  root["craft_speed"] = s.craft_speed;
  root["research_bonus"] = s.research_bonus;
  root["food_production"] = s.food_production;
  root["mining_efficiency"] = s.mining_efficiency;
  root["happiness"] = s.happiness;
  root["eco_industry_penalty"] = s.eco_industry_penalty;
  root["difficulty"] = difficulty_to_string(s.difficulty);

  Object resources;
  for (Resource r : all_resources()) resources[resource_to_string(r)] = s.resources[resource_index(r)];
  root["resources"] = resources;

  root["buildings"] = building_counts_to_json(s.buildings);
  root["workers"] = building_counts_to_json(s.workers);
  root["storage_units"] = static_cast<double>(s.storage_units);
  root["population"] = static_cast<double>(s.population);
  root["idle_workers"] = static_cast<double>(s.idle_workers);

  root["researched_techs"] = string_vector_to_json(s.researched_techs);
  root["discovered_secrets"] = string_vector_to_json(s.discovered_secrets);
  root["unlocked_achievements"] = string_vector_to_json(s.unlocked_achievements);

  Object characters;
  for (const auto& id : util::sorted_keys(s.characters)) {
    const auto& c = s.characters.at(id);
    Object o;
    o["score"] = c.score;
    o["memory"] = string_vector_to_json(c.memory);
    o["open_quests"] = string_vector_to_json(c.open_quests);
    characters[id] = o;
  }
  root["characters"] = characters;

  Object calendar;
  calendar["primary_start"] = static_cast<double>(s.calendar.primary_start);
  calendar["secondary_start"] = static_cast<double>(s.calendar.secondary_start);
  calendar["duration"] = static_cast<double>(s.calendar.duration);
  root["calendar"] = calendar;

  Object eco;
  Object biomes;
  for (std::size_t i = 0; i < kBiomeCount; ++i) biomes[biome_to_string(static_cast<Biome>(i))] = s.ecosystem.biomes[i];
  eco["biomes"] = biomes;
  eco["pollution"] = s.ecosystem.pollution;
  eco["biodiversity"] = s.ecosystem.biodiversity;
  root["ecosystem"] = eco;

  Object market;
  market["trend"] = s.market.trend;
  Object history;
  for (Resource r : all_resources()) {
    const auto& h = s.market.history[resource_index(r)];
    if (!h.empty()) history[resource_to_string(r)] = number_vector_to_json(h);
  }
  market["history"] = history;
  root["market"] = market;

  root["rng_state"] = u64_to_hex(s.rng.state());

  root["next_event_seq"] = static_cast<double>(s.next_event_seq);
  Array events;
  events.reserve(s.events.size());
  for (const auto& ev : s.events) {
    Object o;
    o["seq"] = static_cast<double>(ev.seq);
    o["day"] = static_cast<double>(ev.day);
    o["level"] = event_level_to_string(ev.level);
    o["category"] = event_category_to_string(ev.category);
    o["message"] = ev.message;
    events.push_back(o);
  }
  root["events"] = events;

  return root;
}

std::string serialize_game_to_json(const GameState& s) { return json::stringify(serialize_game_to_json_value(s), 2); }

GameState deserialize_game_from_json(const std::string& json_text) {
  const auto root = json::parse(json_text).object();

  GameState s;
  {
    int loaded_version = 1;
    loaded_version = int_field(root, "save_version", 1);
    if (loaded_version > kCurrentSaveVersion) {
      throw std::runtime_error("save_version " + std::to_string(loaded_version) + " is newer than supported (" +
                               std::to_string(kCurrentSaveVersion) + ")");
    }
    s.save_version = kCurrentSaveVersion;
  }

  s.day = int_field(root.at("day"), "day");
  if (const auto* v = json::find(root, "day_started")) s.day_started = v->bool_value(false);
  if (const auto* v = json::find(root, "player_acted")) s.player_acted = v->bool_value(false);
  s.multiplier_mode = int_field(root, "multiplier_mode", 1);
  s.research = num_or(root, "research", 0.0);
  if (const auto* v = json::find(root, "research_complete")) s.research_complete = v->bool_value(false);
  if (const auto* v = json::find(root, "victory_achieved")) s.victory_achieved = v->bool_value(false);
  if (const auto* v = json::find(root, "victory_category"); v && v->is_string()) {
    auto c = victory_category_from_string(v->string_value());
    if (!c) throw std::runtime_error("Unknown victory category '" + v->string_value() + "'");
    s.victory_category = *c;
  }

  s.craft_speed = num_or(root, "craft_speed", 1.0);
  s.research_bonus = num_or(root, "research_bonus", 1.0);
  s.food_production = num_or(root, "food_production", 1.0);
  s.mining_efficiency = num_or(root, "mining_efficiency", 1.0);
  s.happiness = num_or(root, "happiness", 50.0);
  s.eco_industry_penalty = num_or(root, "eco_industry_penalty", 1.0);
  if (const auto* v = json::find(root, "difficulty")) {
    auto d = difficulty_from_string(v->string_value("normal"));
    if (!d) throw std::runtime_error("Unknown difficulty '" + v->string_value() + "'");
    s.difficulty = *d;
  }

  for (const auto& [key, v] : root.at("resources").object()) {
    s.resources[resource_index(resource_key(key))] = v.number_value(0.0);
  }

  s.buildings = building_counts_from_json(root.at("buildings"));
  if (const auto* v = json::find(root, "workers")) s.workers = building_counts_from_json(*v);
  s.storage_units = int_field(root, "storage_units", 1);
  s.population = int_field(root.at("population"), "population");
  s.idle_workers = int_field(root.at("idle_workers"), "idle_workers");

  if (const auto* v = json::find(root, "researched_techs")) s.researched_techs = string_vector_from_json(*v);
  if (const auto* v = json::find(root, "discovered_secrets")) s.discovered_secrets = string_vector_from_json(*v);
  if (const auto* v = json::find(root, "unlocked_achievements")) {
    s.unlocked_achievements = string_vector_from_json(*v);
  }

  if (const auto* v = json::find(root, "characters")) {
    for (const auto& [id, cv] : v->object()) {
      const auto& o = cv.object();
      CharacterState c;
      c.score = num_or(o, "score", 0.0);
      if (const auto* m = json::find(o, "memory")) c.memory = string_vector_from_json(*m);
      if (const auto* q = json::find(o, "open_quests")) c.open_quests = string_vector_from_json(*q);
      s.characters[id] = std::move(c);
    }
  }

  {
    // Fixed at world creation; never re-rolled on load.
    const auto& o = root.at("calendar").object();
    s.calendar.primary_start = int_field(o.at("primary_start"), "primary_start");
    s.calendar.secondary_start = int_field(o.at("secondary_start"), "secondary_start");
    s.calendar.duration = int_field(o.at("duration"), "duration");
  }

  if (const auto* v = json::find(root, "ecosystem")) {
    const auto& o = v->object();
    if (const auto* b = json::find(o, "biomes")) {
      for (const auto& [key, bv] : b->object()) {
        auto biome = biome_from_string(key);
        if (!biome) throw std::runtime_error("Unknown biome '" + key + "' in save");
        s.ecosystem.biomes[biome_index(*biome)] = bv.number_value(0.0);
      }
    }
    s.ecosystem.pollution = num_or(o, "pollution", 0.0);
    s.ecosystem.biodiversity = num_or(o, "biodiversity", 100.0);
  }

  if (const auto* v = json::find(root, "market")) {
    const auto& o = v->object();
    s.market.trend = num_or(o, "trend", 1.0);
    if (const auto* h = json::find(o, "history")) {
      for (const auto& [key, hv] : h->object()) {
        auto& dst = s.market.history[resource_index(resource_key(key))];
        for (const auto& p : hv.array()) dst.push_back(p.number_value(0.0));
      }
    }
  }

  if (const auto* v = json::find(root, "rng_state")) s.rng.set_state(u64_from_hex(v->string_value()));

  s.next_event_seq = 1;
  if (const auto* v = json::find(root, "next_event_seq")) s.next_event_seq = seq_field(*v, "next_event_seq");
  if (s.next_event_seq == 0) s.next_event_seq = 1;

  // Persistent simulation event log.
  if (const auto* v = json::find(root, "events")) {
    std::uint64_t seq_cursor = 0;
    for (const auto& evv : v->array()) {
      const auto& o = evv.object();
      SimEvent ev;

      std::uint64_t wanted_seq = 0;
      if (const auto* sq = json::find(o, "seq")) wanted_seq = seq_field(*sq, "seq");
      if (wanted_seq <= seq_cursor) wanted_seq = seq_cursor + 1;
      ev.seq = wanted_seq;
      seq_cursor = ev.seq;

      ev.day = int_field(o, "day", 0);
      if (const auto* l = json::find(o, "level")) {
        ev.level = event_level_from_string(l->string_value("info")).value_or(EventLevel::Info);
      }
      if (const auto* c = json::find(o, "category")) {
        ev.category = event_category_from_string(c->string_value("general")).value_or(EventCategory::General);
      }
      if (const auto* m = json::find(o, "message")) ev.message = m->string_value();
      s.events.push_back(std::move(ev));
    }

    if (s.next_event_seq <= seq_cursor) s.next_event_seq = seq_cursor + 1;
  }

  return s;
}

GameState load_game_from_file(const std::string& path) {
  const std::string text = read_text_file(path);
  try {
    return deserialize_game_from_json(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load save '" + path + "': " + e.what());
  }
}

void save_game_to_file(const std::string& path, const GameState& state) {
  write_text_file(path, serialize_game_to_json(state));
}

} // namespace gradostroi
