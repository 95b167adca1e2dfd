#include "gradostroi/util/digest.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "gradostroi/util/sorted_keys.h"

namespace gradostroi {
namespace {

// FNV-1a 64-bit.
class Digest64 {
 public:
  Digest64() = default;

  void add_u8(std::uint8_t b) {
    h_ ^= static_cast<std::uint64_t>(b);
    h_ *= kPrime;
  }

  void add_u64(std::uint64_t v) {
    // Little-endian bytes regardless of host.
    for (int i = 0; i < 8; ++i) {
      add_u8(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
    }
  }

  void add_i64(std::int64_t v) { add_u64(static_cast<std::uint64_t>(v)); }

  void add_size(std::size_t n) { add_u64(static_cast<std::uint64_t>(n)); }

  void add_bool(bool b) { add_u8(static_cast<std::uint8_t>(b ? 1 : 0)); }

  template <typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
  void add_enum(E e) {
    using U = std::underlying_type_t<E>;
    add_u64(static_cast<std::uint64_t>(static_cast<U>(e)));
  }

  void add_string(const std::string& s) {
    add_size(s.size());
    for (unsigned char c : s) add_u8(static_cast<std::uint8_t>(c));
  }

  void add_double(double v) {
    std::uint64_t u = 0;
    static_assert(sizeof(u) == sizeof(v));
    std::memcpy(&u, &v, sizeof(u));

    // -0.0 == +0.0
    if ((u << 1) == 0) u = 0;

    const std::uint64_t exp = u & 0x7ff0000000000000ULL;
    const std::uint64_t mant = u & 0x000fffffffffffffULL;
    if (exp == 0x7ff0000000000000ULL && mant != 0) {
      u = 0x7ff8000000000000ULL;
    }

    add_u64(u);
  }

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffset = 1469598103934665603ull;
  static constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t h_{kOffset};
};

void hash_id_set(Digest64& d, std::vector<std::string> ids) {
  std::sort(ids.begin(), ids.end());
  d.add_size(ids.size());
  for (const auto& id : ids) d.add_string(id);
}

void hash_bundle(Digest64& d, const ResourceBundle& b) {
  d.add_size(b.size());
  for (const auto& e : b) {
    d.add_enum(e.resource);
    d.add_double(e.amount);
  }
}

void hash_cost(Digest64& d, const Cost& c) {
  hash_bundle(d, c.resources);
  d.add_double(c.research);
}

void hash_reaction(Digest64& d, const CharacterReaction& r) {
  d.add_bool(r.trait.has_value());
  if (r.trait) d.add_enum(*r.trait);
  d.add_enum(r.action);
}

// Alternative index first, then the payload.
void hash_effect(Digest64& d, const Effect& e) {
  d.add_size(e.index());
  std::visit(
      [&](const auto& eff) {
        using T = std::decay_t<decltype(eff)>;
        if constexpr (std::is_same_v<T, FoodProductionFloor> || std::is_same_v<T, MiningEfficiencyFloor> ||
                      std::is_same_v<T, IndustryPenaltyFloor>) {
          d.add_double(eff.value);
        } else if constexpr (std::is_same_v<T, CraftSpeedScale> || std::is_same_v<T, MarketTrendScale>) {
          d.add_double(eff.factor);
        } else if constexpr (std::is_same_v<T, HappinessBonus>) {
          d.add_double(eff.amount);
        } else if constexpr (std::is_same_v<T, CharacterReaction>) {
          hash_reaction(d, eff);
        }
      },
      e);
}

void hash_condition(Digest64& d, const Condition& c) {
  d.add_size(c.index());
  std::visit(
      [&](const auto& cond) {
        using T = std::decay_t<decltype(cond)>;
        if constexpr (std::is_same_v<T, BuildingsAtLeast> || std::is_same_v<T, SecretsAtLeast>) {
          d.add_i64(cond.count);
        } else if constexpr (std::is_same_v<T, ResourceAtLeast>) {
          d.add_enum(cond.resource);
          d.add_double(cond.amount);
        } else if constexpr (std::is_same_v<T, BiomeAtLeast>) {
          d.add_enum(cond.biome);
          d.add_double(cond.health);
        } else if constexpr (std::is_same_v<T, EcosystemHealthAtLeast>) {
          d.add_double(cond.health);
        } else if constexpr (std::is_same_v<T, BiodiversityAtLeast>) {
          d.add_double(cond.value);
        } else if constexpr (std::is_same_v<T, ResearchAtLeast>) {
          d.add_double(cond.research);
        }
      },
      c);
}

void hash_reward(Digest64& d, const AchievementReward& r) {
  d.add_size(r.index());
  std::visit(
      [&](const auto& rw) {
        using T = std::decay_t<decltype(rw)>;
        if constexpr (std::is_same_v<T, ResourceGrant>) {
          d.add_enum(rw.resource);
          d.add_double(rw.amount);
        } else if constexpr (std::is_same_v<T, CraftSpeedFloor> || std::is_same_v<T, ResearchBonusFloor>) {
          d.add_double(rw.value);
        } else if constexpr (std::is_same_v<T, BiomeRestoration>) {
          d.add_double(rw.amount);
        }
      },
      r);
}

void hash_ecosystem(Digest64& d, const EcosystemState& eco) {
  for (double b : eco.biomes) d.add_double(b);
  d.add_double(eco.pollution);
  d.add_double(eco.biodiversity);
}

} // namespace

std::uint64_t digest_game_state64(const GameState& s, const DigestOptions& opt) {
  Digest64 d;
  d.add_i64(s.save_version);
  d.add_i64(s.day);
  d.add_bool(s.day_started);
  d.add_bool(s.player_acted);
  d.add_i64(s.multiplier_mode);

  d.add_double(s.research);
  d.add_bool(s.research_complete);
  d.add_bool(s.victory_achieved);
  d.add_bool(s.victory_category.has_value());
  if (s.victory_category) d.add_enum(*s.victory_category);

  d.add_double(s.craft_speed);
  d.add_double(s.research_bonus);
  d.add_double(s.food_production);
  d.add_double(s.mining_efficiency);
  d.add_double(s.happiness);
  d.add_double(s.eco_industry_penalty);
  d.add_enum(s.difficulty);

  for (double v : s.resources) d.add_double(v);
  for (int v : s.buildings) d.add_i64(v);
  for (int v : s.workers) d.add_i64(v);
  d.add_i64(s.storage_units);
  d.add_i64(s.population);
  d.add_i64(s.idle_workers);

  hash_id_set(d, s.researched_techs);
  hash_id_set(d, s.discovered_secrets);
  hash_id_set(d, s.unlocked_achievements);

  const auto ids = util::sorted_keys(s.characters);
  d.add_size(ids.size());
  for (const auto& id : ids) {
    const CharacterState& c = s.characters.at(id);
    d.add_string(id);
    d.add_double(c.score);
    d.add_size(c.memory.size());
    for (const auto& m : c.memory) d.add_string(m);
    hash_id_set(d, c.open_quests);
  }

  d.add_i64(s.calendar.primary_start);
  d.add_i64(s.calendar.secondary_start);
  d.add_i64(s.calendar.duration);
  hash_ecosystem(d, s.ecosystem);

  d.add_double(s.market.trend);
  for (const auto& h : s.market.history) {
    d.add_size(h.size());
    for (double p : h) d.add_double(p);
  }

  d.add_u64(s.rng.state());
  d.add_u64(s.next_event_seq);

  if (opt.include_events) {
    d.add_size(s.events.size());
    for (const auto& ev : s.events) {
      d.add_u64(ev.seq);
      d.add_i64(ev.day);
      d.add_enum(ev.level);
      d.add_enum(ev.category);
      d.add_string(ev.message);
    }
  }

  return d.value();
}

std::uint64_t digest_content_db64(const ContentDB& c) {
  Digest64 d;

  for (const auto& b : c.buildings) {
    d.add_string(b.id);
    d.add_string(b.name);
    hash_bundle(d, b.base_cost);
    hash_bundle(d, b.output);
    d.add_size(b.impacts.size());
    for (const auto& imp : b.impacts) {
      d.add_enum(imp.biome);
      d.add_double(imp.per_unit);
    }
    d.add_bool(b.on_build.has_value());
    if (b.on_build) hash_reaction(d, *b.on_build);
  }
  hash_bundle(d, c.storage_cost);

  d.add_size(c.mining_actions.size());
  for (const auto& a : c.mining_actions) {
    d.add_string(a.id);
    hash_bundle(d, a.output);
    d.add_bool(a.reaction.has_value());
    if (a.reaction) hash_reaction(d, *a.reaction);
  }

  for (const auto& id : util::sorted_keys(c.recipes)) {
    const RecipeDef& r = c.recipes.at(id);
    d.add_string(id);
    hash_bundle(d, r.inputs);
    d.add_double(r.research_input);
    hash_bundle(d, r.outputs);
    d.add_string(r.required_unlock);
  }

  for (const auto& id : util::sorted_keys(c.techs)) {
    const TechDef& t = c.techs.at(id);
    d.add_string(id);
    hash_id_set(d, t.prereqs);
    hash_cost(d, t.cost);
    d.add_size(t.effects.size());
    for (const auto& e : t.effects) hash_effect(d, e);
  }

  for (const auto& id : util::sorted_keys(c.secrets)) {
    const SecretDef& sd = c.secrets.at(id);
    d.add_string(id);
    hash_cost(d, sd.cost);
    hash_effect(d, sd.effect);
  }

  for (const auto& id : util::sorted_keys(c.characters)) {
    const CharacterDef& ch = c.characters.at(id);
    d.add_string(id);
    d.add_double(ch.initial_score);
    d.add_size(ch.traits.size());
    for (Trait t : ch.traits) d.add_enum(t);
    hash_id_set(d, ch.quests);
    d.add_size(ch.offers.size());
    for (const auto& o : ch.offers) {
      d.add_enum(o.resource);
      d.add_double(o.price_modifier);
    }
  }

  for (const auto& id : util::sorted_keys(c.quests)) {
    const QuestDef& q = c.quests.at(id);
    d.add_string(id);
    hash_condition(d, q.condition);
    d.add_double(q.relationship_reward);
    hash_bundle(d, q.resource_reward);
  }

  for (const auto& id : util::sorted_keys(c.achievements)) {
    const AchievementDef& a = c.achievements.at(id);
    d.add_string(id);
    hash_condition(d, a.condition);
    hash_reward(d, a.reward);
  }

  d.add_size(c.random_events.size());
  for (const auto& ev : c.random_events) {
    d.add_string(ev.id);
    hash_bundle(d, ev.deltas);
    d.add_bool(ev.biome_damage.has_value());
    if (ev.biome_damage) {
      d.add_enum(ev.biome_damage->biome);
      d.add_double(ev.biome_damage->per_unit);
    }
  }

  for (double p : c.base_prices) d.add_double(p);
  for (double v : c.action_impacts) d.add_double(v);

  hash_bundle(d, c.start.resources);
  for (double b : c.start.biomes) d.add_double(b);
  d.add_i64(c.start.storage_units);

  return d.value();
}

std::string digest64_to_hex(std::uint64_t v) {
  std::ostringstream out;
  out << std::hex;
  out.width(16);
  out.fill('0');
  out << v;
  return out.str();
}

} // namespace gradostroi
