#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace gradostroi {

enum class Biome : std::uint8_t { Forest, Rivers, Soil, Air };

inline constexpr std::size_t kBiomeCount = 4;

enum class EcosystemTier : std::uint8_t { Healthy, Stable, Degraded, Critical };

using BiomeHealth = std::array<double, kBiomeCount>;

constexpr std::size_t biome_index(Biome b) { return static_cast<std::size_t>(b); }

struct EcosystemState {
  // Each value is kept in [0,100].
  BiomeHealth biomes{};

  double pollution{0.0};
  double biodiversity{100.0};
};

// Per-unit damage a building type does to one biome each day (negative).
struct BiomeImpact {
  Biome biome{Biome::Forest};
  double per_unit{0.0};
};

// One building type as seen by the ecosystem: how many are standing and
// what each one does per day.
struct IndustrySource {
  int count{0};
  std::vector<BiomeImpact> impacts;
};

struct EcosystemRules {
  double regeneration_per_day{0.6};

  // Biomes at or above this value do not regenerate.
  double regeneration_ceiling{90.0};

  double pollution_per_building{0.25};
  double biodiversity_pollution_weight{0.25};

  // Worker load stops growing past this many assigned workers.
  int worker_load_cap{10};
};

double overall_health(const EcosystemState& eco);

EcosystemTier ecosystem_tier(double health);
double tier_production_modifier(EcosystemTier tier);

// Production multiplier for the current overall health (1.2 / 1.0 / 0.8 / 0.6).
double production_modifier(const EcosystemState& eco);

// 0.75 + 0.05 per assigned worker, saturating at rules.worker_load_cap workers.
double worker_load_factor(int total_workers, const EcosystemRules& rules = {});

// One daily ecosystem step. Deterministic.
//
// Building damage is scaled by the worker load factor and the industry
// penalty; pollution uses the worker load factor alone.
void tick_ecosystem(EcosystemState& eco, const std::vector<IndustrySource>& industry, int total_workers,
                    double industry_penalty, const EcosystemRules& rules = {});

// Signed change to one biome, clamped to [0,100].
void shift_biome(EcosystemState& eco, Biome biome, double delta);

} // namespace gradostroi
