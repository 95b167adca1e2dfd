#include "gradostroi/core/ecosystem.h"

#include <algorithm>

namespace gradostroi {
namespace {

double clamp_health(double v) { return std::clamp(v, 0.0, 100.0); }

} // namespace

double overall_health(const EcosystemState& eco) {
  double sum = 0.0;
  for (double v : eco.biomes) sum += v;
  return sum / static_cast<double>(kBiomeCount);
}

EcosystemTier ecosystem_tier(double health) {
  if (health >= 80.0) return EcosystemTier::Healthy;
  if (health >= 60.0) return EcosystemTier::Stable;
  if (health >= 40.0) return EcosystemTier::Degraded;
  return EcosystemTier::Critical;
}

double tier_production_modifier(EcosystemTier tier) {
  switch (tier) {
    case EcosystemTier::Healthy: return 1.2;
    case EcosystemTier::Stable: return 1.0;
    case EcosystemTier::Degraded: return 0.8;
    case EcosystemTier::Critical: return 0.6;
  }
  return 0.6;
}

double production_modifier(const EcosystemState& eco) {
  return tier_production_modifier(ecosystem_tier(overall_health(eco)));
}

double worker_load_factor(int total_workers, const EcosystemRules& rules) {
  const int w = std::clamp(total_workers, 0, std::max(0, rules.worker_load_cap));
  return 0.75 + 0.05 * static_cast<double>(w);
}

void tick_ecosystem(EcosystemState& eco, const std::vector<IndustrySource>& industry, int total_workers,
                    double industry_penalty, const EcosystemRules& rules) {
  const double load = worker_load_factor(total_workers, rules);

  BiomeHealth delta{};
  int total_buildings = 0;
  for (const auto& src : industry) {
    if (src.count <= 0) continue;
    total_buildings += src.count;
    for (const auto& imp : src.impacts) {
      delta[biome_index(imp.biome)] += imp.per_unit * static_cast<double>(src.count) * load * industry_penalty;
    }
  }

  for (std::size_t i = 0; i < kBiomeCount; ++i) {
    double v = eco.biomes[i] + delta[i];
    if (v < rules.regeneration_ceiling) v += rules.regeneration_per_day;
    eco.biomes[i] = clamp_health(v);
  }

  eco.pollution = std::min(100.0, rules.pollution_per_building * static_cast<double>(total_buildings) * load);
  eco.biodiversity = std::max(0.0, overall_health(eco) - rules.biodiversity_pollution_weight * eco.pollution);
}

void shift_biome(EcosystemState& eco, Biome biome, double delta) {
  double& v = eco.biomes[biome_index(biome)];
  v = clamp_health(v + delta);
}

} // namespace gradostroi
