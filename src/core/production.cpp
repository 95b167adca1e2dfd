#include "gradostroi/core/production.h"

#include <algorithm>
#include <cstddef>

namespace gradostroi {

int next_multiplier(int current) {
  for (std::size_t i = 0; i < kMultiplierSteps.size(); ++i) {
    if (kMultiplierSteps[i] == current) return kMultiplierSteps[(i + 1) % kMultiplierSteps.size()];
  }
  return kMultiplierSteps[0];
}

double happiness_modifier(double happiness) {
  return std::clamp(1.0 + (happiness - 50.0) * 0.005, 0.8, 1.2);
}

double worker_bonus(int workers) {
  return 1.0 + 0.15 * static_cast<double>(std::min(std::max(workers, 0), 5));
}

double building_cost_scale(int count) { return 1.0 + 0.1 * static_cast<double>(std::max(count, 0)); }

} // namespace gradostroi
