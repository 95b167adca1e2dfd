#pragma once

#include <array>

namespace gradostroi {

// Multiplier mode cycles through these amounts.
inline constexpr std::array<int, 3> kMultiplierSteps = {1, 10, 100};

// Next step after `current` (wraps; unknown values restart at 1).
int next_multiplier(int current);

// clamp(1 + (happiness - 50) * 0.005, 0.8, 1.2)
double happiness_modifier(double happiness);

// 1 + 0.15 * min(workers, 5)
double worker_bonus(int workers);

// Construction price factor for a production building: 1 + 0.1 * count.
double building_cost_scale(int count);

} // namespace gradostroi
