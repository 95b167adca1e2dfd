#pragma once

#include "gradostroi/util/hash_rng.h"

namespace gradostroi {

// Scheduled world events. Rolled once when a world is created and never
// regenerated afterwards (the three numbers are part of the save).
//
// Windows (inclusive, first match wins):
//   primary            [p, p + d]         hostility 2.0, market 1.25
//   secondary          [s, s + 2d]        hostility 0.1
//   secondary echo x2  [2s, 2s + 3d]      hostility 0.01
//   secondary echo x5  [5s, 5s + 5d]      hostility 0.001
struct EventCalendar {
  int primary_start{0};
  int secondary_start{0};
  int duration{0};
};

struct CalendarRules {
  int primary_min{20};
  int primary_max{60};
  int secondary_min{120};
  int secondary_max{180};
  int duration_min{20};
  int duration_max{60};
};

EventCalendar roll_event_calendar(util::HashRng& rng, const CalendarRules& rules = {});

bool in_primary_window(const EventCalendar& cal, int day);

double hostility_modifier(const EventCalendar& cal, int day);
double market_event_modifier(const EventCalendar& cal, int day);

} // namespace gradostroi
