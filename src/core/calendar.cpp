#include "gradostroi/core/calendar.h"

#include <cstdint>

namespace gradostroi {
namespace {

// Echo windows multiply the stored parameters; widen before doing so.
bool in_window(int day, std::int64_t start, std::int64_t length) { return day >= start && day <= start + length; }

} // namespace

EventCalendar roll_event_calendar(util::HashRng& rng, const CalendarRules& rules) {
  EventCalendar cal;
  cal.primary_start = rng.range_int(rules.primary_min, rules.primary_max);
  cal.secondary_start = rng.range_int(rules.secondary_min, rules.secondary_max);
  cal.duration = rng.range_int(rules.duration_min, rules.duration_max);
  return cal;
}

bool in_primary_window(const EventCalendar& cal, int day) {
  return in_window(day, cal.primary_start, cal.duration);
}

double hostility_modifier(const EventCalendar& cal, int day) {
  const std::int64_t s = cal.secondary_start;
  const std::int64_t d = cal.duration;
  if (in_primary_window(cal, day)) return 2.0;
  if (in_window(day, s, 2 * d)) return 0.1;
  if (in_window(day, 2 * s, 3 * d)) return 0.01;
  if (in_window(day, 5 * s, 5 * d)) return 0.001;
  return 1.0;
}

double market_event_modifier(const EventCalendar& cal, int day) {
  return in_primary_window(cal, day) ? 1.25 : 1.0;
}

} // namespace gradostroi
