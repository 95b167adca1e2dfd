#include "gradostroi/core/game_state.h"

#include <algorithm>
#include <numeric>

namespace gradostroi {
namespace {

bool contains(const std::vector<std::string>& v, const std::string& id) {
  return std::find(v.begin(), v.end(), id) != v.end();
}

} // namespace

int total_buildings(const GameState& s) { return std::accumulate(s.buildings.begin(), s.buildings.end(), 0); }

int total_workers(const GameState& s) { return std::accumulate(s.workers.begin(), s.workers.end(), 0); }

bool has_researched(const GameState& s, const std::string& tech_id) { return contains(s.researched_techs, tech_id); }

bool has_discovered(const GameState& s, const std::string& secret_id) {
  return contains(s.discovered_secrets, secret_id);
}

bool has_achievement(const GameState& s, const std::string& achievement_id) {
  return contains(s.unlocked_achievements, achievement_id);
}

bool is_unlocked(const GameState& s, const std::string& id) { return has_researched(s, id) || has_discovered(s, id); }

LegacyInputs legacy_inputs(const GameState& s) {
  LegacyInputs in;
  in.research = s.research;
  in.research_complete = s.research_complete;
  for (Resource r : all_resources()) {
    if (r == kCurrencyResource) continue;
    in.non_currency_wealth += s.resources[resource_index(r)];
  }
  in.currency = s.resources[resource_index(kCurrencyResource)];
  in.ecosystem_health = overall_health(s.ecosystem);
  in.unlocked_achievements = static_cast<int>(s.unlocked_achievements.size());
  in.discovered_secrets = static_cast<int>(s.discovered_secrets.size());
  return in;
}

} // namespace gradostroi
