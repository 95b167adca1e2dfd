#include "gradostroi/core/relationships.h"

#include <algorithm>
#include <cmath>

namespace gradostroi {
namespace {

constexpr double kScoreMin = -100.0;
constexpr double kScoreMax = 100.0;

constexpr double kEnvironmentalistDeforestationScale = 2.0;
constexpr double kBlacksmithForgeBonus = 20.0;

double impact_of(const ActionImpactTable& impacts, PlayerAction a) {
  const auto i = static_cast<std::size_t>(a);
  return i < impacts.size() ? impacts[i] : 0.0;
}

} // namespace

ActionImpactTable default_action_impacts() {
  ActionImpactTable t{};
  t[static_cast<std::size_t>(PlayerAction::Deforestation)] = -25.0;
  t[static_cast<std::size_t>(PlayerAction::BuildSawmill)] = -10.0;
  t[static_cast<std::size_t>(PlayerAction::BuildHerbalist)] = 15.0;
  t[static_cast<std::size_t>(PlayerAction::ResearchEcology)] = 20.0;
  t[static_cast<std::size_t>(PlayerAction::PolluteRiver)] = -30.0;
  t[static_cast<std::size_t>(PlayerAction::CleanupPollution)] = 25.0;
  t[static_cast<std::size_t>(PlayerAction::BuildForge)] = 10.0;
  return t;
}

bool has_trait(const CharacterDef& def, Trait t) {
  return std::find(def.traits.begin(), def.traits.end(), t) != def.traits.end();
}

double adjust_relationship(CharacterState& st, double delta) {
  const double before = st.score;
  st.score = std::clamp(st.score + delta, kScoreMin, kScoreMax);
  return st.score - before;
}

double react_to_action(CharacterState& st, const CharacterDef& def, PlayerAction action,
                       const ActionImpactTable& impacts) {
  double impact = impact_of(impacts, action);

  if (action == PlayerAction::Deforestation && has_trait(def, Trait::Environmentalist)) {
    impact *= kEnvironmentalistDeforestationScale;
    st.memory.push_back("player_destroyed_nature");
  }
  if (action == PlayerAction::BuildForge && has_trait(def, Trait::Blacksmith)) {
    impact += kBlacksmithForgeBonus;
    st.memory.push_back("player_built_forge");
  }

  return adjust_relationship(st, impact);
}

RelationshipTier relationship_tier(double score) {
  if (score >= 80.0) return RelationshipTier::Adores;
  if (score >= 60.0) return RelationshipTier::Respects;
  if (score >= 40.0) return RelationshipTier::Friendly;
  if (score >= 20.0) return RelationshipTier::Neutral;
  if (score >= 0.0) return RelationshipTier::Wary;
  if (score >= -20.0) return RelationshipTier::Displeased;
  if (score >= -40.0) return RelationshipTier::Hostile;
  return RelationshipTier::Hates;
}

std::string dialogue_line(double score) {
  if (score >= 80.0) return "I trust you with secrets.";
  if (score >= 60.0) return "I respect your approach.";
  if (score >= 40.0) return "You're trying, it shows.";
  if (score >= 20.0) return "Time will tell.";
  if (score >= 0.0) return "Let's see what you do.";
  if (score >= -20.0) return "We have nothing to talk about.";
  return "Go away.";
}

} // namespace gradostroi
