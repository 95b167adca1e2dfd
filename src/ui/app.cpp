#include "ui/app.h"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include <imgui.h>

#include "gradostroi/core/enum_strings.h"
#include "gradostroi/core/relationships.h"
#include "gradostroi/core/serialization.h"
#include "gradostroi/core/state_validation.h"
#include "gradostroi/util/file_io.h"
#include "gradostroi/util/log.h"
#include "gradostroi/util/sorted_keys.h"
#include "gradostroi/util/strings.h"

namespace gradostroi::ui {

namespace {

const ImVec4 kOkColor(0.55f, 0.85f, 0.55f, 1.0f);
const ImVec4 kFailColor(0.95f, 0.55f, 0.45f, 1.0f);
const ImVec4 kDimColor(0.6f, 0.6f, 0.6f, 1.0f);

const char* resource_label(int idx) {
  static std::vector<std::string> names;
  if (names.empty()) {
    for (Resource r : all_resources()) names.push_back(resource_to_string(r));
  }
  return names[static_cast<std::size_t>(idx)].c_str();
}

} // namespace

App::App(Simulation sim, AutosaveConfig autosave) : sim_(std::move(sim)), autosave_cfg_(std::move(autosave)) {
  if (autosave_cfg_.enabled) {
    sim_.set_autosave_hook([this](const GameState& st) {
      const auto r = autosaver_.autosave(st, autosave_cfg_, [&] { return serialize_game_to_json(st); });
      if (!r.saved) log::warn("Autosave failed: " + r.error);
    });
  }
}

void App::on_event(const SDL_Event& e) {
  if (e.type != SDL_KEYDOWN) return;
  const ImGuiIO& io = ImGui::GetIO();
  if (io.WantTextInput) return;

  if (e.key.keysym.sym == SDLK_SPACE) {
    sim_.end_day();
    report("Day " + std::to_string(sim_.state().day), true);
  } else if (e.key.keysym.sym == SDLK_m) {
    report("Multiplier x" + std::to_string(sim_.toggle_multiplier()), true);
  }
}

void App::frame() {
  // Player actions happen inside a started day.
  sim_.begin_day();

  {
    const ImGuiIO& io = ImGui::GetIO();
    if (!io.WantTextInput && io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_S)) save_game();
  }

  draw_controls_window();
  draw_settlement_window();
  draw_production_window();
  draw_market_window();
  draw_progression_window();
  draw_characters_window();
  if (show_events_window_) draw_events_window();
}

void App::report(const std::string& msg, bool ok) {
  last_message_ = msg;
  last_ok_ = ok;
}

void App::act(const ActionResult& r) {
  const std::string msg = r.ok() ? r.message : action_status_label(r.status) + ": " + r.message;
  report(msg, r.ok());
}

void App::save_game() {
  try {
    save_game_to_file(save_path_, sim_.state());
    log::info(std::string("Saved game to ") + save_path_);
    report(std::string("Saved to ") + save_path_, true);
  } catch (const std::exception& e) {
    log::error(std::string("Save failed: ") + e.what());
    report(std::string("Save failed: ") + e.what(), false);
  }
}

void App::load_game() {
  try {
    GameState loaded = load_game_from_file(load_path_);
    const auto errors = validate_game_state(loaded, &sim_.content(), sim_.cfg().storage);
    if (!errors.empty()) {
      log::warn("Save '" + std::string(load_path_) + "' failed validation: " + errors.front());
      report("Save is inconsistent: " + errors.front(), false);
      return;
    }
    sim_.load_game(std::move(loaded));
    autosaver_.reset();
    report(std::string("Loaded ") + load_path_, true);
  } catch (const std::exception& e) {
    log::error(std::string("Load failed: ") + e.what());
    report(std::string("Load failed: ") + e.what(), false);
  }
}

void App::draw_controls_window() {
  ImGui::Begin("Controls");

  if (ImGui::Button("End day (Space)")) {
    const bool won = sim_.end_day();
    report(won ? "Victory!" : "Day " + std::to_string(sim_.state().day), true);
  }
  ImGui::SameLine();
  if (ImGui::Button("+5 days")) {
    sim_.advance_days(5);
    report("Day " + std::to_string(sim_.state().day), true);
  }
  ImGui::SameLine();
  const std::string mult = "Multiplier x" + std::to_string(sim_.multiplier()) + " (M)";
  if (ImGui::Button(mult.c_str())) sim_.toggle_multiplier();

  if (!sim_.state().player_acted && sim_.state().difficulty == Difficulty::Normal) {
    ImGui::TextUnformatted("Difficulty:");
    ImGui::SameLine();
    if (ImGui::SmallButton("Easy")) act(sim_.set_difficulty(Difficulty::Easy));
    ImGui::SameLine();
    if (ImGui::SmallButton("Hard")) act(sim_.set_difficulty(Difficulty::Hard));
  } else {
    ImGui::Text("Difficulty: %s", difficulty_to_string(sim_.state().difficulty).c_str());
  }

  ImGui::Separator();
  ImGui::InputText("Save path", save_path_, sizeof(save_path_));
  ImGui::SameLine();
  if (ImGui::Button("Save")) save_game();
  ImGui::InputText("Load path", load_path_, sizeof(load_path_));
  ImGui::SameLine();
  if (ImGui::Button("Load")) load_game();
  if (ImGui::Button("New game")) {
    sim_.new_game();
    autosaver_.reset();
    report("New game", true);
  }
  ImGui::SameLine();
  ImGui::Checkbox("Event log", &show_events_window_);

  if (!autosaver_.last_autosave_path().empty()) {
    ImGui::TextColored(kDimColor, "Last autosave: %s", autosaver_.last_autosave_path().c_str());
  }

  if (!last_message_.empty()) {
    ImGui::Separator();
    ImGui::PushTextWrapPos(0.0f);
    ImGui::TextColored(last_ok_ ? kOkColor : kFailColor, "%s", last_message_.c_str());
    ImGui::PopTextWrapPos();
  }

  ImGui::End();
}

void App::draw_settlement_window() {
  const SettlementSnapshot snap = sim_.snapshot();
  ImGui::Begin("Settlement");

  ImGui::Text("Day %d", snap.day);
  ImGui::Text("Population %d (%d idle)", snap.population, snap.idle_workers);
  ImGui::Text("Happiness %.1f", snap.happiness);
  ImGui::Text("Research %.2f%s", snap.research, snap.research_complete ? " (complete)" : "");
  if (snap.victory_achieved && snap.victory_category) {
    ImGui::TextColored(kOkColor, "Victory: %s", victory_category_to_string(*snap.victory_category).c_str());
  }
  if (snap.hostility != 1.0) ImGui::Text("Hostility x%.3f", snap.hostility);
  if (snap.market_event_active) ImGui::TextColored(kOkColor, "Market event in progress");

  ImGui::Separator();
  ImGui::Text("Ecosystem %.1f (%s), production x%.2f", snap.ecosystem_health,
              ecosystem_tier_label(snap.ecosystem_tier).c_str(), snap.production_modifier);
  for (std::size_t i = 0; i < kBiomeCount; ++i) {
    const std::string label = biome_to_string(static_cast<Biome>(i));
    ImGui::ProgressBar(static_cast<float>(snap.ecosystem.biomes[i] / 100.0), ImVec2(160.0f, 0.0f));
    ImGui::SameLine();
    ImGui::Text("%s %.1f", label.c_str(), snap.ecosystem.biomes[i]);
  }
  ImGui::Text("Pollution %.2f, biodiversity %.1f", snap.ecosystem.pollution, snap.ecosystem.biodiversity);

  ImGui::Separator();
  ImGui::Text("Storage: %d units, capacity %.0f", snap.storage_units, snap.storage_capacity);
  if (ImGui::BeginTable("stock", 2, ImGuiTableFlags_RowBg | ImGuiTableFlags_Borders)) {
    for (Resource r : all_resources()) {
      const double v = snap.resources[resource_index(r)];
      if (v <= 0.0) continue;
      ImGui::TableNextRow();
      ImGui::TableSetColumnIndex(0);
      ImGui::TextUnformatted(resource_to_string(r).c_str());
      ImGui::TableSetColumnIndex(1);
      ImGui::Text("%.2f", v);
    }
    ImGui::EndTable();
  }

  ImGui::End();
}

void App::draw_production_window() {
  ImGui::Begin("Production");
  const GameState& s = sim_.state();

  ImGui::TextUnformatted("Gather");
  for (const auto& a : sim_.content().mining_actions) {
    if (ImGui::Button(a.name.c_str())) act(sim_.mine(a.id));
  }

  ImGui::Separator();
  ImGui::TextUnformatted("Buildings");
  for (BuildingType t : all_building_types()) {
    const std::size_t i = building_index(t);
    const BuildingDef& def = sim_.content().buildings[i];
    ImGui::PushID(static_cast<int>(i));
    ImGui::Text("%s: %d", def.name.c_str(), s.buildings[i]);
    ImGui::SameLine();
    if (ImGui::SmallButton("Build")) act(sim_.build(t));
    if (s.buildings[i] > 0) {
      ImGui::SameLine();
      ImGui::SetNextItemWidth(90.0f);
      worker_targets_[i] = std::max(0, worker_targets_[i]);
      ImGui::InputInt("##workers", &worker_targets_[i]);
      ImGui::SameLine();
      if (ImGui::SmallButton("Assign")) act(sim_.assign_workers(t, worker_targets_[i]));
      ImGui::SameLine();
      ImGui::TextColored(kDimColor, "(%d working)", s.workers[i]);
    }
    ImGui::PopID();
  }
  if (ImGui::Button("Build storage")) act(sim_.build_storage());

  ImGui::Separator();
  ImGui::TextUnformatted("Crafting");
  for (const auto& id : util::sorted_keys(sim_.content().recipes)) {
    const RecipeDef& r = sim_.content().recipes.at(id);
    const std::string label = "Craft " + r.name + "##" + id;
    if (ImGui::Button(label.c_str())) act(sim_.craft(id));
    if (!r.required_unlock.empty() && !is_unlocked(s, r.required_unlock)) {
      ImGui::SameLine();
      ImGui::TextColored(kDimColor, "needs %s", r.required_unlock.c_str());
    }
  }

  ImGui::End();
}

void App::draw_market_window() {
  ImGui::Begin("Market");

  if (ImGui::BeginCombo("Resource", resource_label(selected_resource_))) {
    for (int i = 0; i < static_cast<int>(kResourceCount); ++i) {
      if (ImGui::Selectable(resource_label(i), i == selected_resource_)) selected_resource_ = i;
    }
    ImGui::EndCombo();
  }
  ImGui::InputDouble("Amount", &trade_amount_, 1.0, 10.0, "%.2f");

  const Resource r = all_resources()[static_cast<std::size_t>(selected_resource_)];
  ImGui::Text("Quote: %.2f wine", sim_.quote_price(r));
  if (ImGui::Button("Buy")) act(sim_.trade(r, trade_amount_, true));
  ImGui::SameLine();
  if (ImGui::Button("Sell")) act(sim_.trade(r, trade_amount_, false));
  ImGui::SameLine();
  if (ImGui::Button("Study")) act(sim_.research_resource(r));

  ImGui::Separator();
  if (ImGui::BeginTable("prices", 2, ImGuiTableFlags_RowBg | ImGuiTableFlags_Borders)) {
    for (Resource p : all_resources()) {
      if (p == kCurrencyResource) continue;
      ImGui::TableNextRow();
      ImGui::TableSetColumnIndex(0);
      ImGui::TextUnformatted(resource_to_string(p).c_str());
      ImGui::TableSetColumnIndex(1);
      ImGui::Text("%.2f", sim_.quote_price(p));
    }
    ImGui::EndTable();
  }

  ImGui::End();
}

void App::draw_progression_window() {
  ImGui::Begin("Research");

  ImGui::TextUnformatted("Technologies");
  for (const auto& id : util::sorted_keys(sim_.content().techs)) {
    const TechDef& t = sim_.content().techs.at(id);
    const UnlockState st = sim_.tech_state(id);
    ImGui::PushID(id.c_str());
    ImGui::Text("%s [%s]", t.name.c_str(), unlock_state_label(st).c_str());
    if (st == UnlockState::Available) {
      ImGui::SameLine();
      if (ImGui::SmallButton("Research")) act(sim_.research_technology(id));
    }
    if (!t.description.empty()) ImGui::TextColored(kDimColor, "  %s", t.description.c_str());
    ImGui::PopID();
  }

  ImGui::Separator();
  ImGui::TextUnformatted("Secrets");
  for (const auto& id : util::sorted_keys(sim_.content().secrets)) {
    const SecretDef& sd = sim_.content().secrets.at(id);
    const UnlockState st = sim_.secret_state(id);
    ImGui::PushID(id.c_str());
    ImGui::Text("%s [%s]", sd.name.c_str(), unlock_state_label(st).c_str());
    if (st == UnlockState::Available) {
      ImGui::SameLine();
      if (ImGui::SmallButton("Discover")) act(sim_.discover_secret(id));
    }
    ImGui::PopID();
  }

  ImGui::Separator();
  const LegacyReport rep = sim_.final_legacy();
  ImGui::Text("Legacy: %s (%s, %.1f)", rep.title.c_str(), victory_category_to_string(rep.category).c_str(),
              rep.score);

  ImGui::End();
}

void App::draw_characters_window() {
  ImGui::Begin("Characters");

  const auto ids = util::sorted_keys(sim_.content().characters);
  if (ids.empty()) {
    ImGui::TextUnformatted("(none)");
    ImGui::End();
    return;
  }
  selected_character_ = std::clamp(selected_character_, 0, static_cast<int>(ids.size()) - 1);

  for (int i = 0; i < static_cast<int>(ids.size()); ++i) {
    const CharacterDef& def = sim_.content().characters.at(ids[static_cast<std::size_t>(i)]);
    if (ImGui::Selectable(def.name.c_str(), i == selected_character_)) selected_character_ = i;
  }

  const std::string& id = ids[static_cast<std::size_t>(selected_character_)];
  const CharacterDef& def = sim_.content().characters.at(id);
  const CharacterState* st = find_ptr(sim_.state().characters, id);
  ImGui::Separator();
  ImGui::TextWrapped("%s", def.description.c_str());
  if (st) {
    ImGui::Text("Relationship %.1f (%s)", st->score, relationship_tier_label(relationship_tier(st->score)).c_str());
  }
  if (ImGui::Button("Talk")) act(sim_.talk(id));

  for (const auto& offer : def.offers) {
    const std::string label = "Buy " + format_fixed(trade_amount_) + " " + resource_to_string(offer.resource) +
                              "##" + resource_to_string(offer.resource);
    if (ImGui::Button(label.c_str())) act(sim_.trade_with_character(id, offer.resource, trade_amount_));
  }

  if (st) {
    for (const auto& q : st->open_quests) {
      const QuestDef* quest = find_ptr(sim_.content().quests, q);
      if (!quest) continue;
      ImGui::PushID(q.c_str());
      ImGui::BulletText("%s", quest->title.c_str());
      ImGui::SameLine();
      if (ImGui::SmallButton("Complete")) act(sim_.complete_quest(id, q));
      ImGui::PopID();
    }
  }

  ImGui::End();
}

void App::draw_events_window() {
  ImGui::Begin("Event log", &show_events_window_);
  const auto& events = sim_.state().events;
  const std::size_t first = events.size() > 200 ? events.size() - 200 : 0;
  for (std::size_t i = events.size(); i-- > first;) {
    const SimEvent& ev = events[i];
    const ImVec4 color = ev.level == EventLevel::Info ? ImVec4(0.85f, 0.85f, 0.85f, 1.0f) : kFailColor;
    ImGui::TextColored(color, "[day %d] %s", ev.day, ev.message.c_str());
  }
  ImGui::End();
}

} // namespace gradostroi::ui
