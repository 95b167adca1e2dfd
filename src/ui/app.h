#pragma once

#include <string>
#include <vector>

#include <SDL.h>

#include "gradostroi/core/simulation.h"
#include "gradostroi/util/autosave.h"

namespace gradostroi::ui {

class App {
 public:
  App(Simulation sim, AutosaveConfig autosave);

  // Called once per frame.
  void frame();

  void on_event(const SDL_Event& e);

 private:
  void draw_controls_window();
  void draw_settlement_window();
  void draw_production_window();
  void draw_market_window();
  void draw_progression_window();
  void draw_characters_window();
  void draw_events_window();

  // Records an action outcome for the status line.
  void act(const ActionResult& r);
  void report(const std::string& msg, bool ok);

  void save_game();
  void load_game();

  Simulation sim_;
  AutosaveConfig autosave_cfg_;
  AutosaveManager autosaver_;

  // File dialogs (simple text inputs)
  char save_path_[256] = "saves/save.json";
  char load_path_[256] = "saves/save.json";

  int selected_resource_{0};
  double trade_amount_{1.0};
  int selected_character_{0};
  int worker_targets_[kBuildingTypeCount] = {};

  std::string last_message_;
  bool last_ok_{true};

  bool show_events_window_{true};
};

} // namespace gradostroi::ui
