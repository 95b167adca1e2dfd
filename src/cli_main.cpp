#include <algorithm>
#include <climits>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gradostroi/core/content.h"
#include "gradostroi/core/content_validation.h"
#include "gradostroi/core/enum_strings.h"
#include "gradostroi/core/relationships.h"
#include "gradostroi/core/serialization.h"
#include "gradostroi/core/simulation.h"
#include "gradostroi/core/state_validation.h"
#include "gradostroi/util/autosave.h"
#include "gradostroi/util/digest.h"
#include "gradostroi/util/file_io.h"
#include "gradostroi/util/log.h"
#include "gradostroi/util/strings.h"

namespace {

#ifndef GRADOSTROI_VERSION
#define GRADOSTROI_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

// Every occurrence of a repeatable option, in command-line order.
std::vector<std::string> get_all_str_args(int argc, char** argv, const std::string& key) {
  std::vector<std::string> out;
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) out.push_back(argv[i + 1]);
  }
  return out;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

const char* event_level_label(gradostroi::EventLevel l) {
  switch (l) {
    case gradostroi::EventLevel::Info: return "INFO";
    case gradostroi::EventLevel::Warn: return "WARN";
    case gradostroi::EventLevel::Error: return "ERROR";
  }
  return "INFO";
}

void print_usage(const char* exe) {
  std::cout << "Gradostroi CLI v" << GRADOSTROI_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "gradostroi_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --days N            Advance the simulation by N days after the actions (default: 0)\n";
  std::cout << "  --seed N            World seed for a new game (default: 1)\n";
  std::cout << "  --difficulty NAME   easy|normal|hard for a new game (default: normal)\n";
  std::cout << "  --content PATH      Content JSON (default: built-in content)\n";
  std::cout << "  --load PATH         Load a save JSON (falls back to a new game if it is unusable)\n";
  std::cout << "  --save PATH         Save state JSON at the end\n";
  std::cout << "  --format-save       Load + re-save (canonicalize JSON) without advancing\n";
  std::cout << "  --validate-content  Validate the content and exit\n";
  std::cout << "  --action \"CMD\"      Run one player action (repeatable, in order)\n";
  std::cout << "  --script PATH       Run player actions from a file (one per line, '#' comments)\n";
  std::cout << "  --autosave-dir DIR  Write rolling autosaves to DIR\n";
  std::cout << "  --autosave-every N  Days between autosaves (default: 5)\n";
  std::cout << "  --autosave-keep N   Autosaves to keep (default: 10)\n";
  std::cout << "  --status            Print a settlement summary\n";
  std::cout << "  --prices            Print current price quotes\n";
  std::cout << "  --characters        Print relationships and open quests\n";
  std::cout << "  --legacy            Print the final legacy report\n";
  std::cout << "  --digest            Print state and content digests\n";
  std::cout << "  --dump-events       Print the persistent event log\n";
  std::cout << "    --events-last N   Only print the last N events (0 = all)\n";
  std::cout << "  --dump              Print the resulting save JSON to stdout\n";
  std::cout << "  --log-level LEVEL   debug|info|warn|error|off (default: warn)\n";
  std::cout << "  --quiet             Suppress non-essential output\n";
  std::cout << "  -h, --help          Show this help\n";
  std::cout << "  --version           Print version and exit\n\n";
  std::cout << "Actions:\n";
  std::cout << "  mine ID | build TYPE | storage | assign TYPE N | craft ID | study RESOURCE\n";
  std::cout << "  tech ID | secret ID | buy RESOURCE N | sell RESOURCE N | talk CHARACTER\n";
  std::cout << "  deal CHARACTER RESOURCE N | quest CHARACTER QUEST | multiplier | difficulty NAME\n";
  std::cout << "  end_day | days N\n";
}

// Parses and runs one scripted action. Returns false (with a message in
// *error) for malformed commands; domain failures are reported through the
// returned ActionResult instead.
bool run_action(gradostroi::Simulation& sim, const std::string& line, gradostroi::ActionResult* out,
                std::string* error) {
  using namespace gradostroi;

  std::vector<std::string> words;
  for (const auto& w : split(trim_copy(line), ' ')) {
    if (!w.empty()) words.push_back(w);
  }
  if (words.empty()) {
    *error = "empty action";
    return false;
  }

  const std::string cmd = to_lower(words[0]);
  auto need = [&](std::size_t n) {
    if (words.size() == n + 1) return true;
    *error = "'" + cmd + "' expects " + std::to_string(n) + " argument(s)";
    return false;
  };
  auto resource = [&](const std::string& raw, Resource* r) {
    const auto parsed = resource_from_string(raw);
    if (!parsed) {
      *error = "unknown resource '" + raw + "'";
      return false;
    }
    *r = *parsed;
    return true;
  };
  auto building = [&](const std::string& raw, BuildingType* t) {
    const auto parsed = building_type_from_string(raw);
    if (!parsed) {
      *error = "unknown building type '" + raw + "'";
      return false;
    }
    *t = *parsed;
    return true;
  };
  auto number = [&](const std::string& raw, double* v) {
    try {
      std::size_t used = 0;
      *v = std::stod(raw, &used);
      if (used != raw.size()) throw std::invalid_argument(raw);
      return true;
    } catch (const std::exception&) {
      *error = "not a number: '" + raw + "'";
      return false;
    }
  };

  auto count = [&](const std::string& raw, int* v) {
    if (parse_count(raw, v)) return true;
    *error = "not a count in [0, " + std::to_string(INT_MAX) + "]: '" + raw + "'";
    return false;
  };

  if (cmd == "end_day") {
    if (!need(0)) return false;
    sim.end_day();
    *out = ActionResult::success("day " + std::to_string(sim.state().day));
    return true;
  }
  if (cmd == "days") {
    int n = 0;
    if (!need(1) || !count(words[1], &n)) return false;
    sim.advance_days(n);
    *out = ActionResult::success("day " + std::to_string(sim.state().day));
    return true;
  }
  if (cmd == "multiplier") {
    if (!need(0)) return false;
    *out = ActionResult::success("multiplier x" + std::to_string(sim.toggle_multiplier()));
    return true;
  }
  if (cmd == "difficulty") {
    if (!need(1)) return false;
    const auto d = difficulty_from_string(words[1]);
    if (!d) {
      *error = "unknown difficulty '" + words[1] + "'";
      return false;
    }
    *out = sim.set_difficulty(*d);
    return true;
  }

  // Everything below is a player action taken during the current day.
  sim.begin_day();

  if (cmd == "mine") {
    if (!need(1)) return false;
    *out = sim.mine(words[1]);
  } else if (cmd == "build") {
    BuildingType t{};
    if (!need(1) || !building(words[1], &t)) return false;
    *out = sim.build(t);
  } else if (cmd == "storage") {
    if (!need(0)) return false;
    *out = sim.build_storage();
  } else if (cmd == "assign") {
    BuildingType t{};
    int n = 0;
    if (!need(2) || !building(words[1], &t) || !count(words[2], &n)) return false;
    *out = sim.assign_workers(t, n);
  } else if (cmd == "craft") {
    if (!need(1)) return false;
    *out = sim.craft(words[1]);
  } else if (cmd == "study") {
    Resource r{};
    if (!need(1) || !resource(words[1], &r)) return false;
    *out = sim.research_resource(r);
  } else if (cmd == "tech") {
    if (!need(1)) return false;
    *out = sim.research_technology(words[1]);
  } else if (cmd == "secret") {
    if (!need(1)) return false;
    *out = sim.discover_secret(words[1]);
  } else if (cmd == "buy" || cmd == "sell") {
    Resource r{};
    double n = 0.0;
    if (!need(2) || !resource(words[1], &r) || !number(words[2], &n)) return false;
    *out = sim.trade(r, n, cmd == "buy");
  } else if (cmd == "talk") {
    if (!need(1)) return false;
    *out = sim.talk(words[1]);
  } else if (cmd == "deal") {
    Resource r{};
    double n = 0.0;
    if (!need(3) || !resource(words[2], &r) || !number(words[3], &n)) return false;
    *out = sim.trade_with_character(words[1], r, n);
  } else if (cmd == "quest") {
    if (!need(2)) return false;
    *out = sim.complete_quest(words[1], words[2]);
  } else {
    *error = "unknown action '" + cmd + "'";
    return false;
  }
  return true;
}

std::vector<std::string> read_script_lines(const std::string& path) {
  std::vector<std::string> out;
  for (const auto& raw : gradostroi::split(gradostroi::read_text_file(path), '\n')) {
    const std::string line = gradostroi::trim_copy(raw);
    if (line.empty() || line[0] == '#') continue;
    out.push_back(line);
  }
  return out;
}

// Loads a save for play. Unreadable or inconsistent saves are reported and
// replaced by a fresh game.
void load_or_fall_back(gradostroi::Simulation& sim, const std::string& path, const gradostroi::NewGameConfig& fresh) {
  try {
    gradostroi::GameState loaded = gradostroi::load_game_from_file(path);
    const auto errors = gradostroi::validate_game_state(loaded, &sim.content(), sim.cfg().storage);
    if (errors.empty()) {
      sim.load_game(std::move(loaded));
      return;
    }
    gradostroi::log::warn("Save '" + path + "' failed validation (" + std::to_string(errors.size()) +
                          " errors, first: " + errors.front() + "); starting a new game");
  } catch (const std::exception& e) {
    gradostroi::log::warn(std::string(e.what()) + "; starting a new game");
  }
  sim.new_game(fresh);
}

void print_status(const gradostroi::Simulation& sim) {
  using namespace gradostroi;
  const SettlementSnapshot snap = sim.snapshot();

  std::cout << "Day " << snap.day << " (x" << snap.multiplier << ")\n";
  std::cout << "  Population: " << snap.population << " (" << snap.idle_workers << " idle), happiness "
            << format_fixed(snap.happiness, 1) << "\n";
  std::cout << "  Research: " << format_fixed(snap.research) << (snap.research_complete ? " (complete)" : "")
            << "\n";
  std::cout << "  Ecosystem: " << format_fixed(snap.ecosystem_health, 1) << " ("
            << ecosystem_tier_label(snap.ecosystem_tier) << ", production x" << format_fixed(snap.production_modifier)
            << "), pollution " << format_fixed(snap.ecosystem.pollution) << ", biodiversity "
            << format_fixed(snap.ecosystem.biodiversity, 1) << "\n";
  std::cout << "  Biomes:";
  for (std::size_t i = 0; i < kBiomeCount; ++i) {
    std::cout << " " << biome_to_string(static_cast<Biome>(i)) << "=" << format_fixed(snap.ecosystem.biomes[i], 1);
  }
  std::cout << "\n";
  if (snap.hostility != 1.0) std::cout << "  Hostility x" << format_fixed(snap.hostility, 3) << "\n";
  if (snap.market_event_active) std::cout << "  Market event in progress\n";
  if (snap.victory_achieved && snap.victory_category) {
    std::cout << "  Victory: " << victory_category_to_string(*snap.victory_category) << "\n";
  }

  std::cout << "  Storage: " << snap.storage_units << " units, capacity " << format_fixed(snap.storage_capacity, 0)
            << "\n";
  std::cout << "  Stock:";
  for (Resource r : all_resources()) {
    const double v = snap.resources[resource_index(r)];
    if (v <= 0.0) continue;
    std::cout << " " << resource_to_string(r) << "=" << format_fixed(v);
  }
  std::cout << "\n";

  std::cout << "  Buildings:";
  bool any = false;
  for (BuildingType t : all_building_types()) {
    const std::size_t i = building_index(t);
    if (snap.buildings[i] <= 0) continue;
    any = true;
    std::cout << " " << building_type_to_string(t) << "=" << snap.buildings[i] << " (" << snap.workers[i]
              << " workers)";
  }
  std::cout << (any ? "\n" : " none\n");
}

void print_prices(const gradostroi::Simulation& sim) {
  using namespace gradostroi;
  std::cout << "Prices (in " << resource_to_string(kCurrencyResource) << "):\n";
  for (Resource r : all_resources()) {
    if (r == kCurrencyResource) continue;
    std::cout << "  " << resource_to_string(r) << "\t" << format_fixed(sim.quote_price(r)) << "\n";
  }
}

void print_characters(const gradostroi::Simulation& sim) {
  using namespace gradostroi;
  const auto& st = sim.state();
  std::vector<std::string> ids;
  for (const auto& kv : st.characters) ids.push_back(kv.first);
  std::sort(ids.begin(), ids.end());

  std::cout << "Characters:\n";
  for (const auto& id : ids) {
    const CharacterState& c = st.characters.at(id);
    const auto* def = find_ptr(sim.content().characters, id);
    std::cout << "  " << id << "\t" << (def ? def->name : std::string("(unknown)")) << "\t" << format_fixed(c.score, 1)
              << " (" << relationship_tier_label(relationship_tier(c.score)) << ")\n";
    for (const auto& q : c.open_quests) {
      const auto* quest = find_ptr(sim.content().quests, q);
      std::cout << "    quest " << q << (quest ? ": " + quest->title : std::string()) << "\n";
    }
  }
}

void print_legacy(const gradostroi::Simulation& sim) {
  using namespace gradostroi;
  const LegacyReport rep = sim.final_legacy();
  std::cout << "Legacy: " << rep.title << " (" << victory_category_to_string(rep.category) << ", "
            << format_fixed(rep.score, 1) << ")\n";
  for (std::size_t i = 0; i < kVictoryCategoryCount; ++i) {
    std::cout << "  " << victory_category_to_string(static_cast<VictoryCategory>(i)) << "\t"
              << format_fixed(rep.scores[i], 1) << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << GRADOSTROI_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    {
      const std::string level_raw = get_str_arg(argc, argv, "--log-level", "warn");
      gradostroi::log::Level lvl = gradostroi::log::Level::Warn;
      if (!gradostroi::log::parse_level(level_raw, &lvl)) {
        std::cerr << "Unknown --log-level: '" << level_raw << "'\n\n";
        print_usage(argv[0]);
        return 2;
      }
      gradostroi::log::set_level(lvl);
    }

    int days = 0;
    {
      const std::string days_raw = get_str_arg(argc, argv, "--days", "0");
      if (!gradostroi::parse_count(days_raw, &days)) {
        std::cerr << "Invalid --days: '" << days_raw << "'\n\n";
        print_usage(argv[0]);
        return 2;
      }
    }
    const int seed = get_int_arg(argc, argv, "--seed", 1);
    const std::string difficulty_raw = get_str_arg(argc, argv, "--difficulty", "normal");
    const std::string content_path = get_str_arg(argc, argv, "--content", "");
    const std::string load_path = get_str_arg(argc, argv, "--load", "");
    const std::string save_path = get_str_arg(argc, argv, "--save", "");
    const std::string script_path = get_str_arg(argc, argv, "--script", "");
    const std::string autosave_dir = get_str_arg(argc, argv, "--autosave-dir", "");
    const int events_last = get_int_arg(argc, argv, "--events-last", 0);

    const bool quiet = has_flag(argc, argv, "--quiet");

    if (has_flag(argc, argv, "--format-save")) {
      if (load_path.empty() || save_path.empty()) {
        std::cerr << "--format-save requires both --load and --save\n\n";
        print_usage(argv[0]);
        return 2;
      }
      const auto loaded = gradostroi::load_game_from_file(load_path);
      gradostroi::save_game_to_file(save_path, loaded);
      if (!quiet) std::cout << "Formatted save written to " << save_path << "\n";
      return 0;
    }

    auto content = content_path.empty() ? gradostroi::default_content_db()
                                        : gradostroi::load_content_db_from_file(content_path);

    {
      const auto errors = gradostroi::validate_content_db(content);
      if (has_flag(argc, argv, "--validate-content")) {
        if (!errors.empty()) {
          std::cerr << "Content validation failed:\n";
          for (const auto& e : errors) std::cerr << "  - " << e << "\n";
          return 1;
        }
        if (!quiet) std::cout << "Content OK\n";
        return 0;
      }
      if (!errors.empty()) {
        for (const auto& e : errors) gradostroi::log::error("Content: " + e);
        return 1;
      }
    }

    const auto difficulty = gradostroi::difficulty_from_string(difficulty_raw);
    if (!difficulty) {
      std::cerr << "Unknown --difficulty: '" << difficulty_raw << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }

    gradostroi::NewGameConfig fresh;
    fresh.seed = static_cast<std::uint64_t>(seed);
    fresh.difficulty = *difficulty;

    gradostroi::AutosaveConfig autosave_cfg;
    autosave_cfg.enabled = !autosave_dir.empty();
    autosave_cfg.dir = autosave_dir;
    autosave_cfg.interval_days = get_int_arg(argc, argv, "--autosave-every", autosave_cfg.interval_days);
    autosave_cfg.keep_files = get_int_arg(argc, argv, "--autosave-keep", autosave_cfg.keep_files);

    gradostroi::SimConfig sim_cfg;
    sim_cfg.autosave_interval_days = autosave_cfg.enabled ? autosave_cfg.interval_days : 0;

    gradostroi::Simulation sim(std::move(content), sim_cfg);
    if (!load_path.empty()) {
      load_or_fall_back(sim, load_path, fresh);
    } else {
      sim.new_game(fresh);
    }

    gradostroi::AutosaveManager autosaver;
    if (autosave_cfg.enabled) {
      sim.set_autosave_hook([&](const gradostroi::GameState& st) {
        const auto r = autosaver.autosave(st, autosave_cfg, [&] { return gradostroi::serialize_game_to_json(st); });
        if (!r.saved) {
          gradostroi::log::warn("Autosave failed: " + r.error);
        } else {
          gradostroi::log::info("Autosaved to " + r.path);
        }
      });
    }

    std::vector<std::string> actions;
    if (!script_path.empty()) actions = read_script_lines(script_path);
    for (auto& a : get_all_str_args(argc, argv, "--action")) actions.push_back(std::move(a));

    int failed_actions = 0;
    for (const auto& line : actions) {
      gradostroi::ActionResult res;
      std::string error;
      if (!run_action(sim, line, &res, &error)) {
        std::cerr << "Bad action '" << line << "': " << error << "\n";
        return 2;
      }
      if (!res.ok()) ++failed_actions;
      if (!quiet) {
        std::cout << "> " << line << "\n  " << gradostroi::action_status_label(res.status);
        if (!res.message.empty()) std::cout << ": " << res.message;
        std::cout << "\n";
      }
    }

    if (days > 0) sim.advance_days(days);

    const auto& s = sim.state();
    if (!quiet) {
      std::cout << "Day " << s.day << ", population " << s.population << ", "
                << gradostroi::format_fixed(gradostroi::legacy_inputs(s).non_currency_wealth) << " goods, "
                << gradostroi::format_fixed(s.resources[gradostroi::resource_index(gradostroi::kCurrencyResource)])
                << " wine";
      if (failed_actions > 0) std::cout << " (" << failed_actions << " action(s) failed)";
      std::cout << "\n";
    }

    if (has_flag(argc, argv, "--status")) print_status(sim);
    if (has_flag(argc, argv, "--prices")) print_prices(sim);
    if (has_flag(argc, argv, "--characters")) print_characters(sim);
    if (has_flag(argc, argv, "--legacy")) print_legacy(sim);

    if (has_flag(argc, argv, "--digest")) {
      std::cout << "State digest: " << gradostroi::digest64_to_hex(gradostroi::digest_game_state64(s)) << "\n";
      std::cout << "Content digest: " << gradostroi::digest64_to_hex(gradostroi::digest_content_db64(sim.content()))
                << "\n";
    }

    if (has_flag(argc, argv, "--dump-events")) {
      std::size_t first = 0;
      if (events_last > 0 && s.events.size() > static_cast<std::size_t>(events_last)) {
        first = s.events.size() - static_cast<std::size_t>(events_last);
      }
      std::cout << "Events: " << (s.events.size() - first) << "\n";
      for (std::size_t i = first; i < s.events.size(); ++i) {
        const auto& ev = s.events[i];
        std::cout << "  [day " << ev.day << "] #" << static_cast<unsigned long long>(ev.seq) << " ["
                  << gradostroi::event_category_to_string(ev.category) << "] " << event_level_label(ev.level) << ": "
                  << ev.message << "\n";
      }
    }

    if (!save_path.empty()) {
      gradostroi::save_game_to_file(save_path, s);
      if (!quiet) std::cout << "Saved to " << save_path << "\n";
    }

    if (has_flag(argc, argv, "--dump")) {
      std::cout << "\n--- JSON ---\n" << gradostroi::serialize_game_to_json(s) << "\n";
    }

    return 0;
  } catch (const std::exception& e) {
    gradostroi::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
