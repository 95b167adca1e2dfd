#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "gradostroi/core/content.h"
#include "gradostroi/core/serialization.h"
#include "gradostroi/core/simulation.h"
#include "gradostroi/util/autosave.h"
#include "gradostroi/util/file_io.h"

#define GD_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_autosave() {
  namespace fs = std::filesystem;
  using namespace gradostroi;

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "gradostroi_test_autosave";
  dir /= std::to_string(static_cast<long long>(nonce));

  fs::create_directories(dir, ec);
  GD_ASSERT(!ec);

  AutosaveConfig cfg;
  cfg.keep_files = 3;
  cfg.dir = dir.string();

  GameState st;
  AutosaveManager mgr;
  GD_ASSERT(mgr.last_autosave_day() == -1);

  // Day-stamped file names.
  {
    st.day = 5;
    const AutosaveResult r = mgr.autosave(st, cfg, [] { return std::string("{\"a\":1}\n"); });
    GD_ASSERT(r.saved);
    GD_ASSERT(fs::path(r.path).filename().string() == "autosave_day00005.json");
    GD_ASSERT(read_text_file(r.path).find("\"a\":1") != std::string::npos);
    GD_ASSERT(mgr.last_autosave_day() == 5);
    GD_ASSERT(mgr.last_autosave_path() == r.path);
  }

  // Saving the same day twice does not overwrite.
  {
    const AutosaveResult r = mgr.autosave(st, cfg, [] { return std::string("{}\n"); });
    GD_ASSERT(r.saved);
    GD_ASSERT(fs::path(r.path).filename().string() != "autosave_day00005.json");
  }

  // Rotation keeps the newest keep_files.
  for (int day = 10; day <= 30; day += 5) {
    st.day = day;
    const AutosaveResult r = mgr.autosave(st, cfg, [] { return std::string("{}\n"); });
    GD_ASSERT(r.saved);
  }
  {
    const AutosaveScanResult scan = scan_autosaves(cfg);
    GD_ASSERT(scan.ok);
    GD_ASSERT(scan.files.size() == 3);
  }

  // Unrelated files are left alone.
  write_text_file((dir / "notes.txt").string(), "keep me\n");
  GD_ASSERT(prune_autosaves(cfg) == 0);
  GD_ASSERT(fs::exists(dir / "notes.txt"));

  // Disabled config writes nothing.
  {
    AutosaveConfig off = cfg;
    off.enabled = false;
    const AutosaveResult r = mgr.autosave(st, off, [] { return std::string("{}\n"); });
    GD_ASSERT(!r.saved);
  }

  // Hooked into the simulation: real saves that load back.
  {
    AutosaveConfig sim_cfg = cfg;
    sim_cfg.dir = (dir / "sim").string();
    sim_cfg.keep_files = 2;

    SimConfig sc;
    sc.autosave_interval_days = 3;
    Simulation sim(default_content_db(), sc);
    AutosaveManager sim_mgr;
    sim.set_autosave_hook([&](const GameState& s) {
      (void)sim_mgr.autosave(s, sim_cfg, [&] { return serialize_game_to_json(s); });
    });
    sim.advance_days(10);

    GD_ASSERT(sim_mgr.last_autosave_day() == 9);
    const AutosaveScanResult scan = scan_autosaves(sim_cfg);
    GD_ASSERT(scan.ok);
    GD_ASSERT(scan.files.size() == 2);
    const GameState loaded = load_game_from_file(sim_mgr.last_autosave_path());
    GD_ASSERT(loaded.day == 9);
  }

  fs::remove_all(dir, ec);
  return 0;
}
