#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace gradostroi {

struct GameState;

// Rolling day-stamped autosaves. Files are written with write_text_file's
// temp+rename strategy; only the newest `keep_files` are kept.
struct AutosaveConfig {
  bool enabled{true};

  // Days between autosaves. Values <= 0 disable autosaving.
  int interval_days{5};

  // How many autosaves to keep (newest first).
  // Values <= 0 disable pruning.
  int keep_files{10};

  std::string dir{"saves/autosaves"};
  std::string prefix{"autosave_"};

  // File extension (including dot).
  std::string extension{".json"};
};

struct AutosaveInfo {
  std::string path;
  std::string filename;
  int day{0};
  // 0 for the first save of a day, then 1, 2, ... ("_1", "_2" suffixes).
  int sequence{0};
  std::uintmax_t size_bytes{0};
};

struct AutosaveScanResult {
  bool ok{false};
  std::string error;
  std::vector<AutosaveInfo> files;
};

struct AutosaveResult {
  bool saved{false};
  std::string path;
  int pruned{0};
  std::string error;
};

// Lists the day-stamped autosaves in cfg.dir, latest day first. Other files
// are ignored.
AutosaveScanResult scan_autosaves(const AutosaveConfig& cfg, int max_files = 32);

// Deletes autosaves beyond cfg.keep_files. Returns the number removed, or -1
// if the directory could not be listed.
int prune_autosaves(const AutosaveConfig& cfg, std::string* error = nullptr);

// Writes day-stamped snapshots ("autosave_day00015.json") and remembers the
// last one for status displays.
class AutosaveManager {
 public:
  AutosaveManager() = default;

  void reset();

  // Unconditionally write an autosave snapshot, then prune.
  //
  // serialize_json must return a complete save-game JSON string.
  AutosaveResult autosave(const GameState& state, const AutosaveConfig& cfg,
                          const std::function<std::string()>& serialize_json);

  const std::string& last_autosave_path() const { return last_path_; }
  int last_autosave_day() const { return last_day_; }

 private:
  int last_day_{-1};
  std::string last_path_;
};

} // namespace gradostroi
