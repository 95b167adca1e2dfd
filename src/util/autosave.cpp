#include "gradostroi/util/autosave.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "gradostroi/core/game_state.h"
#include "gradostroi/util/file_io.h"
#include "gradostroi/util/log.h"

namespace gradostroi {
namespace {

namespace fs = std::filesystem;

constexpr int kDayDigits = 5;
constexpr int kMaxSameDaySaves = 10000;

std::string stamp(const AutosaveConfig& cfg, int day) {
  std::string digits = std::to_string(std::max(0, day));
  if (digits.size() < static_cast<std::size_t>(kDayDigits)) digits.insert(0, kDayDigits - digits.size(), '0');
  return cfg.prefix + "day" + digits;
}

bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// "<prefix>day00015<ext>" -> {15, 0}; "<prefix>day00015_2<ext>" -> {15, 2}.
// Anything else is not ours.
std::optional<AutosaveInfo> parse_name(const AutosaveConfig& cfg, const std::string& name) {
  const std::string lead = cfg.prefix + "day";
  if (name.size() <= lead.size() + cfg.extension.size()) return std::nullopt;
  if (name.compare(0, lead.size(), lead) != 0) return std::nullopt;
  if (name.compare(name.size() - cfg.extension.size(), cfg.extension.size(), cfg.extension) != 0) {
    return std::nullopt;
  }

  const std::string stem = name.substr(lead.size(), name.size() - lead.size() - cfg.extension.size());
  const auto us = stem.find('_');
  const std::string day_part = stem.substr(0, us);
  const std::string seq_part = us == std::string::npos ? std::string() : stem.substr(us + 1);
  if (!all_digits(day_part)) return std::nullopt;
  if (us != std::string::npos && !all_digits(seq_part)) return std::nullopt;

  AutosaveInfo info;
  info.filename = name;
  info.day = std::stoi(day_part);
  info.sequence = seq_part.empty() ? 0 : std::stoi(seq_part);
  return info;
}

std::vector<AutosaveInfo> collect(const AutosaveConfig& cfg) {
  std::vector<AutosaveInfo> out;
  if (cfg.dir.empty()) return out;

  const fs::path dir(cfg.dir);
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return out;

  fs::directory_iterator it(dir, ec);
  if (ec) throw std::runtime_error("cannot list autosave directory " + cfg.dir + ": " + ec.message());
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) throw std::runtime_error("cannot list autosave directory " + cfg.dir + ": " + ec.message());
    if (!it->is_regular_file(ec)) continue;

    auto info = parse_name(cfg, it->path().filename().string());
    if (!info) continue;
    info->path = it->path().string();
    info->size_bytes = it->file_size(ec);
    if (ec) {
      info->size_bytes = 0;
      ec.clear();
    }
    out.push_back(std::move(*info));
  }

  std::sort(out.begin(), out.end(), [](const AutosaveInfo& a, const AutosaveInfo& b) {
    if (a.day != b.day) return a.day > b.day;
    return a.sequence > b.sequence;
  });
  return out;
}

fs::path next_free_path(const AutosaveConfig& cfg, int day) {
  const fs::path dir(cfg.dir);
  const std::string base = stamp(cfg, day);
  for (int seq = 0; seq < kMaxSameDaySaves; ++seq) {
    const std::string name = seq == 0 ? base + cfg.extension : base + "_" + std::to_string(seq) + cfg.extension;
    std::error_code ec;
    if (!fs::exists(dir / name, ec) && !ec) return dir / name;
  }
  throw std::runtime_error("too many autosaves for day " + std::to_string(day));
}

} // namespace

AutosaveScanResult scan_autosaves(const AutosaveConfig& cfg, int max_files) {
  AutosaveScanResult out;
  if (max_files <= 0) {
    out.ok = true;
    return out;
  }
  try {
    out.files = collect(cfg);
  } catch (const std::exception& e) {
    out.error = e.what();
    return out;
  }
  if (static_cast<int>(out.files.size()) > max_files) out.files.resize(static_cast<std::size_t>(max_files));
  out.ok = true;
  return out;
}

int prune_autosaves(const AutosaveConfig& cfg, std::string* error) {
  if (cfg.keep_files <= 0) return 0;

  std::vector<AutosaveInfo> files;
  try {
    files = collect(cfg);
  } catch (const std::exception& e) {
    if (error) *error = e.what();
    return -1;
  }

  int removed = 0;
  for (std::size_t i = static_cast<std::size_t>(cfg.keep_files); i < files.size(); ++i) {
    std::error_code ec;
    if (fs::remove(fs::path(files[i].path), ec)) ++removed;
  }
  return removed;
}

void AutosaveManager::reset() {
  last_day_ = -1;
  last_path_.clear();
}

AutosaveResult AutosaveManager::autosave(const GameState& state, const AutosaveConfig& cfg,
                                         const std::function<std::string()>& serialize_json) {
  AutosaveResult r;
  if (!cfg.enabled) return r;
  if (cfg.dir.empty() || cfg.prefix.empty()) {
    r.error = "autosave needs a directory and a file prefix";
    return r;
  }

  try {
    ensure_dir(cfg.dir);
    const fs::path path = next_free_path(cfg, state.day);
    write_text_file(path.string(), serialize_json());
    r.path = path.string();
  } catch (const std::exception& e) {
    r.error = e.what();
    return r;
  }

  r.saved = true;
  last_day_ = state.day;
  last_path_ = r.path;

  std::string prune_error;
  const int pruned = prune_autosaves(cfg, &prune_error);
  if (pruned < 0) log::warn("Autosave pruning failed: " + prune_error);
  r.pruned = std::max(0, pruned);
  return r;
}

} // namespace gradostroi
