#include "gradostroi/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace gradostroi {

namespace fs = std::filesystem;

namespace {

fs::path temp_sibling(const fs::path& target) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::string base = target.filename().string() + ".tmp." + std::to_string(stamp);
  for (int attempt = 0; attempt < 100; ++attempt) {
    const std::string name = attempt == 0 ? base : base + "." + std::to_string(attempt);
    fs::path candidate = target.has_parent_path() ? target.parent_path() / name : fs::path(name);
    std::error_code ec;
    if (!fs::exists(candidate, ec) && !ec) return candidate;
  }
  return target.has_parent_path() ? target.parent_path() / base : fs::path(base);
}

// Removes the temp file unless the write was committed.
class TempFileGuard {
 public:
  explicit TempFileGuard(fs::path p) : path_(std::move(p)) {}
  ~TempFileGuard() {
    if (!armed_) return;
    std::error_code ec;
    fs::remove(path_, ec);
  }
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

  void commit() { armed_ = false; }

 private:
  fs::path path_;
  bool armed_{true};
};

fs::path resolve_read_path(const fs::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute() || fs::exists(requested, ec)) return requested;

  std::vector<fs::path> roots;
#ifdef GRADOSTROI_SOURCE_DIR
  roots.emplace_back(GRADOSTROI_SOURCE_DIR);
#endif
  ec.clear();
  fs::path cur = fs::current_path(ec);
  for (int depth = 0; !ec && !cur.empty() && depth < 8; ++depth) {
    roots.push_back(cur);
    const fs::path parent = cur.parent_path();
    if (parent == cur) break;
    cur = parent;
  }

  for (const auto& root : roots) {
    const fs::path candidate = root / requested;
    ec.clear();
    if (fs::exists(candidate, ec) && !ec) return candidate;
  }
  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path resolved = resolve_read_path(fs::path(path));
  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  return fs::is_regular_file(resolve_read_path(fs::path(path)), ec) && !ec;
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  if (target.has_parent_path()) ensure_dir(target.parent_path().string());

  const fs::path tmp = temp_sibling(target);
  TempFileGuard guard(tmp);
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    fs::remove(target, rm_ec);
    ec.clear();
    fs::rename(tmp, target, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  guard.commit();
}

} // namespace gradostroi
