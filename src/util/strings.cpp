#include "gradostroi/util/strings.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <iomanip>
#include <sstream>

namespace gradostroi {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim_copy(const std::string& s) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto b = std::find_if(s.begin(), s.end(), not_space);
  auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::vector<std::string> split(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == sep) {
      out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(cur);
  return out;
}

bool parse_count(const std::string& text, int* out) {
  if (text.empty()) return false;
  long long v = 0;
  for (unsigned char c : text) {
    if (!std::isdigit(c)) return false;
    v = v * 10 + (c - '0');
    if (v > INT_MAX) return false;
  }
  *out = static_cast<int>(v);
  return true;
}

std::string format_fixed(double v, int decimals) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(std::max(0, decimals)) << v;
  return ss.str();
}

} // namespace gradostroi
