#pragma once

#include <string>
#include <vector>

namespace gradostroi {

std::string to_lower(std::string s);

std::string trim_copy(const std::string& s);

// Splits on a single separator character. Empty fields are kept.
std::vector<std::string> split(const std::string& s, char sep);

// Non-negative whole number in [0, INT_MAX], digits only. Leaves *out
// untouched and returns false otherwise.
bool parse_count(const std::string& text, int* out);

// Fixed-point formatting used by the CLI and UI ("12.50").
std::string format_fixed(double v, int decimals = 2);

} // namespace gradostroi
