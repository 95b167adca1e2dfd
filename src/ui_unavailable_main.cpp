#include <iostream>
#include <string_view>

#ifndef GRADOSTROI_VERSION
#define GRADOSTROI_VERSION "unknown"
#endif

#ifndef GRADOSTROI_UI_UNAVAILABLE_REASON
#define GRADOSTROI_UI_UNAVAILABLE_REASON "UI dependencies are unavailable in this build."
#endif

namespace {

constexpr int kExitCodeOk = 0;
constexpr int kExitCodeUiRequiredUnavailable = 2;

bool has_flag(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (!arg) continue;
    if (flag == arg) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  const char* name = (exe && *exe) ? exe : "gradostroi";
  std::cout << "Gradostroi UI launcher v" << GRADOSTROI_VERSION << "\n\n";
  std::cout << "Usage: " << name << " [--help] [--version] [--require-ui]\n\n";
  std::cout << "This build does not include the settlement dashboard.\n";
  std::cout << "Reason: " << GRADOSTROI_UI_UNAVAILABLE_REASON << "\n\n";
  std::cout << "To play in this build, use the command-line driver:\n";
  std::cout << "  gradostroi_cli --action \"mine fell_timber\" --days 10 --status\n\n";
  std::cout << "To build the dashboard, install SDL2 and Dear ImGui and reconfigure\n";
  std::cout << "with -DGRADOSTROI_BUILD_UI=ON (point IMGUI_DIR at the ImGui sources).\n";
}

} // namespace

int main(int argc, char** argv) {
  if (has_flag(argc, argv, "--version")) {
    std::cout << GRADOSTROI_VERSION << "\n";
    return 0;
  }

  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage(argv[0]);
    return 0;
  }

  std::cerr << "Gradostroi UI is unavailable in this build.\n";
  std::cerr << "Reason: " << GRADOSTROI_UI_UNAVAILABLE_REASON << "\n";
  std::cerr << "Run with --help for details.\n";
  return has_flag(argc, argv, "--require-ui") ? kExitCodeUiRequiredUnavailable : kExitCodeOk;
}
