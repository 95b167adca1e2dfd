#include <iostream>

int test_resources();
int test_ecosystem();
int test_calendar();
int test_market();
int test_production();
int test_progression();
int test_characters();
int test_victory();
int test_simulation();
int test_serialization();
int test_determinism();
int test_digests();
int test_content_validation();
int test_state_validation();
int test_file_io();
int test_json_errors();
int test_autosave();
int test_strings();

int main() {
  int fails = 0;
  fails += test_resources();
  fails += test_ecosystem();
  fails += test_calendar();
  fails += test_market();
  fails += test_production();
  fails += test_progression();
  fails += test_characters();
  fails += test_victory();
  fails += test_simulation();
  fails += test_serialization();
  fails += test_determinism();
  fails += test_digests();
  fails += test_content_validation();
  fails += test_state_validation();
  fails += test_file_io();
  fails += test_json_errors();
  fails += test_autosave();
  fails += test_strings();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
