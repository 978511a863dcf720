#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<tallykeep::tests::TestCase> &tests);
void register_config_tests(std::vector<tallykeep::tests::TestCase> &tests);
void register_usage_statistics_tests(std::vector<tallykeep::tests::TestCase> &tests);
void register_file_store_tests(std::vector<tallykeep::tests::TestCase> &tests);
void register_file_persister_tests(std::vector<tallykeep::tests::TestCase> &tests);
void register_runtime_tests(std::vector<tallykeep::tests::TestCase> &tests);
void register_gateway_tests(std::vector<tallykeep::tests::TestCase> &tests);
void register_observability_health_tests(std::vector<tallykeep::tests::TestCase> &tests);
void register_cli_tests(std::vector<tallykeep::tests::TestCase> &tests);
void register_persistence_integration_tests(std::vector<tallykeep::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<tallykeep::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_usage_statistics_tests(tests);
  register_file_store_tests(tests);
  register_file_persister_tests(tests);
  register_runtime_tests(tests);
  register_gateway_tests(tests);
  register_observability_health_tests(tests);
  register_cli_tests(tests);
  register_persistence_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
