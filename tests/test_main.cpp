#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<mcpbridge::tests::TestCase> &tests);
void register_rpc_tests(std::vector<mcpbridge::tests::TestCase> &tests);
void register_config_tests(std::vector<mcpbridge::tests::TestCase> &tests);
void register_accounts_tests(std::vector<mcpbridge::tests::TestCase> &tests);
void register_observability_tests(std::vector<mcpbridge::tests::TestCase> &tests);
void register_session_state_tests(std::vector<mcpbridge::tests::TestCase> &tests);
void register_interceptor_tests(std::vector<mcpbridge::tests::TestCase> &tests);
void register_request_rewriter_tests(std::vector<mcpbridge::tests::TestCase> &tests);
void register_transport_tests(std::vector<mcpbridge::tests::TestCase> &tests);
void register_response_rewriter_tests(std::vector<mcpbridge::tests::TestCase> &tests);
void register_proxy_tests(std::vector<mcpbridge::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<mcpbridge::tests::TestCase> tests;
  register_common_tests(tests);
  register_rpc_tests(tests);
  register_config_tests(tests);
  register_accounts_tests(tests);
  register_observability_tests(tests);
  register_session_state_tests(tests);
  register_interceptor_tests(tests);
  register_request_rewriter_tests(tests);
  register_transport_tests(tests);
  register_response_rewriter_tests(tests);
  register_proxy_tests(tests);

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
