#pragma once

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "core/config_error.hpp"

namespace scfg::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

// Runs fn and requires it to report a fatal error of the given kind
inline void RequireFatal(FatalKind kind, const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const ConfigurationError& e) {
    Require(e.kind() == kind, message + " (wrong kind: " + FatalKindName(e.kind()) + ")");
    return;
  }
  throw std::runtime_error(message + " (nothing reported)");
}

inline YAML::Node Yaml(const std::string& text) {
  return YAML::Load(text);
}

inline int RunTests(const std::vector<TestCase>& tests) {
  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto& test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception& ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}

} // namespace scfg::tests
