#pragma once

#include <stdexcept>
#include <string>

namespace reqctl::util {

/*
  Central error types.

  Everything thrown here is caught at a component boundary; nothing
  reaches the host's event loop.
*/

class RuleCompilationError : public std::runtime_error {
 public:
  explicit RuleCompilationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfiguration : public std::runtime_error {
 public:
  explicit InvalidConfiguration(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace reqctl::util
