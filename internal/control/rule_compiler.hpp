#pragma once

#include <memory>

#include "internal/host/request_host.hpp"
#include "reqctl/v1.hpp"

namespace reqctl::control {

struct CompiledRule {
  std::shared_ptr<const reqctl::v1::Rule> rule;
  host::RequestFilter                     filter;
};

/*
  Turns a stored rule into something the host can filter on.

  Implementations throw util::RuleCompilationError for a malformed
  pattern or rule body.
*/
class RuleCompiler {
 public:
  virtual ~RuleCompiler() = default;

  virtual CompiledRule Compile(const reqctl::v1::Rule& rule) = 0;
};

} // namespace reqctl::control
