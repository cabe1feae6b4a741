#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <google/protobuf/repeated_field.h>

#include "internal/host/request_host.hpp"
#include "reqctl/v1.hpp"

namespace reqctl::control {
class RuleCompiler;
class RequestController;
} // namespace reqctl::control

namespace reqctl::notify {
class Notifier;
}

namespace reqctl::listeners {

/*
  Owns every hook the engine installed on the host.

  One non-blocking hook per active rule marks matching requests; one
  blocking catch-all hook hands them to the resolver. Configuration
  changes always tear everything down and rebuild, never diff.
*/
class RuleListenerRegistry {
 public:
  RuleListenerRegistry(std::shared_ptr<host::RequestHost> host, std::shared_ptr<control::RuleCompiler> compiler,
                       std::shared_ptr<control::RequestController> controller, std::shared_ptr<notify::Notifier> notifier,
                       host::RequestHost::BeforeRequestListener resolve_listener);
  ~RuleListenerRegistry();

  RuleListenerRegistry(const RuleListenerRegistry&)            = delete;
  RuleListenerRegistry& operator=(const RuleListenerRegistry&) = delete;

  // Returns the number of rule hooks installed. Rules that fail to compile
  // are reported and skipped.
  std::size_t Install(const google::protobuf::RepeatedPtrField<reqctl::v1::Rule>& rules);

  // Safe to call at any time, including when nothing is installed.
  void Uninstall();

  bool        installed() const;
  std::size_t installed_rule_count() const;

 private:
  struct Hooks {
    std::vector<host::HookId>   rule_hooks;
    std::optional<host::HookId> resolve_hook;
  };

  void ReportInvalidRule(const reqctl::v1::Rule& rule);
  void RemoveHooks(const Hooks& hooks);

  std::shared_ptr<host::RequestHost>          host_;
  std::shared_ptr<control::RuleCompiler>      compiler_;
  std::shared_ptr<control::RequestController> controller_;
  std::shared_ptr<notify::Notifier>           notifier_;
  host::RequestHost::BeforeRequestListener    resolve_listener_;

  mutable std::mutex mutex_;
  Hooks              hooks_;
};

} // namespace reqctl::listeners
