#include "rule_listener_registry.hpp"

#include <exception>
#include <string>
#include <utility>

#include "internal/control/request_controller.hpp"
#include "internal/control/rule_compiler.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"

namespace reqctl::listeners {

using reqctl::observability::IntField;
using reqctl::observability::StringField;

namespace {

std::string RuleLabel(const reqctl::v1::Rule& rule) {
  return rule.title().empty() ? rule.uuid() : rule.title();
}

} // namespace

RuleListenerRegistry::RuleListenerRegistry(std::shared_ptr<host::RequestHost> host, std::shared_ptr<control::RuleCompiler> compiler,
                                           std::shared_ptr<control::RequestController> controller, std::shared_ptr<notify::Notifier> notifier,
                                           host::RequestHost::BeforeRequestListener resolve_listener)
    : host_(std::move(host)),
      compiler_(std::move(compiler)),
      controller_(std::move(controller)),
      notifier_(std::move(notifier)),
      resolve_listener_(std::move(resolve_listener)) {
}

RuleListenerRegistry::~RuleListenerRegistry() {
  Hooks hooks;
  {
    std::lock_guard lock(mutex_);
    hooks = std::exchange(hooks_, {});
  }

  try {
    RemoveHooks(hooks);
  } catch (const std::exception& e) {
    REQCTL_LOG_ERROR("Failed to remove rule listeners", {StringField("error", e.what())});
  }
}

std::size_t RuleListenerRegistry::Install(const google::protobuf::RepeatedPtrField<reqctl::v1::Rule>& rules) {
  // Old hooks go first so the previous and the new wiring never overlap.
  Uninstall();

  Hooks fresh;
  for (const auto& data : rules) {
    if (!data.active()) {
      continue;
    }

    try {
      auto compiled = compiler_->Compile(data);
      auto rule     = compiled.rule ? std::move(compiled.rule) : std::make_shared<const reqctl::v1::Rule>(data);

      auto listener = [controller = controller_, rule](const host::RequestDetails& details) {
        controller->Mark(details, rule);
        return host::BlockingResponse{};
      };
      fresh.rule_hooks.push_back(host_->AddBeforeRequestListener(std::move(listener), compiled.filter, false));
    } catch (const std::exception& e) {
      REQCTL_LOG_WARN("Skipping invalid rule", {StringField("rule", data.uuid()), StringField("error", e.what())});
      ReportInvalidRule(data);
    }
  }

  try {
    fresh.resolve_hook = host_->AddBeforeRequestListener(resolve_listener_, host::RequestFilter{{host::kAllUrls}, {}}, true);
  } catch (const std::exception&) {
    RemoveHooks(fresh);
    throw;
  }

  const auto count = fresh.rule_hooks.size();
  {
    std::lock_guard lock(mutex_);
    hooks_ = std::move(fresh);
  }
  host_->HandlerBehaviorChanged();

  REQCTL_LOG_INFO("Installed rule listeners", {IntField("rules", rules.size()), IntField("installed", static_cast<int64_t>(count))});
  return count;
}

void RuleListenerRegistry::Uninstall() {
  Hooks hooks;
  {
    std::lock_guard lock(mutex_);
    hooks = std::exchange(hooks_, {});
  }

  RemoveHooks(hooks);
  host_->HandlerBehaviorChanged();
}

bool RuleListenerRegistry::installed() const {
  std::lock_guard lock(mutex_);
  return hooks_.resolve_hook.has_value();
}

std::size_t RuleListenerRegistry::installed_rule_count() const {
  std::lock_guard lock(mutex_);
  return hooks_.rule_hooks.size();
}

void RuleListenerRegistry::ReportInvalidRule(const reqctl::v1::Rule& rule) {
  // Hooks for the rules before this one are not owned yet; nothing may escape.
  try {
    notifier_->Error(std::nullopt, "Invalid rule: " + RuleLabel(rule));
  } catch (const std::exception& e) {
    REQCTL_LOG_ERROR("Failed to report invalid rule", {StringField("rule", rule.uuid()), StringField("error", e.what())});
  }
}

void RuleListenerRegistry::RemoveHooks(const Hooks& hooks) {
  for (auto id : hooks.rule_hooks) {
    host_->RemoveBeforeRequestListener(id);
  }
  if (hooks.resolve_hook) {
    host_->RemoveBeforeRequestListener(*hooks.resolve_hook);
  }
}

} // namespace reqctl::listeners
