#include "request_control.hpp"

#include <utility>

#include "internal/config/options_source.hpp"
#include "internal/control/request_controller.hpp"
#include "internal/control/rule_compiler.hpp"
#include "internal/dispatch/resolution_dispatcher.hpp"
#include "internal/host/request_host.hpp"
#include "internal/listeners/rule_listener_registry.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/records/chain_reconciler.hpp"

namespace reqctl::core {

using reqctl::observability::IntField;
using reqctl::observability::StringField;

RequestControl::RequestControl(std::shared_ptr<host::RequestHost> host, std::shared_ptr<control::RuleCompiler> compiler,
                               std::shared_ptr<control::RequestController> controller, std::shared_ptr<notify::Notifier> notifier,
                               std::shared_ptr<config::OptionsSource> options)
    : host_(std::move(host)),
      controller_(std::move(controller)),
      notifier_(std::move(notifier)),
      options_(std::move(options)),
      store_(std::make_shared<records::RecordStore>()) {
  dispatcher_ = std::make_shared<dispatch::ResolutionDispatcher>(host_, controller_, store_, notifier_);

  // The hook keeps the dispatcher alive; a resolution already running when
  // the hooks are removed still lands its record.
  auto resolve_listener = [dispatcher = dispatcher_](const host::RequestDetails& details) { return dispatcher->OnBeforeRequest(details); };

  registry_   = std::make_unique<listeners::RuleListenerRegistry>(host_, std::move(compiler), controller_, notifier_, std::move(resolve_listener));
  reconciler_ = std::make_unique<records::ChainReconciler>(store_, notifier_);
}

RequestControl::~RequestControl() {
  Stop();
}

void RequestControl::Start() {
  try {
    Apply(options_->Load());
  } catch (const std::exception& e) {
    REQCTL_LOG_ERROR("Failed to load options", {StringField("error", e.what())});
  }

  if (subscribed_) {
    return;
  }
  subscribed_ = true;

  std::weak_ptr<RequestControl> weak = weak_from_this();
  options_->Subscribe([weak] {
    if (auto self = weak.lock()) {
      self->OnOptionsChanged();
    }
  });
}

void RequestControl::Stop() {
  try {
    registry_->Uninstall();
  } catch (const std::exception& e) {
    REQCTL_LOG_ERROR("Failed to remove rule listeners", {StringField("error", e.what())});
  }
  enabled_ = false;
}

void RequestControl::Apply(const reqctl::v1::Options& options) {
  try {
    if (options.disabled()) {
      enabled_ = false;
      registry_->Uninstall();
      notifier_->DisabledState(store_->Snapshot());
      store_->Clear();
      controller_->Clear();
      return;
    }

    notifier_->EnabledState();
    registry_->Install(options.rules());
    enabled_ = true;
  } catch (const std::exception& e) {
    REQCTL_LOG_ERROR("Failed to apply options", {StringField("error", e.what())});
  }
}

void RequestControl::OnOptionsChanged() {
  try {
    registry_->Uninstall();
    Apply(options_->Load());
  } catch (const std::exception& e) {
    REQCTL_LOG_ERROR("Failed to reload options", {StringField("error", e.what())});
  }
}

void RequestControl::OnNavigationCommitted(const host::NavigationDetails& details) {
  if (!enabled_) {
    return;
  }

  try {
    reconciler_->OnNavigationCommitted(details);
  } catch (const std::exception& e) {
    REQCTL_LOG_ERROR("Navigation reconciliation failed", {IntField("tab_id", details.tab_id), StringField("error", e.what())});
  }
}

void RequestControl::OnTabRemoved(host::TabId tab_id) {
  if (!enabled_) {
    return;
  }

  try {
    store_->Remove(tab_id);
  } catch (const std::exception& e) {
    REQCTL_LOG_ERROR("Failed to drop tab records", {IntField("tab_id", tab_id), StringField("error", e.what())});
  }
}

void RequestControl::GetRecords(RecordsCallback reply) {
  if (!enabled_) {
    reply(std::nullopt);
    return;
  }

  std::weak_ptr<RequestControl> weak = weak_from_this();
  try {
    host_->QueryActiveTab([weak, reply](std::optional<host::TabId> tab_id) {
      // The engine may have been disabled or destroyed while the host was
      // answering; look the tab up only now.
      auto self = weak.lock();
      if (!self || !self->enabled_ || !tab_id) {
        reply(std::nullopt);
        return;
      }
      reply(self->store_->Get(*tab_id));
    });
  } catch (const std::exception& e) {
    REQCTL_LOG_ERROR("Active tab query failed", {StringField("error", e.what())});
    reply(std::nullopt);
  }
}

std::optional<records::RecordSequence> RequestControl::GetRecords(host::TabId tab_id) const {
  return store_->Get(tab_id);
}

bool RequestControl::enabled() const {
  return enabled_;
}

std::size_t RequestControl::installed_rule_count() const {
  return registry_->installed_rule_count();
}

} // namespace reqctl::core
