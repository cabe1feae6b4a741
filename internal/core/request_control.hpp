#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include "internal/host/request_details.hpp"
#include "internal/records/record_store.hpp"
#include "reqctl/v1.hpp"

namespace reqctl::config {
class OptionsSource;
}
namespace reqctl::control {
class RequestController;
class RuleCompiler;
} // namespace reqctl::control
namespace reqctl::dispatch {
class ResolutionDispatcher;
}
namespace reqctl::host {
class RequestHost;
}
namespace reqctl::listeners {
class RuleListenerRegistry;
}
namespace reqctl::notify {
class Notifier;
}
namespace reqctl::records {
class ChainReconciler;
}

namespace reqctl::core {

/*
  The engine instance. Owns the record store, the hook registry, the
  dispatcher and the reconciler for as long as it lives.

  All entry points are host event handlers: they log and swallow
  std::exception instead of letting it reach the host's dispatch loop.
*/
class RequestControl : public std::enable_shared_from_this<RequestControl> {
 public:
  using RecordsCallback = std::function<void(std::optional<records::RecordSequence>)>;

  RequestControl(std::shared_ptr<host::RequestHost> host, std::shared_ptr<control::RuleCompiler> compiler,
                 std::shared_ptr<control::RequestController> controller, std::shared_ptr<notify::Notifier> notifier,
                 std::shared_ptr<config::OptionsSource> options);
  ~RequestControl();

  RequestControl(const RequestControl&)            = delete;
  RequestControl& operator=(const RequestControl&) = delete;

  // Loads and applies the options, then follows option changes.
  void Start();
  void Stop();

  void Apply(const reqctl::v1::Options& options);

  // Full teardown and rebuild from freshly loaded options.
  void OnOptionsChanged();

  void OnNavigationCommitted(const host::NavigationDetails& details);
  void OnTabRemoved(host::TabId tab_id);

  // Records of the active tab in the current window. `reply` may run after
  // this returns, when the host answers the active tab query.
  void GetRecords(RecordsCallback reply);

  std::optional<records::RecordSequence> GetRecords(host::TabId tab_id) const;

  bool        enabled() const;
  std::size_t installed_rule_count() const;

 private:
  std::shared_ptr<host::RequestHost>          host_;
  std::shared_ptr<control::RequestController> controller_;
  std::shared_ptr<notify::Notifier>           notifier_;
  std::shared_ptr<config::OptionsSource>      options_;

  std::shared_ptr<records::RecordStore>            store_;
  std::shared_ptr<dispatch::ResolutionDispatcher>  dispatcher_;
  std::unique_ptr<listeners::RuleListenerRegistry> registry_;
  std::unique_ptr<records::ChainReconciler>        reconciler_;

  std::atomic<bool> enabled_{false};
  bool              subscribed_{false};
};

} // namespace reqctl::core
