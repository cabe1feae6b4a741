#include "resolution_dispatcher.hpp"

#include "internal/control/request_controller.hpp"
#include "internal/host/request_host.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/records/record_store.hpp"

namespace reqctl::dispatch {

using reqctl::observability::IntField;
using reqctl::observability::StringField;

ResolutionDispatcher::ResolutionDispatcher(std::shared_ptr<host::RequestHost> host, std::shared_ptr<control::RequestController> controller,
                                           std::shared_ptr<records::RecordStore> store, std::shared_ptr<notify::Notifier> notifier)
    : host_(std::move(host)), controller_(std::move(controller)), store_(std::move(store)), notifier_(std::move(notifier)) {
}

host::BlockingResponse ResolutionDispatcher::OnBeforeRequest(const host::RequestDetails& details) {
  try {
    return controller_->Resolve(details, [this](const control::ResolvedRequest& resolved, bool update_tab) { OnResolved(resolved, update_tab); });
  } catch (const std::exception& e) {
    REQCTL_LOG_ERROR("Request resolution failed",
                     {StringField("request_id", details.request_id), StringField("url", details.url), StringField("error", e.what())});
    return {};
  }
}

void ResolutionDispatcher::OnResolved(const control::ResolvedRequest& resolved, bool update_tab) {
  const auto& details = resolved.details;

  records::Record record;
  record.tab_id    = details.tab_id;
  record.type      = details.type;
  record.url       = details.url;
  record.target    = resolved.redirect_url;
  record.timestamp = details.time_stamp;
  record.rule      = resolved.rule;

  const auto count = store_->Append(std::move(record));

  REQCTL_LOG_DEBUG("Request resolved", {IntField("tab_id", details.tab_id), StringField("type", details.type), StringField("url", details.url),
                                        StringField("target", resolved.redirect_url), IntField("count", static_cast<int64_t>(count))});

  // The controller's answer stands even if notifying fails.
  try {
    notifier_->Notify(details.tab_id, resolved.rule, count);
    if (update_tab && !resolved.redirect_url.empty()) {
      host_->UpdateTab(details.tab_id, resolved.redirect_url);
    }
  } catch (const std::exception& e) {
    REQCTL_LOG_ERROR("Post-resolution update failed", {IntField("tab_id", details.tab_id), StringField("error", e.what())});
  }
}

} // namespace reqctl::dispatch
