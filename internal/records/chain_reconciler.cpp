#include "chain_reconciler.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"

namespace reqctl::records {

using reqctl::observability::BoolField;
using reqctl::observability::IntField;

ChainReconciler::ChainReconciler(std::shared_ptr<RecordStore> store, std::shared_ptr<notify::Notifier> notifier)
    : store_(std::move(store)), notifier_(std::move(notifier)) {
}

bool ChainReconciler::IsServerRedirect(const host::NavigationDetails& details) {
  const auto& qualifiers = details.transition_qualifiers;
  return std::find(qualifiers.begin(), qualifiers.end(), host::kServerRedirectQualifier) != qualifiers.end();
}

RecordSequence ChainReconciler::Reconcile(const RecordSequence& records, const std::string& committed_url, bool is_server_redirect) {
  RecordSequence chain;

  // `next` is one past the next index to inspect; both passes share it.
  std::size_t next = records.size();

  std::size_t anchor = records.size();
  for (std::size_t scanned = 0; scanned < kReconcileWindow && next > 0; ++scanned) {
    const auto& record = records[--next];
    if (record.redirected() && (record.target == committed_url || is_server_redirect)) {
      anchor = next;
      break;
    }
  }

  if (anchor == records.size()) {
    return chain;
  }

  chain.push_back(records[anchor]);
  const Record* last = &records[anchor];

  for (std::size_t scanned = 0; scanned < kReconcileWindow && next > 0; ++scanned) {
    const auto& record = records[--next];
    if (record.redirected() && record.target == last->url) {
      chain.push_back(record);
      last = &record;
    }
  }

  std::reverse(chain.begin(), chain.end());
  return chain;
}

ChainReconciler::Outcome ChainReconciler::OnNavigationCommitted(const host::NavigationDetails& details) {
  if (details.frame_id != 0) {
    return Outcome::kIgnored;
  }

  const auto snapshot = store_->Get(details.tab_id);
  if (!snapshot) {
    return Outcome::kIgnored;
  }

  const bool server_redirect = IsServerRedirect(details);
  auto       keep            = Reconcile(*snapshot, details.url, server_redirect);

  REQCTL_LOG_DEBUG("Reconciled tab records", {IntField("tab_id", details.tab_id), BoolField("server_redirect", server_redirect),
                                              IntField("before", static_cast<int64_t>(snapshot->size())),
                                              IntField("after", static_cast<int64_t>(keep.size()))});

  if (keep.empty()) {
    store_->Remove(details.tab_id);
    notifier_->Clear(details.tab_id);
    return Outcome::kCleared;
  }

  const auto rule  = keep.back().rule;
  const auto count = keep.size();
  store_->Replace(details.tab_id, std::move(keep));
  notifier_->Notify(details.tab_id, rule, count);
  return Outcome::kKept;
}

} // namespace reqctl::records
