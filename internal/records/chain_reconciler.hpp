#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "internal/host/request_details.hpp"
#include "internal/records/record_store.hpp"

namespace reqctl::notify {
class Notifier;
}

namespace reqctl::records {

// Records inspected per pass. Keeps reconciliation cost flat no matter how
// many records a tab has accumulated.
inline constexpr std::size_t kReconcileWindow = 5;

/*
  Rebuilds a tab's history on top-level navigation commit.

  Pass 1 walks back from the newest record (at most kReconcileWindow) and
  takes the first record that redirected to the committed url, or any
  redirecting record when the commit came from a server redirect. Pass 2
  keeps walking back (again at most kReconcileWindow) and collects the hops
  whose target is the url of the last kept record. Whatever is not part of
  that chain is dropped.
*/
class ChainReconciler {
 public:
  enum class Outcome {
    kIgnored,  // sub-frame commit or tab without records
    kKept,
    kCleared,
  };

  ChainReconciler(std::shared_ptr<RecordStore> store, std::shared_ptr<notify::Notifier> notifier);

  Outcome OnNavigationCommitted(const host::NavigationDetails& details);

  // Pure part: the surviving chain, oldest first. Empty when no anchor was found.
  static RecordSequence Reconcile(const RecordSequence& records, const std::string& committed_url, bool is_server_redirect);

  static bool IsServerRedirect(const host::NavigationDetails& details);

 private:
  std::shared_ptr<RecordStore>      store_;
  std::shared_ptr<notify::Notifier> notifier_;
};

} // namespace reqctl::records
