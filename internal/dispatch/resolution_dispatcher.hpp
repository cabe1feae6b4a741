#pragma once

#include <memory>

#include "internal/host/request_details.hpp"

namespace reqctl::control {
class RequestController;
struct ResolvedRequest;
} // namespace reqctl::control

namespace reqctl::host {
class RequestHost;
}

namespace reqctl::notify {
class Notifier;
}

namespace reqctl::records {
class RecordStore;
}

namespace reqctl::dispatch {

/*
  Target of the blocking catch-all hook.

  Runs while the host holds the request, so it only touches in-memory
  state: the controller's marks and the record store.
*/
class ResolutionDispatcher {
 public:
  ResolutionDispatcher(std::shared_ptr<host::RequestHost> host, std::shared_ptr<control::RequestController> controller,
                       std::shared_ptr<records::RecordStore> store, std::shared_ptr<notify::Notifier> notifier);

  host::BlockingResponse OnBeforeRequest(const host::RequestDetails& details);

 private:
  void OnResolved(const control::ResolvedRequest& resolved, bool update_tab);

  std::shared_ptr<host::RequestHost>          host_;
  std::shared_ptr<control::RequestController> controller_;
  std::shared_ptr<records::RecordStore>       store_;
  std::shared_ptr<notify::Notifier>           notifier_;
};

} // namespace reqctl::dispatch
