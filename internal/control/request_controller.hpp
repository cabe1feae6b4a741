#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/host/request_details.hpp"
#include "reqctl/v1.hpp"

namespace reqctl::control {

// Outcome handed back by the controller once it settled on an action.
struct ResolvedRequest {
  const host::RequestDetails&             details;
  std::shared_ptr<const reqctl::v1::Rule> rule;
  // Redirect destination; empty unless the action redirected.
  std::string redirect_url;
};

/*
  Decides what happens to a request.

  Mark() runs from the per-rule hooks and remembers the rule for the
  request. Resolve() runs from the blocking hook and must not wait on
  anything: whatever it needs has to be computed at mark time. It calls
  on_resolved at most once, synchronously, and only when a rule applied.
*/
class RequestController {
 public:
  // update_tab asks for the tab itself to be navigated to the redirect
  // destination instead of relying on a native redirect.
  using ResolvedCallback = std::function<void(const ResolvedRequest&, bool update_tab)>;

  virtual ~RequestController() = default;

  virtual void                   Mark(const host::RequestDetails& details, std::shared_ptr<const reqctl::v1::Rule> rule) = 0;
  virtual host::BlockingResponse Resolve(const host::RequestDetails& details, const ResolvedCallback& on_resolved) = 0;

  // Forget every pending mark.
  virtual void Clear() = 0;
};

} // namespace reqctl::control
