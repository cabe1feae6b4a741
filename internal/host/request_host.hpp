#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/host/request_details.hpp"

namespace reqctl::host {

// Filter evaluated by the host before a hook runs. `urls` holds host match
// patterns, `types` resource type names. Empty `types` matches every type.
struct RequestFilter {
  std::vector<std::string> urls;
  std::vector<std::string> types;
};

inline constexpr const char* kAllUrls = "<all_urls>";

using HookId = uint64_t;

/*
  Browser side of the engine.

  The host owns request interception and tab state. Hooks run on the
  host's event loop; a blocking hook must answer before the request is
  sent.
*/
class RequestHost {
 public:
  using BeforeRequestListener = std::function<BlockingResponse(const RequestDetails&)>;
  using ActiveTabCallback     = std::function<void(std::optional<TabId>)>;

  virtual ~RequestHost() = default;

  virtual HookId AddBeforeRequestListener(BeforeRequestListener listener, const RequestFilter& filter, bool blocking) = 0;
  virtual void   RemoveBeforeRequestListener(HookId id) = 0;

  // Drops the host's cached handler decisions so new hook wiring applies
  // to negotiations that are already pending.
  virtual void HandlerBehaviorChanged() = 0;

  virtual void UpdateTab(TabId tab_id, const std::string& url) = 0;

  // Active tab of the current window. May answer later.
  virtual void QueryActiveTab(ActiveTabCallback callback) = 0;
};

} // namespace reqctl::host
