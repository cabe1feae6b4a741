#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace reqctl::host {

using TabId = int64_t;

// Host marker for requests that do not belong to a tab (service workers,
// extension background pages).
inline constexpr TabId kNoTab = -1;

// Request as seen by interception hooks, before it is sent.
struct RequestDetails {
  std::string     request_id;
  TabId           tab_id{kNoTab};
  int64_t         frame_id{0};
  std::string     type;
  std::string     url;
  util::TimePoint time_stamp{};
};

// Answer of a blocking hook. Default constructed means "let it through".
struct BlockingResponse {
  bool                       cancel{false};
  std::optional<std::string> redirect_url;
};

struct NavigationDetails {
  TabId                    tab_id{kNoTab};
  int64_t                  frame_id{0};
  std::string              url;
  std::vector<std::string> transition_qualifiers;
};

inline constexpr const char* kServerRedirectQualifier = "server_redirect";

} // namespace reqctl::host
