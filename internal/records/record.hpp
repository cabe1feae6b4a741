#pragma once

#include <memory>
#include <string>

#include "internal/host/request_details.hpp"
#include "internal/util/time.hpp"
#include "reqctl/v1.hpp"

namespace reqctl::records {

// One resolved request kept in a tab's history.
struct Record {
  host::TabId     tab_id{host::kNoTab};
  std::string     type;
  std::string     url;
  std::string     target;  // empty unless redirected
  util::TimePoint timestamp{};

  std::shared_ptr<const reqctl::v1::Rule> rule;

  bool redirected() const {
    return !target.empty();
  }
};

} // namespace reqctl::records
