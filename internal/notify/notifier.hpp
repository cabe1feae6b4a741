#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "internal/host/request_details.hpp"
#include "internal/records/record_store.hpp"
#include "reqctl/v1.hpp"

namespace reqctl::notify {

/*
  Reflects engine state to the user (badge, icon, error popups).

  Every Notify() is issued after the store mutation it reports, so
  `count` always matches what RecordStore::Get would return.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void EnabledState() = 0;
  // Receives every tab's records as they were right before they are dropped.
  virtual void DisabledState(const records::RecordSnapshot& records) = 0;

  virtual void Notify(host::TabId tab_id, const std::shared_ptr<const reqctl::v1::Rule>& rule, std::size_t count) = 0;
  virtual void Clear(host::TabId tab_id) = 0;

  virtual void Error(std::optional<host::TabId> tab_id, const std::string& message) = 0;
};

} // namespace reqctl::notify
