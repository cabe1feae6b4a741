#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/records/record.hpp"

namespace reqctl::records {

using RecordSequence = std::vector<Record>;
using RecordSnapshot = std::unordered_map<host::TabId, RecordSequence>;

/*
  Tab id -> ordered (oldest first) records.

  A tab's sequence exists from its first Append until Remove or Clear.
  No policy lives here; pruning is the reconciler's job.
*/
class RecordStore {
 public:
  // Returns the tab's record count after the call. A record equal to one
  // already held (same url, target and timestamp) is not stored twice.
  std::size_t Append(Record record);

  std::optional<RecordSequence> Get(host::TabId tab_id) const;

  // Installs `records` as the tab's sequence. An empty sequence removes the tab.
  void Replace(host::TabId tab_id, RecordSequence records);

  void Remove(host::TabId tab_id);
  void Clear();

  bool           Contains(host::TabId tab_id) const;
  std::size_t    tab_count() const;
  RecordSnapshot Snapshot() const;

 private:
  struct TabRecords {
    RecordSequence                  records;
    std::unordered_set<std::string> keys;
  };

  static std::string Key(const Record& record);

  mutable std::mutex                          mutex_;
  std::unordered_map<host::TabId, TabRecords> tabs_;
};

} // namespace reqctl::records
