#include "record_store.hpp"

#include <utility>

namespace reqctl::records {

std::string RecordStore::Key(const Record& record) {
  return record.url + '\n' + record.target + '\n' + std::to_string(record.timestamp.time_since_epoch().count());
}

std::size_t RecordStore::Append(Record record) {
  std::lock_guard lock(mutex_);

  auto& tab = tabs_[record.tab_id];
  if (!tab.keys.insert(Key(record)).second) {
    return tab.records.size();
  }

  tab.records.push_back(std::move(record));
  return tab.records.size();
}

std::optional<RecordSequence> RecordStore::Get(host::TabId tab_id) const {
  std::lock_guard lock(mutex_);

  auto it = tabs_.find(tab_id);
  if (it == tabs_.end()) {
    return std::nullopt;
  }
  return it->second.records;
}

void RecordStore::Replace(host::TabId tab_id, RecordSequence records) {
  std::lock_guard lock(mutex_);

  if (records.empty()) {
    tabs_.erase(tab_id);
    return;
  }

  TabRecords tab;
  tab.records.reserve(records.size());
  for (auto& record : records) {
    record.tab_id = tab_id;
    if (tab.keys.insert(Key(record)).second) {
      tab.records.push_back(std::move(record));
    }
  }
  tabs_[tab_id] = std::move(tab);
}

void RecordStore::Remove(host::TabId tab_id) {
  std::lock_guard lock(mutex_);
  tabs_.erase(tab_id);
}

void RecordStore::Clear() {
  std::lock_guard lock(mutex_);
  tabs_.clear();
}

bool RecordStore::Contains(host::TabId tab_id) const {
  std::lock_guard lock(mutex_);
  return tabs_.count(tab_id) != 0;
}

std::size_t RecordStore::tab_count() const {
  std::lock_guard lock(mutex_);
  return tabs_.size();
}

RecordSnapshot RecordStore::Snapshot() const {
  std::lock_guard lock(mutex_);

  RecordSnapshot snapshot;
  snapshot.reserve(tabs_.size());
  for (const auto& [tab_id, tab] : tabs_) {
    snapshot.emplace(tab_id, tab.records);
  }
  return snapshot;
}

} // namespace reqctl::records
