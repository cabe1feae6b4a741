#include "memory_options_source.hpp"

#include <utility>

namespace reqctl::config {

MemoryOptionsSource::MemoryOptionsSource(reqctl::v1::Options options) : options_(std::move(options)) {
}

reqctl::v1::Options MemoryOptionsSource::Load() {
  std::lock_guard lock(mutex_);
  return options_;
}

void MemoryOptionsSource::Subscribe(ChangeCallback callback) {
  std::lock_guard lock(mutex_);
  subscribers_.push_back(std::move(callback));
}

void MemoryOptionsSource::Set(reqctl::v1::Options options) {
  std::vector<ChangeCallback> subscribers;
  {
    std::lock_guard lock(mutex_);
    options_    = std::move(options);
    subscribers = subscribers_;
  }

  // Called unlocked: subscribers reload through Load().
  for (const auto& callback : subscribers) {
    callback();
  }
}

} // namespace reqctl::config
