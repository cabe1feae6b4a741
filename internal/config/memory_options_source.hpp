#pragma once

#include <mutex>
#include <vector>

#include "internal/config/options_source.hpp"

namespace reqctl::config {

class MemoryOptionsSource final : public OptionsSource {
 public:
  MemoryOptionsSource() = default;
  explicit MemoryOptionsSource(reqctl::v1::Options options);

  reqctl::v1::Options Load() override;
  void                Subscribe(ChangeCallback callback) override;

  // Replaces the stored options and notifies subscribers.
  void Set(reqctl::v1::Options options);

 private:
  std::mutex                  mutex_;
  reqctl::v1::Options         options_;
  std::vector<ChangeCallback> subscribers_;
};

} // namespace reqctl::config
