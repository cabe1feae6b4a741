#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "internal/config/options_source.hpp"

namespace reqctl::config {

/*
  Reads the `options` section of a runtime config file.

  The file is re-read on every Load(). Reload() is the change signal:
  call it after the file was rewritten.
*/
class YamlOptionsSource final : public OptionsSource {
 public:
  explicit YamlOptionsSource(std::string path);

  reqctl::v1::Options Load() override;
  void                Subscribe(ChangeCallback callback) override;

  void Reload();

  const std::string& path() const {
    return path_;
  }

 private:
  const std::string           path_;
  std::mutex                  mutex_;
  std::vector<ChangeCallback> subscribers_;
};

} // namespace reqctl::config
