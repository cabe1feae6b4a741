#include "yaml_options_source.hpp"

#include <utility>

#include "internal/config/config_loader.hpp"

namespace reqctl::config {

YamlOptionsSource::YamlOptionsSource(std::string path) : path_(std::move(path)) {
}

reqctl::v1::Options YamlOptionsSource::Load() {
  return ConfigLoader::LoadFromYaml(path_).options();
}

void YamlOptionsSource::Subscribe(ChangeCallback callback) {
  std::lock_guard lock(mutex_);
  subscribers_.push_back(std::move(callback));
}

void YamlOptionsSource::Reload() {
  std::vector<ChangeCallback> subscribers;
  {
    std::lock_guard lock(mutex_);
    subscribers = subscribers_;
  }

  for (const auto& callback : subscribers) {
    callback();
  }
}

} // namespace reqctl::config
