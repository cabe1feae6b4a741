#include "factory.hpp"

#include <stdexcept>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/config/yaml_options_source.hpp"
#include "internal/control/request_controller.hpp"
#include "internal/control/rule_compiler.hpp"
#include "internal/core/request_control.hpp"
#include "internal/host/request_host.hpp"
#include "internal/notify/logging_notifier.hpp"
#include "internal/observability/logging.hpp"

namespace reqctl::factory {

std::shared_ptr<core::RequestControl> Build(Collaborators collaborators) {
  if (!collaborators.host) {
    throw std::invalid_argument("request host is required");
  }
  if (!collaborators.compiler) {
    throw std::invalid_argument("rule compiler is required");
  }
  if (!collaborators.controller) {
    throw std::invalid_argument("request controller is required");
  }
  if (!collaborators.options) {
    throw std::invalid_argument("options source is required");
  }
  if (!collaborators.notifier) {
    collaborators.notifier = std::make_shared<notify::LoggingNotifier>();
  }

  return std::make_shared<core::RequestControl>(std::move(collaborators.host), std::move(collaborators.compiler),
                                                std::move(collaborators.controller), std::move(collaborators.notifier),
                                                std::move(collaborators.options));
}

std::shared_ptr<core::RequestControl> BuildFromConfigFile(const std::string& path, Collaborators collaborators) {
  const auto runtime_config = config::ConfigLoader::LoadFromYaml(path);
  observability::InitializeLogging(runtime_config.logging());

  if (!collaborators.options) {
    collaborators.options = std::make_shared<config::YamlOptionsSource>(path);
  }

  REQCTL_LOG_INFO("Building request control", {observability::StringField("config", path)});
  return Build(std::move(collaborators));
}

} // namespace reqctl::factory
