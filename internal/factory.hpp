#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

namespace reqctl::config {
class OptionsSource;
}
namespace reqctl::control {
class RequestController;
class RuleCompiler;
} // namespace reqctl::control
namespace reqctl::core {
class RequestControl;
}
namespace reqctl::host {
class RequestHost;
}
namespace reqctl::notify {
class Notifier;
}

namespace reqctl::factory {

/*
  What the embedder brings. Everything but the notifier is required by
  Build; a missing notifier falls back to LoggingNotifier.
*/
struct Collaborators {
  std::shared_ptr<host::RequestHost>          host;
  std::shared_ptr<control::RuleCompiler>      compiler;
  std::shared_ptr<control::RequestController> controller;
  std::shared_ptr<notify::Notifier>           notifier;
  std::shared_ptr<config::OptionsSource>      options;
};

/*
  Build

  Composition root. Wires the engine around the embedder's collaborators.
  Throws std::invalid_argument when a required collaborator is missing.
  The returned instance is not started.
*/
std::shared_ptr<core::RequestControl> Build(Collaborators collaborators);

/*
  BuildFromConfigFile

  Loads the runtime config at `path`, initializes logging from it and
  builds the engine. Without an options source in `collaborators` the
  options are read from the same file.
*/
std::shared_ptr<core::RequestControl> BuildFromConfigFile(const std::string& path, Collaborators collaborators);

} // namespace reqctl::factory
