#pragma once

#include <functional>

#include "reqctl/v1.hpp"

namespace reqctl::config {

/*
  Where the option set lives (extension storage, a YAML file, memory).

  Load() always returns the complete set. Subscribers are told that
  something changed, not what; they reload in full.
*/
class OptionsSource {
 public:
  using ChangeCallback = std::function<void()>;

  virtual ~OptionsSource() = default;

  virtual reqctl::v1::Options Load() = 0;
  virtual void                Subscribe(ChangeCallback callback) = 0;
};

} // namespace reqctl::config
