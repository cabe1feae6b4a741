#pragma once

#include "internal/notify/notifier.hpp"

namespace reqctl::notify {

// Notifier that only writes log lines. Used when the embedder has no UI.
class LoggingNotifier final : public Notifier {
 public:
  void EnabledState() override;
  void DisabledState(const records::RecordSnapshot& records) override;
  void Notify(host::TabId tab_id, const std::shared_ptr<const reqctl::v1::Rule>& rule, std::size_t count) override;
  void Clear(host::TabId tab_id) override;
  void Error(std::optional<host::TabId> tab_id, const std::string& message) override;
};

} // namespace reqctl::notify
