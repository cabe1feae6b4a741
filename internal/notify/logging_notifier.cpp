#include "logging_notifier.hpp"

#include "internal/observability/logging.hpp"

namespace reqctl::notify {

using reqctl::observability::IntField;
using reqctl::observability::StringField;

void LoggingNotifier::EnabledState() {
  REQCTL_LOG_INFO("Request control enabled");
}

void LoggingNotifier::DisabledState(const records::RecordSnapshot& records) {
  REQCTL_LOG_INFO("Request control disabled", {IntField("tabs_cleared", static_cast<int64_t>(records.size()))});
}

void LoggingNotifier::Notify(host::TabId tab_id, const std::shared_ptr<const reqctl::v1::Rule>& rule, std::size_t count) {
  REQCTL_LOG_DEBUG("Tab records updated",
                   {IntField("tab_id", tab_id), StringField("rule", rule ? rule->uuid() : ""),
                    StringField("action", rule ? reqctl::v1::Action_Name(rule->action()) : ""), IntField("count", static_cast<int64_t>(count))});
}

void LoggingNotifier::Clear(host::TabId tab_id) {
  REQCTL_LOG_DEBUG("Tab records cleared", {IntField("tab_id", tab_id)});
}

void LoggingNotifier::Error(std::optional<host::TabId> tab_id, const std::string& message) {
  if (tab_id) {
    REQCTL_LOG_ERROR(message, {IntField("tab_id", *tab_id)});
    return;
  }
  REQCTL_LOG_ERROR(message);
}

} // namespace reqctl::notify
