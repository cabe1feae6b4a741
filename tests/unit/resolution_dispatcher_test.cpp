#include "internal/dispatch/resolution_dispatcher.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "fakes/fakes.hpp"
#include "internal/records/record_store.hpp"

namespace {

using reqctl::dispatch::ResolutionDispatcher;
using reqctl::records::RecordStore;
using reqctl::testing::FakeController;
using reqctl::testing::FakeHost;
using reqctl::testing::MakeRedirectRule;
using reqctl::testing::MakeRequest;
using reqctl::testing::MakeRule;
using reqctl::testing::RecordingNotifier;

struct Fixture {
  std::shared_ptr<FakeHost>          host       = std::make_shared<FakeHost>();
  std::shared_ptr<FakeController>    controller = std::make_shared<FakeController>();
  std::shared_ptr<RecordStore>       store      = std::make_shared<RecordStore>();
  std::shared_ptr<RecordingNotifier> notifier   = std::make_shared<RecordingNotifier>();
  ResolutionDispatcher               dispatcher{host, controller, store, notifier};

  void Mark(const reqctl::host::RequestDetails& details, const reqctl::v1::Rule& rule) {
    controller->Mark(details, std::make_shared<const reqctl::v1::Rule>(rule));
  }
};

void TestResolvedRequestsAppendInOrder() {
  Fixture f;
  const auto rule = MakeRule("block", reqctl::v1::ACTION_BLOCK, "");

  for (int i = 0; i < 4; ++i) {
    const auto request = MakeRequest("req-" + std::to_string(i), 3, "https://ads.test/" + std::to_string(i), 100.0 + i, "script");
    f.Mark(request, rule);
    const auto response = f.dispatcher.OnBeforeRequest(request);
    assert(response.cancel);
    assert(f.notifier->notifications.back().count == static_cast<std::size_t>(i + 1));
  }

  const auto records = f.store->Get(3);
  assert(records->size() == 4);
  for (int i = 0; i < 4; ++i) {
    assert((*records)[i].url == "https://ads.test/" + std::to_string(i));
    assert((*records)[i].type == "script");
    assert((*records)[i].target.empty());
    assert((*records)[i].rule->uuid() == "block");
  }
}

void TestRedirectRecordCarriesTarget() {
  Fixture f;
  const auto request = MakeRequest("req-1", 3, "https://a.test/", 100);
  f.Mark(request, MakeRedirectRule("redirect", "https://a.test/", "https://b.test/"));

  const auto response = f.dispatcher.OnBeforeRequest(request);

  assert(!response.cancel);
  assert(response.redirect_url == std::optional<std::string>("https://b.test/"));
  const auto records = f.store->Get(3);
  assert(records->size() == 1);
  assert(records->front().target == "https://b.test/");
  assert(f.host->tab_updates.empty());
}

void TestUnmarkedRequestPassesThroughWithoutRecord() {
  Fixture f;

  const auto response = f.dispatcher.OnBeforeRequest(MakeRequest("req-1", 3, "https://a.test/", 100));

  assert(!response.cancel);
  assert(!response.redirect_url.has_value());
  assert(f.store->tab_count() == 0);
  assert(f.notifier->notifications.empty());
  assert(f.notifier->errors.empty());
}

void TestUpdateTabNavigatesTab() {
  Fixture f;
  auto    rule = MakeRedirectRule("redirect", "https://a.test/", "https://b.test/");
  rule.set_tag("update-tab");
  const auto request = MakeRequest("req-1", 5, "https://a.test/", 100);
  f.Mark(request, rule);

  f.dispatcher.OnBeforeRequest(request);

  assert(f.host->tab_updates.size() == 1);
  assert(f.host->tab_updates[0].first == 5);
  assert(f.host->tab_updates[0].second == "https://b.test/");
  assert(f.store->Get(5)->size() == 1);
}

void TestNotifyObservesStoreAfterAppend() {
  Fixture f;
  bool    checked = false;
  f.notifier->on_notify = [&](reqctl::host::TabId tab_id, std::size_t count) {
    assert(f.store->Get(tab_id)->size() == count);
    checked = true;
  };

  const auto request = MakeRequest("req-1", 3, "https://a.test/", 100);
  f.Mark(request, MakeRule("log", reqctl::v1::ACTION_LOGGER, ""));
  f.dispatcher.OnBeforeRequest(request);

  assert(checked);
}

void TestControllerFailurePassesThrough() {
  Fixture f;
  f.controller->throw_on_resolve = true;

  const auto response = f.dispatcher.OnBeforeRequest(MakeRequest("req-1", 3, "https://a.test/", 100));

  assert(!response.cancel);
  assert(!response.redirect_url.has_value());
  assert(f.store->tab_count() == 0);
}

} // namespace

int main() {
  TestResolvedRequestsAppendInOrder();
  TestRedirectRecordCarriesTarget();
  TestUnmarkedRequestPassesThroughWithoutRecord();
  TestUpdateTabNavigatesTab();
  TestNotifyObservesStoreAfterAppend();
  TestControllerFailurePassesThrough();

  std::cout << "request_control_unit_resolution_dispatcher: pass\n";
  return 0;
}
