#include "internal/records/chain_reconciler.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "fakes/fakes.hpp"
#include "internal/records/record_store.hpp"
#include "internal/util/time.hpp"

namespace {

using reqctl::host::NavigationDetails;
using reqctl::records::ChainReconciler;
using reqctl::records::Record;
using reqctl::records::RecordSequence;
using reqctl::records::RecordStore;
using reqctl::testing::RecordingNotifier;

constexpr reqctl::host::TabId kTab = 7;

Record MakeRecord(const std::string& url, const std::string& target, const std::string& rule_uuid = "rule") {
  static double clock_ms = 1000.0;

  auto rule = std::make_shared<reqctl::v1::Rule>();
  rule->set_uuid(rule_uuid);

  Record record;
  record.tab_id    = kTab;
  record.type      = "main_frame";
  record.url       = url;
  record.target    = target;
  record.timestamp = reqctl::util::FromUnixMillis(clock_ms++);
  record.rule      = std::move(rule);
  return record;
}

NavigationDetails MakeCommit(const std::string& url, bool server_redirect = false, int64_t frame_id = 0) {
  NavigationDetails details;
  details.tab_id   = kTab;
  details.frame_id = frame_id;
  details.url      = url;
  if (server_redirect) {
    details.transition_qualifiers = {"from_address_bar", "server_redirect"};
  }
  return details;
}

struct Fixture {
  std::shared_ptr<RecordStore>       store    = std::make_shared<RecordStore>();
  std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
  ChainReconciler                    reconciler{store, notifier};

  void Load(const RecordSequence& records) {
    for (const auto& record : records) {
      store->Append(record);
    }
  }
};

void TestTwoHopChainIsKeptInOrder() {
  Fixture f;
  f.Load({MakeRecord("A", "B", "first"), MakeRecord("B", "C", "second")});

  const auto outcome = f.reconciler.OnNavigationCommitted(MakeCommit("C"));

  assert(outcome == ChainReconciler::Outcome::kKept);
  const auto records = f.store->Get(kTab);
  assert(records->size() == 2);
  assert((*records)[0].url == "A" && (*records)[0].target == "B");
  assert((*records)[1].url == "B" && (*records)[1].target == "C");

  assert(f.notifier->notifications.size() == 1);
  assert(f.notifier->notifications[0].tab_id == kTab);
  assert(f.notifier->notifications[0].rule_uuid == "second");
  assert(f.notifier->notifications[0].count == 2);
  assert(f.notifier->clears.empty());
}

void TestUnrelatedCommitClearsTab() {
  Fixture f;
  f.Load({MakeRecord("A", "B"), MakeRecord("B", "C")});

  const auto outcome = f.reconciler.OnNavigationCommitted(MakeCommit("D"));

  assert(outcome == ChainReconciler::Outcome::kCleared);
  assert(!f.store->Get(kTab).has_value());
  assert(f.notifier->clears.size() == 1);
  assert(f.notifier->clears[0] == kTab);
  assert(f.notifier->notifications.empty());
}

void TestServerRedirectAnchorsOnLatestRedirect() {
  Fixture f;
  f.Load({MakeRecord("A", "B")});

  const auto outcome = f.reconciler.OnNavigationCommitted(MakeCommit("C", true));

  assert(outcome == ChainReconciler::Outcome::kKept);
  const auto records = f.store->Get(kTab);
  assert(records->size() == 1);
  assert(records->front().url == "A" && records->front().target == "B");
  assert(f.notifier->notifications.back().count == 1);
}

void TestServerRedirectSkipsRecordsWithoutTarget() {
  const RecordSequence records{MakeRecord("A", "B"), MakeRecord("D", "")};

  const auto keep = ChainReconciler::Reconcile(records, "E", true);

  assert(keep.size() == 1);
  assert(keep.front().url == "A");
}

void TestRecordWithoutTargetNeverAnchors() {
  const RecordSequence records{MakeRecord("C", "")};

  assert(ChainReconciler::Reconcile(records, "C", false).empty());
  assert(ChainReconciler::Reconcile(records, "", false).empty());
}

void TestAnchorOutsideFirstWindowIsNotFound() {
  RecordSequence records;
  for (int i = 0; i < 10; ++i) {
    records.push_back(MakeRecord("u" + std::to_string(i), "t" + std::to_string(i)));
  }
  // 7th from the end
  records[3].target = "C";

  assert(ChainReconciler::Reconcile(records, "C", false).empty());

  // the same record 5th from the end is found
  records[5].target = "C";
  const auto keep = ChainReconciler::Reconcile(records, "C", false);
  assert(keep.size() == 1);
  assert(keep.front().url == "u5");
}

void TestChainWalkStopsAfterSecondWindow() {
  RecordSequence records;
  records.push_back(MakeRecord("P", "A"));
  for (int i = 0; i < 5; ++i) {
    records.push_back(MakeRecord("x" + std::to_string(i), "y" + std::to_string(i)));
  }
  records.push_back(MakeRecord("A", "C"));

  // five unrelated records sit between the anchor and its predecessor
  auto keep = ChainReconciler::Reconcile(records, "C", false);
  assert(keep.size() == 1);
  assert(keep.front().url == "A");

  // with four the predecessor is still in reach
  records.erase(records.begin() + 1);
  keep = ChainReconciler::Reconcile(records, "C", false);
  assert(keep.size() == 2);
  assert(keep[0].url == "P");
  assert(keep[1].url == "A");
}

void TestInterleavedUnrelatedRecordsAreDropped() {
  const RecordSequence records{MakeRecord("A", "B"), MakeRecord("Z", "Q"), MakeRecord("img", ""), MakeRecord("B", "C")};

  const auto keep = ChainReconciler::Reconcile(records, "C", false);

  assert(keep.size() == 2);
  assert(keep[0].url == "A");
  assert(keep[1].url == "B");
}

void TestFirstMatchWins() {
  const RecordSequence records{MakeRecord("X", "C", "older"), MakeRecord("Y", "C", "newer")};

  const auto keep = ChainReconciler::Reconcile(records, "C", false);

  assert(keep.size() == 1);
  assert(keep.front().rule->uuid() == "newer");
}

void TestReconcileLeavesInputUntouched() {
  const RecordSequence records{MakeRecord("A", "B"), MakeRecord("B", "C"), MakeRecord("Z", "")};

  const auto keep = ChainReconciler::Reconcile(records, "C", false);

  assert(keep.size() == 2);
  assert(records.size() == 3);
  assert(records[2].url == "Z");
}

void TestNotifierSeesStoreAfterReconciliation() {
  Fixture f;
  f.Load({MakeRecord("X", "Y"), MakeRecord("A", "B"), MakeRecord("B", "C")});

  bool notified = false;
  f.notifier->on_notify = [&](reqctl::host::TabId tab_id, std::size_t count) {
    const auto records = f.store->Get(tab_id);
    assert(records.has_value());
    assert(records->size() == count);
    assert(count == 2);
    notified = true;
  };
  f.reconciler.OnNavigationCommitted(MakeCommit("C"));
  assert(notified);

  bool cleared = false;
  f.notifier->on_clear = [&](reqctl::host::TabId tab_id) {
    assert(!f.store->Contains(tab_id));
    cleared = true;
  };
  f.reconciler.OnNavigationCommitted(MakeCommit("elsewhere"));
  assert(cleared);
}

void TestSubFrameCommitIsIgnored() {
  Fixture f;
  f.Load({MakeRecord("A", "B")});

  const auto outcome = f.reconciler.OnNavigationCommitted(MakeCommit("D", false, 3));

  assert(outcome == ChainReconciler::Outcome::kIgnored);
  assert(f.store->Get(kTab)->size() == 1);
  assert(f.notifier->clears.empty());
  assert(f.notifier->notifications.empty());
}

void TestCommitOnTabWithoutRecordsIsIgnored() {
  Fixture f;

  const auto outcome = f.reconciler.OnNavigationCommitted(MakeCommit("C"));

  assert(outcome == ChainReconciler::Outcome::kIgnored);
  assert(f.notifier->clears.empty());
  assert(f.store->tab_count() == 0);
}

void TestServerRedirectQualifierDetection() {
  assert(ChainReconciler::IsServerRedirect(MakeCommit("C", true)));
  assert(!ChainReconciler::IsServerRedirect(MakeCommit("C", false)));

  auto details                  = MakeCommit("C");
  details.transition_qualifiers = {"client_redirect"};
  assert(!ChainReconciler::IsServerRedirect(details));
}

} // namespace

int main() {
  TestTwoHopChainIsKeptInOrder();
  TestUnrelatedCommitClearsTab();
  TestServerRedirectAnchorsOnLatestRedirect();
  TestServerRedirectSkipsRecordsWithoutTarget();
  TestRecordWithoutTargetNeverAnchors();
  TestAnchorOutsideFirstWindowIsNotFound();
  TestChainWalkStopsAfterSecondWindow();
  TestInterleavedUnrelatedRecordsAreDropped();
  TestFirstMatchWins();
  TestReconcileLeavesInputUntouched();
  TestNotifierSeesStoreAfterReconciliation();
  TestSubFrameCommitIsIgnored();
  TestCommitOnTabWithoutRecordsIsIgnored();
  TestServerRedirectQualifierDetection();

  std::cout << "request_control_unit_chain_reconciler: pass\n";
  return 0;
}
