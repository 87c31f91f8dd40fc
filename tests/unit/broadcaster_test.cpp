#include "internal/stream/broadcaster.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/wallet/types.hpp"

namespace {

using lnbridge::stream::Broadcaster;
using lnbridge::stream::Subscription;
using lnbridge::wallet::InvoiceStatus;

InvoiceStatus Settled(const std::string& checking_id, int64_t msat) {
  InvoiceStatus status;
  status.checking_id       = checking_id;
  status.exists            = true;
  status.paid              = true;
  status.msatoshi_received = msat;
  return status;
}

void TestEveryEventReachesEverySubscriberInOrder() {
  Broadcaster<InvoiceStatus> broadcaster("invoices");

  std::vector<std::shared_ptr<Subscription<InvoiceStatus>>> subs;
  for (int i = 0; i < 4; ++i) {
    subs.push_back(broadcaster.Subscribe());
  }

  for (int i = 0; i < 10; ++i) {
    assert(broadcaster.Publish(Settled("h" + std::to_string(i), 1000 + i)) == subs.size());
  }

  for (const auto& sub : subs) {
    for (int i = 0; i < 10; ++i) {
      auto event = sub->TryReceive();
      assert(event.has_value());
      assert(event->checking_id == "h" + std::to_string(i));
      assert(event->msatoshi_received == 1000 + i);
    }
    assert(!sub->TryReceive().has_value());
  }
}

void TestStalledSubscriberDoesNotBlockOthers() {
  Broadcaster<int> broadcaster("ints");
  auto             stalled = broadcaster.Subscribe();
  auto             active  = broadcaster.Subscribe();

  constexpr int kEvents = 1000;

  std::atomic<int> seen{0};
  std::thread      reader([&] {
    for (int i = 0; i < kEvents; ++i) {
      auto value = active->Receive();
      assert(value == i);
      ++seen;
    }
  });

  // Nobody reads `stalled`; the producer must still finish promptly.
  const auto started = std::chrono::steady_clock::now();
  for (int i = 0; i < kEvents; ++i) {
    broadcaster.Publish(i);
  }
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));

  reader.join();
  assert(seen == kEvents);

  // Late reader still gets everything, in order.
  assert(stalled->Pending() == kEvents);
  for (int i = 0; i < kEvents; ++i) {
    assert(stalled->TryReceive() == i);
  }
}

void TestCancelledSubscriberIsPruned() {
  Broadcaster<int> broadcaster("ints");
  auto             keep = broadcaster.Subscribe();
  auto             gone = broadcaster.Subscribe();
  assert(broadcaster.SubscriberCount() == 2);

  gone->Cancel();
  assert(broadcaster.Publish(1) == 1);
  assert(broadcaster.SubscriberCount() == 1);
  assert(keep->TryReceive() == 1);
  assert(!gone->TryReceive().has_value());
}

void TestUnsubscribeRemovesEagerly() {
  Broadcaster<int> broadcaster("ints");
  auto             sub = broadcaster.Subscribe();

  broadcaster.Unsubscribe(sub->Id());
  assert(broadcaster.SubscriberCount() == 0);
  assert(sub->Closed());
  assert(broadcaster.Publish(1) == 0);

  // unknown ids are ignored
  broadcaster.Unsubscribe(999);
}

void TestFullMailboxEvictsOnlyThatSubscriber() {
  Broadcaster<int> broadcaster("ints", 2);
  auto             slow = broadcaster.Subscribe();
  auto             fast = broadcaster.Subscribe();

  assert(broadcaster.Publish(1) == 2);
  assert(fast->TryReceive() == 1);
  assert(broadcaster.Publish(2) == 2);
  assert(fast->TryReceive() == 2);

  // slow has two pending; the third overflows it
  assert(broadcaster.Publish(3) == 1);
  assert(slow->Closed());
  assert(broadcaster.SubscriberCount() == 1);
  assert(fast->TryReceive() == 3);

  // what was queued before eviction is still readable
  assert(slow->TryReceive() == 1);
  assert(slow->TryReceive() == 2);
  assert(!slow->TryReceive().has_value());
}

void TestSubscribeAfterCloseThrows() {
  Broadcaster<int> broadcaster("ints");
  broadcaster.Close();

  bool threw = false;
  try {
    (void)broadcaster.Subscribe();
  } catch (const lnbridge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentSubscribeAndPublish() {
  Broadcaster<int> broadcaster("ints");

  constexpr int kSubscribers = 8;
  constexpr int kEvents      = 500;

  std::atomic<bool> stop{false};
  std::thread       publisher([&] {
    int i = 0;
    while (!stop) {
      broadcaster.Publish(i++);
    }
  });

  std::vector<std::thread>                       subscribers;
  std::vector<std::shared_ptr<Subscription<int>>> subs(kSubscribers);
  for (int s = 0; s < kSubscribers; ++s) {
    subscribers.emplace_back([&, s] {
      subs[s] = broadcaster.Subscribe();
      int previous = -1;
      for (int i = 0; i < kEvents; ++i) {
        auto value = subs[s]->Receive();
        assert(value.has_value());
        assert(*value > previous);
        previous = *value;
      }
    });
  }

  for (auto& t : subscribers) {
    t.join();
  }
  stop = true;
  publisher.join();
  assert(broadcaster.SubscriberCount() == kSubscribers);
}

} // namespace

int main() {
  TestEveryEventReachesEverySubscriberInOrder();
  TestStalledSubscriberDoesNotBlockOthers();
  TestCancelledSubscriberIsPruned();
  TestUnsubscribeRemovesEagerly();
  TestFullMailboxEvictsOnlyThatSubscriber();
  TestSubscribeAfterCloseThrows();
  TestConcurrentSubscribeAndPublish();

  std::cout << "lnbridge_unit_broadcaster: pass\n";
  return 0;
}
