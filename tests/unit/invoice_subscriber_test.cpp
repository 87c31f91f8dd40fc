#include "internal/lnd/invoice_subscriber.hpp"

#include <atomic>
#include <cassert>
#include <functional>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "fake_node_client.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace {

using lnbridge::lnd::InvoiceSubscriber;
using lnbridge::stream::Broadcaster;
using lnbridge::testing::FakeNodeClient;
using lnbridge::wallet::InvoiceStatus;

lnrpc::Invoice Event(char tag, lnrpc::Invoice::InvoiceState state, int64_t amt_paid_msat) {
  lnrpc::Invoice invoice;
  invoice.set_r_hash(FakeNodeClient::FixedBytes(tag, 1));
  invoice.set_state(state);
  invoice.set_amt_paid_msat(amt_paid_msat);
  return invoice;
}

bool WaitFor(const std::function<bool()>& predicate) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

void TestOnlySettledEventsAreBroadcast() {
  auto node        = std::make_shared<FakeNodeClient>();
  auto broadcaster = std::make_shared<Broadcaster<InvoiceStatus>>("invoices");
  auto sub         = broadcaster->Subscribe();

  InvoiceSubscriber subscriber(node, broadcaster);
  subscriber.Start();
  assert(node->SubscribeCalls() == 1);

  auto feed = node->Feed();
  feed->PushEvent(Event('a', lnrpc::Invoice::OPEN, 0));
  feed->PushEvent(Event('b', lnrpc::Invoice::ACCEPTED, 0));
  feed->PushEvent(Event('c', lnrpc::Invoice::SETTLED, 21000));
  feed->PushEvent(Event('d', lnrpc::Invoice::CANCELED, 0));
  feed->PushEvent(Event('e', lnrpc::Invoice::SETTLED, 5000));

  auto first = sub->ReceiveFor(std::chrono::seconds(5));
  assert(first.has_value());
  assert(first->checking_id == lnbridge::util::HexEncode(FakeNodeClient::FixedBytes('c', 1)));
  assert(first->exists && first->paid);
  assert(first->msatoshi_received == 21000);

  auto second = sub->ReceiveFor(std::chrono::seconds(5));
  assert(second.has_value());
  assert(second->checking_id == lnbridge::util::HexEncode(FakeNodeClient::FixedBytes('e', 1)));
  assert(second->msatoshi_received == 5000);

  subscriber.Stop();
  assert(!sub->TryReceive().has_value());
  assert(subscriber.Healthy());
}

void TestReadErrorDoesNotEndTheLoop() {
  auto node        = std::make_shared<FakeNodeClient>();
  auto broadcaster = std::make_shared<Broadcaster<InvoiceStatus>>("invoices");
  auto sub         = broadcaster->Subscribe();

  std::atomic<int>  fatal_calls{0};
  InvoiceSubscriber subscriber(node, broadcaster, [&](const std::string&) { ++fatal_calls; });
  subscriber.Start();

  auto feed = node->Feed();
  feed->PushError("connection reset");
  feed->PushError("connection reset");
  feed->PushEvent(Event('f', lnrpc::Invoice::SETTLED, 1));

  auto event = sub->ReceiveFor(std::chrono::seconds(5));
  assert(event.has_value());
  assert(event->msatoshi_received == 1);
  assert(subscriber.Healthy());

  subscriber.Stop();
  assert(fatal_calls == 0);
}

void TestStreamEndIsFatal() {
  auto node        = std::make_shared<FakeNodeClient>();
  auto broadcaster = std::make_shared<Broadcaster<InvoiceStatus>>("invoices");
  auto sub         = broadcaster->Subscribe();

  std::mutex  mutex;
  std::string reason;
  int         fatal_calls = 0;

  InvoiceSubscriber subscriber(node, broadcaster, [&](const std::string& why) {
    std::lock_guard lock(mutex);
    reason = why;
    ++fatal_calls;
  });
  subscriber.Start();

  node->Feed()->PushEnd();
  assert(WaitFor([&] { return !subscriber.Healthy(); }));
  assert(WaitFor([&] {
    std::lock_guard lock(mutex);
    return fatal_calls == 1;
  }));
  assert(!subscriber.FatalReason().empty());
  assert(reason == subscriber.FatalReason());

  // no automatic resubscribe
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(node->SubscribeCalls() == 1);

  subscriber.Stop();
  std::lock_guard lock(mutex);
  assert(fatal_calls == 1);
}

void TestStopIsNotFatal() {
  auto node        = std::make_shared<FakeNodeClient>();
  auto broadcaster = std::make_shared<Broadcaster<InvoiceStatus>>("invoices");

  std::atomic<int>  fatal_calls{0};
  InvoiceSubscriber subscriber(node, broadcaster, [&](const std::string&) { ++fatal_calls; });
  subscriber.Start();
  subscriber.Stop();

  assert(node->Feed()->Cancelled());
  assert(subscriber.Healthy());
  assert(fatal_calls == 0);
  subscriber.Stop();
}

void TestSubscribeFailureThrows() {
  auto node = std::make_shared<FakeNodeClient>();
  node->FailSubscribe(true);
  auto broadcaster = std::make_shared<Broadcaster<InvoiceStatus>>("invoices");

  InvoiceSubscriber subscriber(node, broadcaster);
  bool              threw = false;
  try {
    subscriber.Start();
  } catch (const lnbridge::util::TransportError& e) {
    threw = true;
    assert(e.code() == lnbridge::testing::kUnavailable);
  }
  assert(threw);
  subscriber.Stop();
}

} // namespace

int main() {
  TestOnlySettledEventsAreBroadcast();
  TestReadErrorDoesNotEndTheLoop();
  TestStreamEndIsFatal();
  TestStopIsNotFatal();
  TestSubscribeFailureThrows();

  std::cout << "lnbridge_unit_invoice_subscriber: pass\n";
  return 0;
}
