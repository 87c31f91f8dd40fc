#include "internal/stream/broadcaster.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using lnbridge::stream::Broadcaster;

void TestTryReceiveNeverBlocks() {
  Broadcaster<int> broadcaster("ints");
  auto             sub = broadcaster.Subscribe();

  assert(!sub->TryReceive().has_value());
  broadcaster.Publish(1);
  assert(sub->Pending() == 1);
  assert(sub->TryReceive() == 1);
  assert(!sub->TryReceive().has_value());
}

void TestReceiveForTimesOut() {
  Broadcaster<int> broadcaster("ints");
  auto             sub = broadcaster.Subscribe();

  const auto started = std::chrono::steady_clock::now();
  assert(!sub->ReceiveFor(std::chrono::milliseconds(50)).has_value());
  assert(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(40));
  assert(!sub->Closed());
}

void TestReceiveWakesOnPublish() {
  Broadcaster<int> broadcaster("ints");
  auto             sub = broadcaster.Subscribe();

  std::atomic<int> received{0};
  std::thread      reader([&] {
    auto value = sub->Receive();
    assert(value.has_value());
    received = *value;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  broadcaster.Publish(42);
  reader.join();
  assert(received == 42);
}

void TestCloseDrainsBeforeEnding() {
  Broadcaster<int> broadcaster("ints");
  auto             sub = broadcaster.Subscribe();

  broadcaster.Publish(1);
  broadcaster.Publish(2);
  broadcaster.Close();

  assert(sub->Closed());
  assert(sub->Receive() == 1);
  assert(sub->Receive() == 2);
  assert(!sub->Receive().has_value());

  bool threw = false;
  try {
    (void)sub->Next();
  } catch (const lnbridge::util::SubscriptionClosed&) {
    threw = true;
  }
  assert(threw);
}

void TestCloseWakesBlockedReceiver() {
  Broadcaster<int> broadcaster("ints");
  auto             sub = broadcaster.Subscribe();

  std::atomic<bool> ended{false};
  std::thread       reader([&] {
    ended = !sub->Receive().has_value();
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  sub->Cancel();
  reader.join();
  assert(ended);
}

} // namespace

int main() {
  TestTryReceiveNeverBlocks();
  TestReceiveForTimesOut();
  TestReceiveWakesOnPublish();
  TestCloseDrainsBeforeEnding();
  TestCloseWakesBlockedReceiver();

  std::cout << "lnbridge_unit_subscription: pass\n";
  return 0;
}
