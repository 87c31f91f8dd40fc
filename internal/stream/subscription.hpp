#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace lnbridge::stream {

template <typename T>
class Broadcaster;

/*
  Receive side of one subscriber.

  Events queue in a private FIFO mailbox so the producer never waits on a
  slow reader. Once closed, queued events still drain before receives start
  returning std::nullopt.
*/
template <typename T>
class Subscription {
 public:
  // max_pending == 0 means unbounded
  Subscription(uint64_t id, std::size_t max_pending) : id_(id), max_pending_(max_pending) {
  }

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  uint64_t Id() const {
    return id_;
  }

  // blocking wait
  std::optional<T> Receive() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });
    return PopLocked();
  }

  template <typename Rep, typename Period>
  std::optional<T> ReceiveFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });
    return PopLocked();
  }

  std::optional<T> TryReceive() {
    std::lock_guard lock(mutex_);
    return PopLocked();
  }

  // Like Receive() but throws once the subscription is closed and drained.
  T Next() {
    auto event = Receive();
    if (!event) {
      throw util::SubscriptionClosed("subscription " + std::to_string(id_) + " is closed");
    }
    return std::move(*event);
  }

  // Stops delivery. The broadcaster drops the subscription on its next publish.
  void Cancel() {
    Close();
  }

  bool Closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::size_t Pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  friend class Broadcaster<T>;

  enum class OfferResult {
    kQueued,
    kClosed,
    kOverflow,
  };

  OfferResult Offer(const T& event) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return OfferResult::kClosed;
      }
      if (max_pending_ > 0 && queue_.size() >= max_pending_) {
        return OfferResult::kOverflow;
      }
      queue_.push_back(event);
    }
    cv_.notify_one();
    return OfferResult::kQueued;
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  std::optional<T> PopLocked() {
    if (queue_.empty()) {
      return std::nullopt;
    }
    T event = std::move(queue_.front());
    queue_.pop_front();
    return event;
  }

  const uint64_t    id_;
  const std::size_t max_pending_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<T>           queue_;
  bool                    closed_ = false;
};

} // namespace lnbridge::stream
