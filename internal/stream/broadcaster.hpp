#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/stream/subscription.hpp"
#include "internal/util/errors.hpp"

namespace lnbridge::stream {

/*
  Fans one event class out to every live subscriber.

  Publish() never blocks on a subscriber: each event is queued into every
  subscriber's mailbox, in publish order. A subscriber whose bounded mailbox
  is full is evicted rather than stalling the producer or losing events
  silently.
*/
template <typename T>
class Broadcaster {
 public:
  using SubscriptionPtr = std::shared_ptr<Subscription<T>>;

  explicit Broadcaster(std::string name, std::size_t max_pending = 0) : name_(std::move(name)), max_pending_(max_pending) {
  }

  Broadcaster(const Broadcaster&)            = delete;
  Broadcaster& operator=(const Broadcaster&) = delete;

  SubscriptionPtr Subscribe() {
    std::lock_guard lock(mutex_);
    if (closed_) {
      throw util::InvalidState(name_ + ": subscribe after shutdown");
    }
    auto subscription = std::make_shared<Subscription<T>>(next_id_++, max_pending_);
    subscribers_.push_back(subscription);
    return subscription;
  }

  void Unsubscribe(uint64_t id) {
    SubscriptionPtr removed;
    {
      std::lock_guard lock(mutex_);
      auto it = std::find_if(subscribers_.begin(), subscribers_.end(), [&](const SubscriptionPtr& s) { return s->Id() == id; });
      if (it == subscribers_.end()) {
        return;
      }
      removed = std::move(*it);
      subscribers_.erase(it);
    }
    removed->Close();
  }

  // Returns the number of subscribers the event was queued for.
  std::size_t Publish(const T& event) {
    std::vector<SubscriptionPtr> snapshot;
    {
      std::lock_guard lock(mutex_);
      snapshot = subscribers_;
    }

    std::size_t           delivered = 0;
    std::vector<uint64_t> dead;
    for (const auto& subscription : snapshot) {
      switch (subscription->Offer(event)) {
        case Subscription<T>::OfferResult::kQueued:
          ++delivered;
          break;
        case Subscription<T>::OfferResult::kOverflow:
          LNBRIDGE_LOG_WARN("Evicting slow subscriber",
                            {observability::StringField("stream", name_), observability::UintField("subscriber", subscription->Id()),
                             observability::UintField("max_pending", max_pending_)});
          subscription->Close();
          dead.push_back(subscription->Id());
          break;
        case Subscription<T>::OfferResult::kClosed:
          dead.push_back(subscription->Id());
          break;
      }
    }

    if (!dead.empty()) {
      Prune(dead);
    }
    return delivered;
  }

  // Closes every subscription; later Subscribe() calls throw InvalidState.
  void Close() {
    std::vector<SubscriptionPtr> subscribers;
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
      subscribers.swap(subscribers_);
    }
    for (const auto& subscription : subscribers) {
      subscription->Close();
    }
  }

  std::size_t SubscriberCount() const {
    std::lock_guard lock(mutex_);
    return subscribers_.size();
  }

  const std::string& Name() const {
    return name_;
  }

 private:
  void Prune(const std::vector<uint64_t>& ids) {
    std::lock_guard lock(mutex_);
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [&](const SubscriptionPtr& s) { return std::find(ids.begin(), ids.end(), s->Id()) != ids.end(); }),
                       subscribers_.end());
  }

  const std::string name_;
  const std::size_t max_pending_;

  mutable std::mutex           mutex_;
  std::vector<SubscriptionPtr> subscribers_;
  uint64_t                     next_id_ = 1;
  bool                         closed_  = false;
};

} // namespace lnbridge::stream
