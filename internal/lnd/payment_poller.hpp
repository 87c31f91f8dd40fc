#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/node/node_client.hpp"
#include "internal/stream/broadcaster.hpp"
#include "internal/wallet/types.hpp"

namespace lnbridge::lnd {

/*
  Turns lnd's ListPayments cursor into a payment status feed.

  Every interval the poller lists payments past its checkpoint (in-flight
  ones included), broadcasts each record and moves the checkpoint to the
  last_index_offset the node reported. List failures are logged and retried
  on the next tick. Delivery is at-least-once.

  With track_in_flight (the default) every payment seen in flight is held
  and re-read by index on each tick until it turns terminal. A held record
  is broadcast again only when its status changed.
*/
class PaymentPoller {
 public:
  struct Options {
    std::chrono::milliseconds interval{3000};
    uint64_t                  max_payments    = 0;
    bool                      track_in_flight = true;
  };

  PaymentPoller(std::shared_ptr<node::NodeClient> client, std::shared_ptr<stream::Broadcaster<wallet::PaymentStatus>> broadcaster,
                Options options);
  ~PaymentPoller();

  PaymentPoller(const PaymentPoller&)            = delete;
  PaymentPoller& operator=(const PaymentPoller&) = delete;

  void Start();
  void Stop();

  // Index of the newest completed payment, or 0 when there is none or the
  // query fails. Becomes the checkpoint.
  uint64_t ResolveStartCheckpoint();

  // One tick. Returns the number of records broadcast.
  std::size_t PollOnce();

  uint64_t Checkpoint() const {
    return checkpoint_.load();
  }

  // Payments held for re-reading.
  std::size_t InFlightCount() const;

 private:
  void Run();

  std::size_t PollNew();
  std::size_t RecheckInFlight();

  // false when the record matches the last broadcast for a held index
  bool Track(const wallet::PaymentStatus& status, uint64_t index);

  // false once Stop() was requested
  bool SleepInterval();

  std::shared_ptr<node::NodeClient>                            client_;
  std::shared_ptr<stream::Broadcaster<wallet::PaymentStatus>> broadcaster_;
  Options                                                      options_;

  std::atomic<uint64_t> checkpoint_{0};

  // last status broadcast per held in-flight index
  mutable std::mutex                 in_flight_mutex_;
  std::map<uint64_t, wallet::Status> in_flight_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
};

} // namespace lnbridge::lnd
