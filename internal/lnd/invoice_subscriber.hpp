#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/node/node_client.hpp"
#include "internal/stream/broadcaster.hpp"
#include "internal/wallet/types.hpp"

namespace lnbridge::lnd {

/*
  Holds the single SubscribeInvoices stream of a wallet and rebroadcasts
  settlements.

  Non-settled events are dropped. A read error is logged and the loop keeps
  reading. The node ending the stream is fatal for this subsystem: the loop
  exits without resubscribing and the fatal handler runs.
*/
class InvoiceSubscriber {
 public:
  using FatalHandler = std::function<void(const std::string& reason)>;

  InvoiceSubscriber(std::shared_ptr<node::NodeClient> client, std::shared_ptr<stream::Broadcaster<wallet::InvoiceStatus>> broadcaster,
                    FatalHandler on_fatal = {});
  ~InvoiceSubscriber();

  InvoiceSubscriber(const InvoiceSubscriber&)            = delete;
  InvoiceSubscriber& operator=(const InvoiceSubscriber&) = delete;

  // Opens the node stream (throws util::TransportError on failure) and
  // starts the reader thread.
  void Start();
  void Stop();

  // false after the node ended the stream
  bool Healthy() const {
    return healthy_.load();
  }

  std::string FatalReason() const;

 private:
  void Run();

  std::shared_ptr<node::NodeClient>                            client_;
  std::shared_ptr<stream::Broadcaster<wallet::InvoiceStatus>> broadcaster_;
  FatalHandler                                                 on_fatal_;

  std::unique_ptr<node::InvoiceEventStream> stream_;
  std::thread                               thread_;
  std::atomic<bool>                         stopping_{false};
  std::atomic<bool>                         healthy_{true};

  mutable std::mutex mutex_;
  std::string        fatal_reason_;
};

} // namespace lnbridge::lnd
