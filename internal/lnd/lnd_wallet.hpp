#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "internal/lnd/invoice_subscriber.hpp"
#include "internal/lnd/payment_poller.hpp"
#include "internal/node/node_client.hpp"
#include "internal/stream/broadcaster.hpp"
#include "internal/wallet/wallet.hpp"

namespace lnbridge::lnd {

/*
  Wallet backed by an lnd node.

  Settlements come from lnd's invoice subscription; payment updates come
  from polling ListPayments. Both feed per-class broadcasters that every
  PaidInvoicesStream()/PaymentsStream() subscriber hangs off.
*/
class LndWallet final : public wallet::Wallet {
 public:
  struct Options {
    PaymentPoller::Options poller;

    // per-subscriber mailbox bound, 0 = unbounded
    std::size_t max_pending_events = 0;

    InvoiceSubscriber::FatalHandler on_fatal;
  };

  LndWallet(std::shared_ptr<node::NodeClient> client, Options options);
  ~LndWallet() override;

  LndWallet(const LndWallet&)            = delete;
  LndWallet& operator=(const LndWallet&) = delete;

  // Opens the invoice subscription and starts the payment poller.
  void Start();

  // Stops both loops and closes every subscription.
  void Stop();

  // false once the invoice subscription was lost
  bool Healthy() const;

  std::string Kind() const override;

  wallet::WalletInfo GetInfo() override;

  wallet::InvoiceData CreateInvoice(const wallet::InvoiceParams& params) override;

  wallet::InvoiceStatus GetInvoiceStatus(const std::string& checking_id) override;

  std::shared_ptr<wallet::InvoiceSubscription> PaidInvoicesStream() override;

  wallet::PaymentData MakePayment(const wallet::PaymentParams& params) override;

  wallet::PaymentStatus GetPaymentStatus(const std::string& checking_id) override;

  std::shared_ptr<wallet::PaymentSubscription> PaymentsStream() override;

 private:
  std::shared_ptr<node::NodeClient>                            client_;
  std::shared_ptr<stream::Broadcaster<wallet::InvoiceStatus>> invoice_broadcaster_;
  std::shared_ptr<stream::Broadcaster<wallet::PaymentStatus>> payment_broadcaster_;

  InvoiceSubscriber invoices_;
  PaymentPoller     payments_;

  std::atomic<bool> stopped_{false};
};

} // namespace lnbridge::lnd
