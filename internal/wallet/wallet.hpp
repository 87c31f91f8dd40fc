#pragma once

#include <memory>
#include <string>

#include "internal/stream/subscription.hpp"
#include "internal/wallet/types.hpp"

namespace lnbridge::wallet {

using InvoiceSubscription = stream::Subscription<InvoiceStatus>;
using PaymentSubscription = stream::Subscription<PaymentStatus>;

/*
  Capability contract every payment-node backend implements.

  All calls may run concurrently from several threads. Failures raise the
  types in internal/util/errors.hpp:
    - util::TransportError     node call failed
    - util::InvalidCheckingId  checkingID does not parse for this backend
    - util::NotFound           GetPaymentStatus found no record
*/
class Wallet {
 public:
  virtual ~Wallet() = default;

  virtual std::string Kind() const = 0;

  virtual WalletInfo GetInfo() = 0;

  // Either a complete InvoiceData comes back or the call throws.
  virtual InvoiceData CreateInvoice(const InvoiceParams& params) = 0;

  // An unknown id is reported as exists=false, not thrown.
  virtual InvoiceStatus GetInvoiceStatus(const std::string& checking_id) = 0;

  // Each call registers an independent subscriber that receives every
  // settlement from now on (at-least-once). Cancel() the subscription to stop.
  virtual std::shared_ptr<InvoiceSubscription> PaidInvoicesStream() = 0;

  // Returns once the node has acknowledged the attempt, not when it completes.
  virtual PaymentData MakePayment(const PaymentParams& params) = 0;

  virtual PaymentStatus GetPaymentStatus(const std::string& checking_id) = 0;

  virtual std::shared_ptr<PaymentSubscription> PaymentsStream() = 0;
};

} // namespace lnbridge::wallet
