#include "status_translator.hpp"

#include <string>

#include "internal/util/hex.hpp"

namespace lnbridge::lnd {

wallet::PaymentStatus ToPaymentStatus(const lnrpc::Payment& payment) {
  wallet::PaymentStatus status;
  status.checking_id = std::to_string(payment.payment_index());
  status.status      = wallet::Status::kUnknown;

  switch (payment.status()) {
    case lnrpc::Payment::IN_FLIGHT:
      status.status = wallet::Status::kPending;
      return status;
    case lnrpc::Payment::FAILED:
      status.status = payment.htlcs_size() == 0 ? wallet::Status::kNeverTried : wallet::Status::kFailed;
      return status;
    case lnrpc::Payment::SUCCEEDED:
      status.status   = wallet::Status::kComplete;
      status.fee_paid = payment.fee_msat();
      status.preimage = payment.payment_preimage();
      return status;
    default:
      return status;
  }
}

std::optional<wallet::InvoiceStatus> ToSettledInvoiceStatus(const lnrpc::Invoice& invoice) {
  if (invoice.state() != lnrpc::Invoice::SETTLED) {
    return std::nullopt;
  }

  wallet::InvoiceStatus status;
  status.checking_id       = util::HexEncode(invoice.r_hash());
  status.exists            = true;
  status.paid              = true;
  status.msatoshi_received = invoice.amt_paid_msat();
  return status;
}

} // namespace lnbridge::lnd
