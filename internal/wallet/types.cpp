#include "types.hpp"

#include <utility>

namespace lnbridge::wallet {

Status ParseStatus(std::string_view text) {
  if (text == "never-tried") {
    return Status::kNeverTried;
  }
  if (text == "pending") {
    return Status::kPending;
  }
  if (text == "failed") {
    return Status::kFailed;
  }
  if (text == "complete") {
    return Status::kComplete;
  }
  return Status::kUnknown;
}

InvoiceStatus MissingInvoice(std::string checking_id) {
  InvoiceStatus status;
  status.checking_id = std::move(checking_id);
  return status;
}

bool IsConsistent(const InvoiceStatus& status) {
  if (!status.exists) {
    return !status.paid && status.msatoshi_received == 0;
  }
  return true;
}

bool IsConsistent(const PaymentStatus& status) {
  if (status.status == Status::kComplete) {
    return true;
  }
  return status.fee_paid == 0 && status.preimage.empty();
}

bool operator==(const InvoiceStatus& lhs, const InvoiceStatus& rhs) {
  return lhs.checking_id == rhs.checking_id && lhs.exists == rhs.exists && lhs.paid == rhs.paid &&
         lhs.msatoshi_received == rhs.msatoshi_received;
}

bool operator==(const PaymentStatus& lhs, const PaymentStatus& rhs) {
  return lhs.checking_id == rhs.checking_id && lhs.status == rhs.status && lhs.fee_paid == rhs.fee_paid &&
         lhs.preimage == rhs.preimage;
}

} // namespace lnbridge::wallet
