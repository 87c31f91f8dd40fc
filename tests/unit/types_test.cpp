#include "internal/wallet/types.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using lnbridge::wallet::CanTransition;
using lnbridge::wallet::InvoiceStatus;
using lnbridge::wallet::IsConsistent;
using lnbridge::wallet::IsTerminal;
using lnbridge::wallet::MissingInvoice;
using lnbridge::wallet::ParseStatus;
using lnbridge::wallet::PaymentStatus;
using lnbridge::wallet::Status;
using lnbridge::wallet::ToString;

void TestStatusNamesRoundTrip() {
  for (auto status : {Status::kUnknown, Status::kNeverTried, Status::kPending, Status::kFailed, Status::kComplete}) {
    assert(ParseStatus(ToString(status)) == status);
  }
  assert(ToString(Status::kNeverTried) == "never-tried");
  assert(ParseStatus("settled") == Status::kUnknown);
  assert(ParseStatus("") == Status::kUnknown);
}

void TestTerminalStates() {
  assert(!IsTerminal(Status::kUnknown));
  assert(!IsTerminal(Status::kPending));
  assert(IsTerminal(Status::kNeverTried));
  assert(IsTerminal(Status::kFailed));
  assert(IsTerminal(Status::kComplete));
}

void TestTransitionsOnlyMoveTowardTerminal() {
  assert(CanTransition(Status::kPending, Status::kComplete));
  assert(CanTransition(Status::kPending, Status::kFailed));
  assert(CanTransition(Status::kPending, Status::kNeverTried));
  assert(CanTransition(Status::kPending, Status::kPending));
  assert(CanTransition(Status::kUnknown, Status::kPending));

  assert(!CanTransition(Status::kComplete, Status::kPending));
  assert(!CanTransition(Status::kFailed, Status::kPending));
  assert(!CanTransition(Status::kNeverTried, Status::kPending));
  assert(!CanTransition(Status::kComplete, Status::kFailed));
  assert(!CanTransition(Status::kPending, Status::kUnknown));
}

void TestMissingInvoiceIsConsistent() {
  const auto missing = MissingInvoice("abcd");
  assert(missing.checking_id == "abcd");
  assert(!missing.exists);
  assert(!missing.paid);
  assert(missing.msatoshi_received == 0);
  assert(IsConsistent(missing));

  InvoiceStatus broken = missing;
  broken.paid          = true;
  assert(!IsConsistent(broken));

  broken                   = missing;
  broken.msatoshi_received = 5;
  assert(!IsConsistent(broken));
}

void TestOnlyCompletePaymentsCarryFeeAndPreimage() {
  PaymentStatus complete;
  complete.status   = Status::kComplete;
  complete.fee_paid = 3;
  complete.preimage = "00ff";
  assert(IsConsistent(complete));

  PaymentStatus pending = complete;
  pending.status        = Status::kPending;
  assert(!IsConsistent(pending));

  pending.fee_paid = 0;
  pending.preimage.clear();
  assert(IsConsistent(pending));
}

} // namespace

int main() {
  TestStatusNamesRoundTrip();
  TestTerminalStates();
  TestTransitionsOnlyMoveTowardTerminal();
  TestMissingInvoiceIsConsistent();
  TestOnlyCompletePaymentsCarryFeeAndPreimage();

  std::cout << "lnbridge_unit_types: pass\n";
  return 0;
}
