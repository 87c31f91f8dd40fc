#pragma once

#include <optional>

#include "internal/wallet/types.hpp"
#include "lnbridge/lnrpc.hpp"

namespace lnbridge::lnd {

/*
  Maps an lnd payment record onto the shared payment state machine.

    IN_FLIGHT                  -> pending
    FAILED, no HTLC attempts   -> never-tried
    FAILED, >= 1 HTLC attempt  -> failed
    SUCCEEDED                  -> complete (fee and preimage filled in)
    anything else              -> unknown

  checking_id is always the record's own payment_index.
*/
wallet::PaymentStatus ToPaymentStatus(const lnrpc::Payment& payment);

// Settled invoice events become paid statuses; every other state is dropped.
std::optional<wallet::InvoiceStatus> ToSettledInvoiceStatus(const lnrpc::Invoice& invoice);

} // namespace lnbridge::lnd
