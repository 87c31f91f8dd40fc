#pragma once

#include <memory>
#include <optional>
#include <string>

#include "lnbridge/lnrpc.hpp"

namespace lnbridge::node {

/*
  Live SubscribeInvoices stream.

  Next() blocks for the next event and returns std::nullopt once the node
  ends the stream. A transient read failure throws util::TransportError and
  the stream stays usable.
*/
class InvoiceEventStream {
 public:
  virtual ~InvoiceEventStream() = default;

  virtual std::optional<lnrpc::Invoice> Next() = 0;

  // Unblocks a pending Next() from another thread.
  virtual void Cancel() = 0;
};

/*
  The node RPC surface the wallet adapter consumes.

  Every call throws util::TransportError on failure. No call carries a
  deadline unless the implementation was configured with one.
*/
class NodeClient {
 public:
  virtual ~NodeClient() = default;

  virtual lnrpc::ChannelBalanceResponse ChannelBalance() = 0;

  virtual lnrpc::AddInvoiceResponse AddInvoice(const lnrpc::Invoice& invoice) = 0;

  // std::nullopt when the node does not know the hash.
  virtual std::optional<lnrpc::Invoice> LookupInvoice(const std::string& r_hash) = 0;

  virtual std::unique_ptr<InvoiceEventStream> SubscribeInvoices() = 0;

  // First update of the send stream; carries the assigned payment_index.
  virtual lnrpc::Payment SendPayment(const routerrpc::SendPaymentRequest& request) = 0;

  virtual lnrpc::ListPaymentsResponse ListPayments(const lnrpc::ListPaymentsRequest& request) = 0;
};

} // namespace lnbridge::node
