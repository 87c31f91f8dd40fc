#include "lnd_wallet.hpp"

#include <charconv>
#include <cstdint>
#include <system_error>
#include <utility>

#include "internal/lnd/status_translator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace lnbridge::lnd {

namespace {

constexpr std::size_t kPaymentHashBytes = 32;

std::string ParsePaymentHash(const std::string& checking_id) {
  auto hash = util::HexDecode(checking_id);
  if (!hash) {
    throw util::InvalidCheckingId("'" + checking_id + "' is not hex");
  }
  if (hash->size() != kPaymentHashBytes) {
    throw util::InvalidCheckingId("'" + checking_id + "' is not a 32-byte payment hash");
  }
  return *hash;
}

uint64_t ParsePaymentIndex(const std::string& checking_id) {
  uint64_t    index = 0;
  const char* begin = checking_id.data();
  const char* end   = begin + checking_id.size();

  auto [ptr, ec] = std::from_chars(begin, end, index);
  if (checking_id.empty() || ec != std::errc() || ptr != end) {
    throw util::InvalidCheckingId("'" + checking_id + "' is not a payment index");
  }
  if (index == 0) {
    throw util::InvalidCheckingId("payment indexes start at 1");
  }
  return index;
}

} // namespace

LndWallet::LndWallet(std::shared_ptr<node::NodeClient> client, Options options)
    : client_(std::move(client)),
      invoice_broadcaster_(std::make_shared<stream::Broadcaster<wallet::InvoiceStatus>>("invoices", options.max_pending_events)),
      payment_broadcaster_(std::make_shared<stream::Broadcaster<wallet::PaymentStatus>>("payments", options.max_pending_events)),
      invoices_(client_, invoice_broadcaster_, std::move(options.on_fatal)),
      payments_(client_, payment_broadcaster_, options.poller) {
}

LndWallet::~LndWallet() {
  Stop();
}

void LndWallet::Start() {
  invoices_.Start();
  payments_.Start();
}

void LndWallet::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  payments_.Stop();
  invoices_.Stop();
  invoice_broadcaster_->Close();
  payment_broadcaster_->Close();
}

bool LndWallet::Healthy() const {
  return invoices_.Healthy();
}

std::string LndWallet::Kind() const {
  return "lnd";
}

wallet::WalletInfo LndWallet::GetInfo() {
  const auto balance = client_->ChannelBalance();

  wallet::WalletInfo info;
  info.balance = static_cast<int64_t>(balance.local_balance().sat());
  return info;
}

wallet::InvoiceData LndWallet::CreateInvoice(const wallet::InvoiceParams& params) {
  if (params.amount < 0) {
    throw util::InvalidState("create invoice: amount must not be negative, got " + std::to_string(params.amount) + " msat");
  }

  lnrpc::Invoice req;
  req.set_memo(params.description);
  req.set_description_hash(params.description_hash);
  req.set_value_msat(params.amount);
  if (params.expiry) {
    req.set_expiry(params.expiry->count());
  }

  const auto added = client_->AddInvoice(req);

  // AddInvoice only returns the hash; the preimage needs a lookup.
  auto invoice = client_->LookupInvoice(added.r_hash());
  if (!invoice) {
    throw util::NotFound("error calling LookupInvoice: invoice " + util::HexEncode(added.r_hash()) + " vanished after AddInvoice");
  }

  wallet::InvoiceData data;
  data.checking_id = util::HexEncode(invoice->r_hash());
  data.preimage    = util::HexEncode(invoice->r_preimage());
  data.invoice     = invoice->payment_request();
  return data;
}

wallet::InvoiceStatus LndWallet::GetInvoiceStatus(const std::string& checking_id) {
  const auto r_hash = ParsePaymentHash(checking_id);

  auto invoice = client_->LookupInvoice(r_hash);
  if (!invoice) {
    return wallet::MissingInvoice(checking_id);
  }

  wallet::InvoiceStatus status;
  status.checking_id       = checking_id;
  status.exists            = true;
  status.paid              = invoice->state() == lnrpc::Invoice::SETTLED;
  status.msatoshi_received = invoice->amt_paid_msat();
  return status;
}

std::shared_ptr<wallet::InvoiceSubscription> LndWallet::PaidInvoicesStream() {
  return invoice_broadcaster_->Subscribe();
}

wallet::PaymentData LndWallet::MakePayment(const wallet::PaymentParams& params) {
  if (params.invoice.empty()) {
    throw util::InvalidState("make payment: missing invoice; set invoice and retry");
  }

  routerrpc::SendPaymentRequest req;
  req.set_payment_request(params.invoice);
  if (params.custom_amount != 0) {
    req.set_amt_msat(params.custom_amount);
  }

  const auto first = client_->SendPayment(req);

  LNBRIDGE_LOG_INFO("Payment dispatched", {observability::UintField("payment_index", first.payment_index())});

  wallet::PaymentData data;
  data.checking_id = std::to_string(first.payment_index());
  return data;
}

wallet::PaymentStatus LndWallet::GetPaymentStatus(const std::string& checking_id) {
  const auto index = ParsePaymentIndex(checking_id);

  lnrpc::ListPaymentsRequest req;
  req.set_include_incomplete(true);
  req.set_index_offset(index - 1);
  req.set_max_payments(1);
  req.set_reversed(false);

  const auto resp = client_->ListPayments(req);
  if (resp.payments_size() == 0 || resp.payments(0).payment_index() != index) {
    throw util::NotFound("payment with ID " + checking_id + " not found");
  }
  return ToPaymentStatus(resp.payments(0));
}

std::shared_ptr<wallet::PaymentSubscription> LndWallet::PaymentsStream() {
  return payment_broadcaster_->Subscribe();
}

} // namespace lnbridge::lnd
