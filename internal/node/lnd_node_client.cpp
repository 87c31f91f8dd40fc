#include "internal/node/lnd_node_client.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "config/config.pb.h"
#include "internal/node/grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/hex.hpp"

namespace lnbridge::node {

namespace {

constexpr int kMaxReceiveMessageBytes = 50 * 1024 * 1024;

/*
  SubscribeInvoices reader.

  A failed read finishes the call: the first Next() after that throws the
  final status (unless it is OK or the stream was cancelled locally) and
  every later Next() reports end of stream.
*/
class GrpcInvoiceEventStream final : public InvoiceEventStream {
 public:
  GrpcInvoiceEventStream(std::unique_ptr<::grpc::ClientContext> context, std::unique_ptr<::grpc::ClientReader<lnrpc::Invoice>> reader)
      : context_(std::move(context)), reader_(std::move(reader)) {
  }

  ~GrpcInvoiceEventStream() override {
    if (!finished_) {
      context_->TryCancel();
      (void)reader_->Finish();
    }
  }

  std::optional<lnrpc::Invoice> Next() override {
    if (finished_) {
      return std::nullopt;
    }

    lnrpc::Invoice invoice;
    if (reader_->Read(&invoice)) {
      return invoice;
    }

    finished_         = true;
    const auto status = reader_->Finish();
    if (status.ok() || status.error_code() == ::grpc::StatusCode::CANCELLED) {
      return std::nullopt;
    }
    throw ToTransportError("SubscribeInvoices", status);
  }

  void Cancel() override {
    context_->TryCancel();
  }

 private:
  std::unique_ptr<::grpc::ClientContext>                 context_;
  std::unique_ptr<::grpc::ClientReader<lnrpc::Invoice>> reader_;
  bool                                                   finished_ = false;
};

} // namespace

// ------------------------------------------------------------
// Credentials
// ------------------------------------------------------------

MacaroonCredentials::MacaroonCredentials(std::string macaroon_hex) : macaroon_hex_(std::move(macaroon_hex)) {
}

::grpc::Status MacaroonCredentials::GetMetadata(::grpc::string_ref, ::grpc::string_ref, const ::grpc::AuthContext&,
                                                std::multimap<::grpc::string, ::grpc::string>* metadata) {
  metadata->insert(std::make_pair("macaroon", macaroon_hex_));
  return ::grpc::Status::OK;
}

std::string ReadFileBytes(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open " + path);
  }
  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw std::runtime_error("Failed to read " + path);
  }
  return bytes;
}

std::string LoadMacaroonHex(const std::string& path) {
  auto bytes = ReadFileBytes(path);
  if (bytes.empty()) {
    throw std::runtime_error("Macaroon file is empty: " + path);
  }
  return util::HexEncode(bytes);
}

// ------------------------------------------------------------
// LndNodeClient
// ------------------------------------------------------------

LndNodeClient::LndNodeClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds rpc_timeout, int32_t payment_timeout_seconds)
    : channel_(std::move(channel)),
      lightning_stub_(lnrpc::Lightning::NewStub(channel_)),
      router_stub_(routerrpc::Router::NewStub(channel_)),
      rpc_timeout_(rpc_timeout),
      payment_timeout_seconds_(payment_timeout_seconds) {
}

std::shared_ptr<::grpc::Channel> LndNodeClient::Dial(const lnbridge::runtime::config::NodeConfig& config) {
  ::grpc::SslCredentialsOptions ssl_options;
  ssl_options.pem_root_certs = ReadFileBytes(config.tls_cert_path());

  auto macaroon = std::make_unique<MacaroonCredentials>(LoadMacaroonHex(config.macaroon_path()));
  auto credentials =
      ::grpc::CompositeChannelCredentials(::grpc::SslCredentials(ssl_options), ::grpc::MetadataCredentialsFromPlugin(std::move(macaroon)));

  ::grpc::ChannelArguments args;
  args.SetMaxReceiveMessageSize(kMaxReceiveMessageBytes);
  if (!config.tls_server_name_override().empty()) {
    args.SetSslTargetNameOverride(config.tls_server_name_override());
  }

  const std::string host = config.host().empty() ? "localhost:10009" : config.host();
  auto              channel = ::grpc::CreateCustomChannel(host, credentials, args);

  if (config.connect_timeout_ms() > 0) {
    const auto deadline = std::chrono::system_clock::now() + std::chrono::milliseconds(config.connect_timeout_ms());
    if (!channel->WaitForConnected(deadline)) {
      throw util::TransportError("error connecting to lnd at " + host + ": not ready after " +
                                     std::to_string(config.connect_timeout_ms()) + "ms",
                                 static_cast<int>(::grpc::StatusCode::UNAVAILABLE));
    }
  }

  LNBRIDGE_LOG_INFO("Dialed lnd", {observability::StringField("host", host)});
  return channel;
}

std::unique_ptr<LndNodeClient> LndNodeClient::Connect(const lnbridge::runtime::config::NodeConfig& config) {
  const int32_t payment_timeout = config.payment_timeout_seconds() == 0 ? 60 : static_cast<int32_t>(config.payment_timeout_seconds());
  return std::make_unique<LndNodeClient>(Dial(config), std::chrono::milliseconds(config.rpc_timeout_ms()), payment_timeout);
}

void LndNodeClient::ApplyDeadline(::grpc::ClientContext& ctx) const {
  if (rpc_timeout_.count() > 0) {
    ctx.set_deadline(std::chrono::system_clock::now() + rpc_timeout_);
  }
}

lnrpc::ChannelBalanceResponse LndNodeClient::ChannelBalance() {
  ::grpc::ClientContext ctx;
  ApplyDeadline(ctx);

  lnrpc::ChannelBalanceRequest  req;
  lnrpc::ChannelBalanceResponse resp;
  ThrowIfError("ChannelBalance", lightning_stub_->ChannelBalance(&ctx, req, &resp));
  return resp;
}

lnrpc::AddInvoiceResponse LndNodeClient::AddInvoice(const lnrpc::Invoice& invoice) {
  ::grpc::ClientContext ctx;
  ApplyDeadline(ctx);

  lnrpc::AddInvoiceResponse resp;
  ThrowIfError("AddInvoice", lightning_stub_->AddInvoice(&ctx, invoice, &resp));
  return resp;
}

std::optional<lnrpc::Invoice> LndNodeClient::LookupInvoice(const std::string& r_hash) {
  ::grpc::ClientContext ctx;
  ApplyDeadline(ctx);

  lnrpc::PaymentHash req;
  req.set_r_hash(r_hash);
  lnrpc::Invoice resp;

  const auto status = lightning_stub_->LookupInvoice(&ctx, req, &resp);
  if (IsInvoiceNotFound(status)) {
    return std::nullopt;
  }
  ThrowIfError("LookupInvoice", status);
  return resp;
}

std::unique_ptr<InvoiceEventStream> LndNodeClient::SubscribeInvoices() {
  auto ctx = std::make_unique<::grpc::ClientContext>();

  lnrpc::InvoiceSubscription req;
  auto                       reader = lightning_stub_->SubscribeInvoices(ctx.get(), req);
  if (!reader) {
    throw util::TransportError("error calling SubscribeInvoices: no reader", static_cast<int>(::grpc::StatusCode::INTERNAL));
  }
  return std::make_unique<GrpcInvoiceEventStream>(std::move(ctx), std::move(reader));
}

lnrpc::Payment LndNodeClient::SendPayment(const routerrpc::SendPaymentRequest& request) {
  ::grpc::ClientContext ctx;
  ApplyDeadline(ctx);

  routerrpc::SendPaymentRequest req = request;
  if (req.timeout_seconds() == 0) {
    req.set_timeout_seconds(payment_timeout_seconds_);
  }

  auto reader = router_stub_->SendPaymentV2(&ctx, req);

  lnrpc::Payment first;
  if (reader->Read(&first)) {
    // The payment keeps going inside lnd after the update stream is dropped.
    ctx.TryCancel();
    (void)reader->Finish();
    return first;
  }

  const auto status = reader->Finish();
  if (status.ok()) {
    throw util::TransportError("error getting response from SendPaymentV2: stream ended without an update",
                               static_cast<int>(::grpc::StatusCode::INTERNAL));
  }
  throw ToTransportError("SendPaymentV2", status);
}

lnrpc::ListPaymentsResponse LndNodeClient::ListPayments(const lnrpc::ListPaymentsRequest& request) {
  ::grpc::ClientContext ctx;
  ApplyDeadline(ctx);

  lnrpc::ListPaymentsResponse resp;
  ThrowIfError("ListPayments", lightning_stub_->ListPayments(&ctx, request, &resp));
  return resp;
}

} // namespace lnbridge::node
