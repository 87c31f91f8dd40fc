#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <grpcpp/grpcpp.h>
#include <grpcpp/security/credentials.h>

#include "internal/node/node_client.hpp"
#include "lnbridge/lnrpc.hpp"

namespace lnbridge::runtime::config {
class NodeConfig;
}

namespace lnbridge::node {

/*
  Attaches the hex-encoded macaroon to every call as "macaroon" metadata,
  which is how lnd authenticates gRPC requests.
*/
class MacaroonCredentials final : public ::grpc::MetadataCredentialsPlugin {
 public:
  explicit MacaroonCredentials(std::string macaroon_hex);

  ::grpc::Status GetMetadata(::grpc::string_ref service_url, ::grpc::string_ref method_name, const ::grpc::AuthContext& channel_auth_context,
                             std::multimap<::grpc::string, ::grpc::string>* metadata) override;

 private:
  std::string macaroon_hex_;
};

// Reads a binary macaroon file and returns it hex encoded.
std::string LoadMacaroonHex(const std::string& path);

// Whole file as bytes; throws std::runtime_error when unreadable.
std::string ReadFileBytes(const std::string& path);

/*
  NodeClient over lnd's Lightning and Router gRPC services.
*/
class LndNodeClient final : public NodeClient {
 public:
  // rpc_timeout of zero leaves unary calls without a deadline.
  LndNodeClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds rpc_timeout = std::chrono::milliseconds{0},
                int32_t payment_timeout_seconds = 60);

  // TLS + macaroon channel to the node described by config.
  static std::shared_ptr<::grpc::Channel> Dial(const lnbridge::runtime::config::NodeConfig& config);

  static std::unique_ptr<LndNodeClient> Connect(const lnbridge::runtime::config::NodeConfig& config);

  lnrpc::ChannelBalanceResponse ChannelBalance() override;

  lnrpc::AddInvoiceResponse AddInvoice(const lnrpc::Invoice& invoice) override;

  std::optional<lnrpc::Invoice> LookupInvoice(const std::string& r_hash) override;

  std::unique_ptr<InvoiceEventStream> SubscribeInvoices() override;

  lnrpc::Payment SendPayment(const routerrpc::SendPaymentRequest& request) override;

  lnrpc::ListPaymentsResponse ListPayments(const lnrpc::ListPaymentsRequest& request) override;

 private:
  void ApplyDeadline(::grpc::ClientContext& ctx) const;

  std::shared_ptr<::grpc::Channel>        channel_;
  std::unique_ptr<lnrpc::Lightning::Stub> lightning_stub_;
  std::unique_ptr<routerrpc::Router::Stub> router_stub_;
  std::chrono::milliseconds               rpc_timeout_;
  int32_t                                 payment_timeout_seconds_;
};

} // namespace lnbridge::node
