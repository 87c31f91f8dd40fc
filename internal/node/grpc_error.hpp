#pragma once

#include <string_view>

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace lnbridge::node {

/*
  Converts gRPC statuses from the node into internal error types.
*/

util::TransportError ToTransportError(std::string_view rpc, const ::grpc::Status& status);

// lnd reports an unknown payment hash as NOT_FOUND (older releases: UNKNOWN
// with "unable to locate invoice").
bool IsInvoiceNotFound(const ::grpc::Status& status);

void ThrowIfError(std::string_view rpc, const ::grpc::Status& status);

} // namespace lnbridge::node
