#include "grpc_error.hpp"

#include <string>

namespace lnbridge::node {

util::TransportError ToTransportError(std::string_view rpc, const ::grpc::Status& status) {
  std::string message = "error calling " + std::string(rpc) + ": code=" + std::to_string(static_cast<int>(status.error_code()));
  if (!status.error_message().empty()) {
    message += ": " + status.error_message();
  }
  return util::TransportError(message, static_cast<int>(status.error_code()));
}

bool IsInvoiceNotFound(const ::grpc::Status& status) {
  if (status.error_code() == ::grpc::StatusCode::NOT_FOUND) {
    return true;
  }
  return status.error_code() == ::grpc::StatusCode::UNKNOWN && status.error_message().find("unable to locate invoice") != std::string::npos;
}

void ThrowIfError(std::string_view rpc, const ::grpc::Status& status) {
  if (!status.ok()) {
    throw ToTransportError(rpc, status);
  }
}

} // namespace lnbridge::node
