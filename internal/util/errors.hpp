#pragma once

#include <stdexcept>
#include <string>

namespace lnbridge::util {

/*
  Central error types.

  Synchronous wallet calls raise these; background loops catch, log and carry on.
  An unknown invoice is never an error (it reports exists=false).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidCheckingId : public std::runtime_error {
 public:
  explicit InvalidCheckingId(const std::string& msg) : std::runtime_error("invalid checkingID: " + msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SubscriptionClosed : public std::runtime_error {
 public:
  explicit SubscriptionClosed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Failed call to the node. code() holds the gRPC status code.
class TransportError : public std::runtime_error {
 public:
  TransportError(const std::string& msg, int code) : std::runtime_error(msg), code_(code) {
  }

  int code() const {
    return code_;
  }

 private:
  int code_;
};

} // namespace lnbridge::util
