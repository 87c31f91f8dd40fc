#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lnbridge::wallet {

struct WalletInfo {
  int64_t balance = 0;
};

struct InvoiceParams {
  int64_t     amount = 0; // msat
  std::string description;
  std::string description_hash; // raw bytes; takes precedence over description when set

  // std::nullopt leaves expiry to the backend
  std::optional<std::chrono::seconds> expiry;
};

struct InvoiceData {
  std::string checking_id;
  std::string preimage;
  std::string invoice;
};

struct InvoiceStatus {
  std::string checking_id;
  bool        exists            = false;
  bool        paid              = false;
  int64_t     msatoshi_received = 0;
};

struct PaymentParams {
  std::string invoice;
  int64_t     custom_amount = 0; // msat; 0 uses the invoice amount
};

struct PaymentData {
  std::string checking_id;
};

enum class Status : std::uint8_t {
  kUnknown    = 0,
  kNeverTried = 1,
  kPending    = 2,
  kFailed     = 3,
  kComplete   = 4,
};

constexpr std::string_view ToString(Status status) {
  switch (status) {
    case Status::kNeverTried:
      return "never-tried";
    case Status::kPending:
      return "pending";
    case Status::kFailed:
      return "failed";
    case Status::kComplete:
      return "complete";
    case Status::kUnknown:
    default:
      return "unknown";
  }
}

// Unrecognised text maps to kUnknown.
Status ParseStatus(std::string_view text);

constexpr bool IsTerminal(Status status) {
  return status == Status::kNeverTried || status == Status::kFailed || status == Status::kComplete;
}

// Statuses only move toward a terminal state. kUnknown is never a target.
constexpr bool CanTransition(Status from, Status to) {
  if (from == to) {
    return true;
  }
  if (to == Status::kUnknown) {
    return false;
  }
  if (IsTerminal(from)) {
    return false;
  }
  return to != Status::kPending || from == Status::kUnknown;
}

struct PaymentStatus {
  std::string checking_id;
  Status      status   = Status::kUnknown;
  int64_t     fee_paid = 0; // msat
  std::string preimage;
};

InvoiceStatus MissingInvoice(std::string checking_id);

// exists=false implies paid=false and nothing received; paid implies exists.
bool IsConsistent(const InvoiceStatus& status);

// Only complete payments carry a fee or a preimage.
bool IsConsistent(const PaymentStatus& status);

bool operator==(const InvoiceStatus& lhs, const InvoiceStatus& rhs);
bool operator==(const PaymentStatus& lhs, const PaymentStatus& rhs);

} // namespace lnbridge::wallet
