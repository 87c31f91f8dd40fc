#include "payment_poller.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

#include "internal/lnd/status_translator.hpp"
#include "internal/observability/logging.hpp"

namespace lnbridge::lnd {

using observability::StringField;
using observability::UintField;

PaymentPoller::PaymentPoller(std::shared_ptr<node::NodeClient> client, std::shared_ptr<stream::Broadcaster<wallet::PaymentStatus>> broadcaster,
                             Options options)
    : client_(std::move(client)), broadcaster_(std::move(broadcaster)), options_(options) {
  if (options_.interval.count() <= 0) {
    options_.interval = std::chrono::milliseconds(3000);
  }
}

PaymentPoller::~PaymentPoller() {
  Stop();
}

void PaymentPoller::Start() {
  if (thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&PaymentPoller::Run, this);
}

void PaymentPoller::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

uint64_t PaymentPoller::ResolveStartCheckpoint() {
  lnrpc::ListPaymentsRequest req;
  req.set_include_incomplete(false);
  req.set_index_offset(0);
  req.set_max_payments(1);
  req.set_reversed(true);

  uint64_t start = 0;
  try {
    auto resp = client_->ListPayments(req);
    if (resp.payments_size() > 0) {
      start = resp.payments(0).payment_index();
    }
  } catch (const std::exception& e) {
    LNBRIDGE_LOG_WARN("Could not read latest payment; polling from the beginning", {StringField("error", e.what())});
  }

  checkpoint_ = start;
  {
    std::lock_guard lock(in_flight_mutex_);
    in_flight_.clear();
  }
  return start;
}

std::size_t PaymentPoller::InFlightCount() const {
  std::lock_guard lock(in_flight_mutex_);
  return in_flight_.size();
}

std::size_t PaymentPoller::PollOnce() {
  std::size_t broadcast = 0;
  if (options_.track_in_flight) {
    broadcast += RecheckInFlight();
  }
  return broadcast + PollNew();
}

std::size_t PaymentPoller::PollNew() {
  const uint64_t checkpoint = checkpoint_.load();

  lnrpc::ListPaymentsRequest req;
  req.set_include_incomplete(true);
  req.set_index_offset(checkpoint);
  if (options_.max_payments > 0) {
    req.set_max_payments(options_.max_payments);
  }

  lnrpc::ListPaymentsResponse resp;
  try {
    resp = client_->ListPayments(req);
  } catch (const std::exception& e) {
    LNBRIDGE_LOG_ERROR("Error getting payments", {StringField("error", e.what()), UintField("checkpoint", checkpoint)});
    return 0;
  }

  if (resp.payments_size() == 0) {
    return 0;
  }

  std::size_t broadcast = 0;
  for (const auto& payment : resp.payments()) {
    auto status = ToPaymentStatus(payment);
    if (options_.track_in_flight && !Track(status, payment.payment_index())) {
      continue;
    }
    broadcaster_->Publish(status);
    ++broadcast;
  }

  // the cursor always moves on; held payments are re-read by index
  const uint64_t next = std::max(checkpoint, resp.last_index_offset());
  checkpoint_         = next;

  LNBRIDGE_LOG_DEBUG("Broadcast payment updates", {UintField("records", static_cast<uint64_t>(resp.payments_size())),
                                                   UintField("broadcast", broadcast), UintField("checkpoint", next)});
  return broadcast;
}

std::size_t PaymentPoller::RecheckInFlight() {
  std::vector<uint64_t> held;
  {
    std::lock_guard lock(in_flight_mutex_);
    for (const auto& entry : in_flight_) {
      held.push_back(entry.first);
    }
  }

  std::size_t broadcast = 0;
  for (const auto index : held) {
    lnrpc::ListPaymentsRequest req;
    req.set_include_incomplete(true);
    req.set_index_offset(index - 1);
    req.set_max_payments(1);

    lnrpc::ListPaymentsResponse resp;
    try {
      resp = client_->ListPayments(req);
    } catch (const std::exception& e) {
      LNBRIDGE_LOG_ERROR("Error re-reading in-flight payment", {StringField("error", e.what()), UintField("payment_index", index)});
      continue;
    }

    if (resp.payments_size() == 0 || resp.payments(0).payment_index() != index) {
      LNBRIDGE_LOG_WARN("In-flight payment disappeared; no longer tracking it", {UintField("payment_index", index)});
      std::lock_guard lock(in_flight_mutex_);
      in_flight_.erase(index);
      continue;
    }

    auto status = ToPaymentStatus(resp.payments(0));
    if (!Track(status, index)) {
      continue;
    }
    broadcaster_->Publish(status);
    ++broadcast;
  }
  return broadcast;
}

bool PaymentPoller::Track(const wallet::PaymentStatus& status, uint64_t index) {
  std::lock_guard lock(in_flight_mutex_);
  auto            it = in_flight_.find(index);
  if (it != in_flight_.end()) {
    if (it->second == status.status) {
      return false;
    }
    if (!wallet::CanTransition(it->second, status.status)) {
      LNBRIDGE_LOG_WARN("Payment moved backwards", {UintField("payment_index", index), StringField("from", wallet::ToString(it->second)),
                                                    StringField("to", wallet::ToString(status.status))});
    }
  }

  if (wallet::IsTerminal(status.status)) {
    in_flight_.erase(index);
  } else {
    in_flight_[index] = status.status;
  }
  return true;
}

void PaymentPoller::Run() {
  const auto start = ResolveStartCheckpoint();
  LNBRIDGE_LOG_INFO("Payment poller started", {UintField("checkpoint", start), observability::IntField("interval_ms", options_.interval.count())});

  // lnd offers no payment subscription, so poll
  while (SleepInterval()) {
    PollOnce();
  }

  LNBRIDGE_LOG_INFO("Payment poller stopped", {UintField("checkpoint", checkpoint_.load())});
}

bool PaymentPoller::SleepInterval() {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, options_.interval, [&] { return stopping_; });
}

} // namespace lnbridge::lnd
