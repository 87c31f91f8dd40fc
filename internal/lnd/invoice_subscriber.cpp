#include "invoice_subscriber.hpp"

#include <exception>
#include <optional>
#include <utility>

#include "internal/lnd/status_translator.hpp"
#include "internal/observability/logging.hpp"

namespace lnbridge::lnd {

using observability::StringField;

InvoiceSubscriber::InvoiceSubscriber(std::shared_ptr<node::NodeClient> client,
                                     std::shared_ptr<stream::Broadcaster<wallet::InvoiceStatus>> broadcaster, FatalHandler on_fatal)
    : client_(std::move(client)), broadcaster_(std::move(broadcaster)), on_fatal_(std::move(on_fatal)) {
}

InvoiceSubscriber::~InvoiceSubscriber() {
  Stop();
}

void InvoiceSubscriber::Start() {
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  stream_   = client_->SubscribeInvoices();
  LNBRIDGE_LOG_INFO("Subscribed to invoice events");
  thread_ = std::thread(&InvoiceSubscriber::Run, this);
}

void InvoiceSubscriber::Stop() {
  stopping_ = true;
  if (stream_) {
    stream_->Cancel();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  stream_.reset();
}

std::string InvoiceSubscriber::FatalReason() const {
  std::lock_guard lock(mutex_);
  return fatal_reason_;
}

void InvoiceSubscriber::Run() {
  while (true) {
    std::optional<lnrpc::Invoice> event;
    try {
      event = stream_->Next();
    } catch (const std::exception& e) {
      if (stopping_) {
        break;
      }
      LNBRIDGE_LOG_ERROR("Error receiving invoice event", {StringField("error", e.what())});
      continue;
    }

    if (!event) {
      if (!stopping_) {
        const std::string reason = "invoice subscription ended by the node";
        {
          std::lock_guard lock(mutex_);
          fatal_reason_ = reason;
        }
        healthy_ = false;
        LNBRIDGE_LOG_ERROR("Invoice stream closed; settlements will not be delivered until restart");
        if (on_fatal_) {
          on_fatal_(reason);
        }
      }
      break;
    }

    auto status = ToSettledInvoiceStatus(*event);
    if (!status) {
      continue;
    }
    const auto delivered = broadcaster_->Publish(*status);
    LNBRIDGE_LOG_DEBUG("Invoice settled", {StringField("checking_id", status->checking_id),
                                           observability::IntField("msat", status->msatoshi_received),
                                           observability::UintField("subscribers", delivered)});
  }
}

} // namespace lnbridge::lnd
