#include "factory.hpp"

#include <chrono>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/node/lnd_node_client.hpp"

namespace lnbridge::factory {

lnd::LndWallet::Options WalletOptions(const lnbridge::runtime::config::RuntimeConfig& config) {
  lnd::LndWallet::Options options;
  options.poller.interval        = std::chrono::milliseconds(config.payments().poll_interval_ms());
  options.poller.max_payments    = config.payments().max_payments_per_poll();
  options.poller.track_in_flight = config.payments().track_in_flight();
  options.max_pending_events     = static_cast<std::size_t>(config.subscribers().max_pending_events());
  return options;
}

Application Build(const lnbridge::runtime::config::RuntimeConfig& config, lnd::InvoiceSubscriber::FatalHandler on_fatal) {
  lnbridge::config::ConfigLoader::Validate(config);

  Application app;

  // ------------------------------------------------------------------
  // Node transport
  // ------------------------------------------------------------------
  app.node = node::LndNodeClient::Connect(config.node());

  // ------------------------------------------------------------------
  // Wallet adapter
  // ------------------------------------------------------------------
  auto options     = WalletOptions(config);
  options.on_fatal = std::move(on_fatal);
  app.wallet       = std::make_shared<lnd::LndWallet>(app.node, std::move(options));

  return app;
}

} // namespace lnbridge::factory
