#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/lnd/invoice_subscriber.hpp"
#include "internal/lnd/lnd_wallet.hpp"
#include "internal/node/node_client.hpp"

namespace lnbridge::factory {

/*
  Application

  Owns all long-lived objects. Everything here lives for the lifetime of
  the process.
*/
struct Application {
  std::shared_ptr<node::NodeClient> node;
  std::shared_ptr<lnd::LndWallet>   wallet;
};

lnd::LndWallet::Options WalletOptions(const lnbridge::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: validates config, dials the node and wires the wallet
  adapter. The wallet
  is returned unstarted.
*/
Application Build(const lnbridge::runtime::config::RuntimeConfig& config, lnd::InvoiceSubscriber::FatalHandler on_fatal = {});

} // namespace lnbridge::factory
