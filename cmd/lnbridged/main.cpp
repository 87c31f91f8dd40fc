#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using lnbridge::observability::IntField;
using lnbridge::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;
static std::atomic<bool>          g_fatal{false};

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: lnbridged <config.yaml> OR lnbridged --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = lnbridge::config::ConfigLoader::LoadFromYaml(config_path);
    lnbridge::config::ConfigLoader::Validate(config);

    lnbridge::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = lnbridge::factory::Build(config, [](const std::string& reason) {
      LNBRIDGE_LOG_ERROR("Wallet subsystem failed", {StringField("reason", reason)});
      g_fatal = true;
    });

    auto invoices = app.wallet->PaidInvoicesStream();
    auto payments = app.wallet->PaymentsStream();

    // Register signal handlers before starting the loops to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.wallet->Start();
    LNBRIDGE_LOG_INFO("lnbridge started", {StringField("node", config.node().host()), StringField("kind", app.wallet->Kind())});

    std::thread invoice_watch([&] {
      while (auto status = invoices->Receive()) {
        LNBRIDGE_LOG_INFO("Invoice paid", {StringField("checking_id", status->checking_id), IntField("msat", status->msatoshi_received)});
      }
    });
    std::thread payment_watch([&] {
      while (auto status = payments->Receive()) {
        LNBRIDGE_LOG_INFO("Payment update", {StringField("checking_id", status->checking_id),
                                             StringField("status", lnbridge::wallet::ToString(status->status)),
                                             IntField("fee_msat", status->fee_paid)});
      }
    });

    while (g_running && !g_fatal) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    LNBRIDGE_LOG_INFO("Shutting down lnbridge");

    app.wallet->Stop();
    invoice_watch.join();
    payment_watch.join();
    lnbridge::observability::ShutdownLogging();
    return g_fatal ? 3 : 0;
  } catch (const std::exception& e) {
    LNBRIDGE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    lnbridge::observability::ShutdownLogging();
    return 2;
  }
}
