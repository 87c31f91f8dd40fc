#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/hex.hpp"
#include "internal/wallet/types.hpp"

using namespace lnbridge::wallet;

static void Usage() {
  std::cout << "Usage:\n"
            << "  lnbridgectl <config.yaml> info\n"
            << "  lnbridgectl <config.yaml> create-invoice <msat> [description] [expiry_s]\n"
            << "  lnbridgectl <config.yaml> create-invoice-hash <msat> <description_hash_hex> [expiry_s]\n"
            << "  lnbridgectl <config.yaml> invoice-status <checking_id>\n"
            << "  lnbridgectl <config.yaml> pay <invoice> [amount_msat]\n"
            << "  lnbridgectl <config.yaml> payment-status <checking_id>\n"
            << "  lnbridgectl <config.yaml> watch-invoices\n"
            << "  lnbridgectl <config.yaml> watch-payments\n";
}

static volatile std::sig_atomic_t g_watching = 1;
static std::atomic<bool>          g_failed{false};

static void HandleSignal(int) {
  g_watching = 0;
}

static void Print(const InvoiceStatus& status) {
  std::cout << "checking_id=" << status.checking_id << " exists=" << (status.exists ? "true" : "false")
            << " paid=" << (status.paid ? "true" : "false") << " msatoshi_received=" << status.msatoshi_received << "\n";
}

static void Print(const PaymentStatus& status) {
  std::cout << "checking_id=" << status.checking_id << " status=" << ToString(status.status) << " fee_paid=" << status.fee_paid
            << " preimage=" << status.preimage << "\n";
}

template <typename T>
static int Watch(const std::shared_ptr<lnbridge::stream::Subscription<T>>& subscription) {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  while (g_watching) {
    auto event = subscription->ReceiveFor(std::chrono::milliseconds(250));
    if (event) {
      Print(*event);
      std::cout.flush();
      continue;
    }
    if (subscription->Closed()) {
      return 2;
    }
  }
  subscription->Cancel();
  return g_failed ? 2 : 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];

  try {
    auto config = lnbridge::config::ConfigLoader::LoadFromYaml(config_path);
    lnbridge::config::ConfigLoader::Validate(config);
    lnbridge::observability::InitializeLogging(config);

    auto  app    = lnbridge::factory::Build(config, [](const std::string& reason) {
      std::cerr << reason << "\n";
      g_failed   = true;
      g_watching = 0;
    });
    auto& wallet = *app.wallet;

    // ------------------------------------------------------------

    if (cmd == "info") {
      auto info = wallet.GetInfo();
      std::cout << "kind=" << wallet.Kind() << " balance=" << info.balance << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "create-invoice" || cmd == "create-invoice-hash") {
      if (argc < 4) return 1;

      InvoiceParams params;
      params.amount = std::stoll(argv[3]);
      if (argc >= 5) {
        if (cmd == "create-invoice-hash") {
          auto hash = lnbridge::util::HexDecode(argv[4]);
          if (!hash) {
            std::cerr << "invalid description hash: " << argv[4] << "\n";
            return 1;
          }
          params.description_hash = *hash;
        } else {
          params.description = argv[4];
        }
      }
      if (argc >= 6) {
        params.expiry = std::chrono::seconds(std::stoll(argv[5]));
      }

      auto data = wallet.CreateInvoice(params);
      std::cout << "checking_id=" << data.checking_id << " preimage=" << data.preimage << " invoice=" << data.invoice << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "invoice-status") {
      if (argc < 4) return 1;

      Print(wallet.GetInvoiceStatus(argv[3]));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "pay") {
      if (argc < 4) return 1;

      PaymentParams params;
      params.invoice = argv[3];
      if (argc >= 5) {
        params.custom_amount = std::stoll(argv[4]);
      }

      auto data = wallet.MakePayment(params);
      std::cout << "checking_id=" << data.checking_id << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "payment-status") {
      if (argc < 4) return 1;

      Print(wallet.GetPaymentStatus(argv[3]));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "watch-invoices") {
      auto subscription = wallet.PaidInvoicesStream();
      wallet.Start();
      return Watch(subscription);
    }

    if (cmd == "watch-payments") {
      auto subscription = wallet.PaymentsStream();
      wallet.Start();
      return Watch(subscription);
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
