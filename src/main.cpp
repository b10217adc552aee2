#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gavel/AddressManager.hpp"
#include "gavel/AuctionEngine.hpp"
#include "gavel/Crypto.hpp"
#include "gavel/InMemoryLedger.hpp"
#include "gavel/net/AuctionServer.hpp"
#include "gavel/net/RequestHandler.hpp"

static std::atomic<bool> g_running(true);

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <port> <admin_address> [fee_bps] [balances_file]" << std::endl;
    std::cerr << "  balances_file: one '<asset> <address> <amount>' per line" << std::endl;
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    uint16_t port = gavel::DEFAULT_PORT;
    gavel::EngineConfig config;
    std::string balancesPath;

    try {
        unsigned long rawPort = std::stoul(argv[1]);
        if (rawPort > 65535) throw std::out_of_range("port");
        port = static_cast<uint16_t>(rawPort);

        config.admin = gavel::AddressManager::normalizeAddress(argv[2]);
        if (argc > 3) config.feeBasisPoints = static_cast<uint32_t>(std::stoul(argv[3]));
        if (argc > 4) balancesPath = argv[4];
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid arguments: " << e.what() << std::endl;
        usage(argv[0]);
        return 1;
    }

    std::cout << "Gavel node starting. port=" << port << " admin=" << config.admin
              << " fee_bps=" << config.feeBasisPoints << std::endl;

    if (!gavel::Crypto::initialize()) {
        std::cerr << "Error: Failed to initialize crypto (sodium)." << std::endl;
        return 1;
    }

    // Cuenta de custodia propia del nodo, derivada de una clave efímera
    std::vector<uint8_t> custodyPrivate, custodyPublic;
    if (!gavel::Crypto::generateKeyPair(custodyPrivate, custodyPublic)) {
        std::cerr << "Error: Failed to generate custody key." << std::endl;
        return 1;
    }
    config.custodyAccount = gavel::AddressManager::getAddressFromPublicKey(custodyPublic);
    gavel::Crypto::secureClean(custodyPrivate);

    try {
        gavel::InMemoryLedger ledger(config.custodyAccount);

        // Saldos iniciales: sin ellos ninguna cuenta puede subastar ni pujar
        if (!balancesPath.empty()) {
            std::ifstream balances(balancesPath);
            if (!balances) {
                std::cerr << "Error: Cannot open balances file " << balancesPath << std::endl;
                return 1;
            }
            size_t credited = ledger.loadBalances(balances);
            std::cout << "Loaded " << credited << " starting balances from " << balancesPath << std::endl;
        } else {
            std::cerr << "Warning: No balances file given; every account starts empty" << std::endl;
        }

        gavel::AuctionEngine engine(config, ledger);

        engine.events().subscribe([](const gavel::Event& event) {
            std::cout << "[event " << event.sequence << "] " << gavel::eventTypeToString(event.type)
                      << " auction=" << event.auctionId << " actor=" << event.actor
                      << " amount=" << event.amount << std::endl;
        });

        gavel::net::RequestHandler handler(engine);
        gavel::net::AuctionServer server(port, handler);
        server.start();

        // Handle signals
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::cout << "Node running. Custody account " << config.custodyAccount
                  << ". Press Ctrl+C to exit." << std::endl;
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        std::cout << "Shutting down..." << std::endl;
        server.stop();

        gavel::SystemMetrics metrics = engine.getSystemMetrics();
        std::cout << "Auctions: " << metrics.totalAuctions << " (" << metrics.activeAuctions
                  << " active), volume " << metrics.totalVolume << ", events " << engine.events().size()
                  << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
