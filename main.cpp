#include "config/ConfigRegistry.hpp"
#include "crypto/PasswordHash.hpp"
#include "db/Janitor.hpp"
#include "log/Registry.hpp"
#include "runtime/Deps.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace fdx;
using namespace fdx::config;

namespace {
std::atomic<int> receivedSignal = 0;

void signalHandler(const int signum) { receivedSignal = signum; }
}

int main() {
    try {
        ConfigRegistry::init(paths::getConfigPath());
        log::Registry::init(ConfigRegistry::get().logging.log_dir);

        log::Registry::filedex()->info("[*] Starting filedex with config {}", paths::getConfigPath().string());
        crypto::ensureSodiumInit();

        const auto deps = runtime::Deps::build(ConfigRegistry::get());
        deps->janitor->start();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        log::Registry::filedex()->info("[✓] filedex is up.");
        while (!receivedSignal) std::this_thread::sleep_for(std::chrono::seconds(1));

        log::Registry::filedex()->info("[!] Signal {} received. Shutting down gracefully...", receivedSignal.load());
        deps->janitor->stop();
        log::Registry::filedex()->info("[✓] filedex shut down cleanly.");

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::filedex()->error("[-] Failed to start filedex: {}", e.what());
        else std::cerr << "[-] Failed to start filedex: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
