/**
 * @file main.cpp
 * @brief soodlink command line entry point
 *
 * This is the thin executable that wires together the library components:
 * - Discovery engine for SOOD multicast/broadcast server discovery
 * - File credential store for the saved server and its token
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#include <soodlink/app/config.hpp>
#include <soodlink/config/file_credential_store.hpp>
#include <soodlink/core/discovery_engine.hpp>
#include <soodlink/net/platform.hpp>
#include <soodlink/utils/logger.hpp>

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace soodlink;
using namespace soodlink::app;

namespace {

int runDiscover(const Config& config, config::FileCredentialStore& store) {
    core::DiscoveryConfig discoveryConfig;
    discoveryConfig.mcast_addr = config.mcast_addr;
    discoveryConfig.bcast_addr = config.bcast_addr;
    discoveryConfig.port = config.port;
    discoveryConfig.bind_addr = config.bind_addr;
    discoveryConfig.multicast_ttl = config.multicast_ttl;
    discoveryConfig.timeout = std::chrono::milliseconds(config.timeout_ms);

    core::DiscoveryEngine engine(discoveryConfig);

    std::cout << "Searching for servers (" << config.timeout_ms << "ms)...\n";
    std::vector<core::ServerDescriptor> servers = engine.discover();

    if (servers.empty()) {
        std::cout << "\nNo servers found. Check that:\n"
                  << "  - the server is running on this network\n"
                  << "  - UDP port " << config.port << " is not blocked by a firewall\n"
                  << "  - this machine is on the same subnet as the server\n";
        return 0;
    }

    std::optional<core::SavedServer> saved = store.loadSavedServer();

    std::cout << "\nFound " << servers.size() << " server(s):\n\n";
    for (size_t i = 0; i < servers.size(); ++i) {
        const auto& server = servers[i];
        bool isSaved = saved && saved->server.unique_id == server.unique_id;
        std::cout << std::setw(3) << (i + 1) << ". "
                  << std::left << std::setw(24) << server.display_name << std::right
                  << " " << server.endpoint()
                  << (server.version.empty() ? "" : "  v" + server.version)
                  << (isSaved ? "  [saved]" : "") << "\n"
                  << "     id: " << server.unique_id << "\n";
    }
    return 0;
}

int runSaved(config::FileCredentialStore& store) {
    std::optional<core::SavedServer> saved = store.loadSavedServer();
    if (!saved) {
        std::cout << "No saved server (" << store.path() << ")\n";
        return 0;
    }

    std::cout << "Saved server:\n"
              << "  name:    " << saved->server.display_name << "\n"
              << "  id:      " << saved->server.unique_id << "\n"
              << "  address: " << saved->server.endpoint() << "\n";
    if (!saved->server.version.empty()) {
        std::cout << "  version: " << saved->server.version << "\n";
    }
    std::cout << "  token:   " << (saved->token.empty() ? "none" : "stored") << "\n";
    return 0;
}

int runForget(config::FileCredentialStore& store) {
    std::optional<core::SavedServer> saved = store.loadSavedServer();
    if (!saved) {
        std::cout << "No saved server\n";
        return 0;
    }
    if (!store.clearToken(saved->server.unique_id)) {
        std::cerr << "Error: could not update " << store.path() << "\n";
        return 1;
    }
    std::cout << "Forgot token for " << saved->server.display_name << "\n";
    return 0;
}

int runReset(config::FileCredentialStore& store) {
    if (!store.clear()) {
        std::cerr << "Error: could not remove " << store.path() << "\n";
        return 1;
    }
    std::cout << "Removed " << store.path() << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (!config.error.empty()) {
        std::cerr << "Error: " << config.error << "\n\n";
        printUsage(argv[0], std::cerr);
        return 2;
    }
    if (config.help) {
        printUsage(argv[0]);
        return 0;
    }

    // Configure logging
    utils::LogLevel level = utils::LogLevel::INFO;
    if (!utils::tryParseLogLevel(config.log_level, level)) {
        std::cerr << "Error: Unknown log level " << config.log_level << "\n";
        return 2;
    }
    utils::Logger::instance().setLevel(level);

    std::ofstream logFile;
    if (!config.log_file.empty()) {
        logFile.open(config.log_file, std::ios::out | std::ios::app);
        if (!logFile) {
            std::cerr << "Error: cannot open log file " << config.log_file << "\n";
            return 2;
        }
        utils::Logger::instance().setColorEnabled(false);
        utils::Logger::instance().setOutput(logFile);
    }

    net::SocketInitializer sockets;
    if (!sockets.isInitialized()) {
        LOG_ERROR("Main", "Socket layer could not be initialized");
        std::cerr << "Error: socket layer could not be initialized\n";
        utils::Logger::instance().resetOutput();
        return 1;
    }

    config::FileCredentialStore store(config.config_path);

    LOG_DEBUG("Main", "Command: {}, config file: {}", commandToString(config.command), store.path());

    int status = 0;
    try {
        switch (config.command) {
            case Command::DISCOVER:
                status = runDiscover(config, store);
                break;
            case Command::SAVED:
                status = runSaved(store);
                break;
            case Command::FORGET:
                status = runForget(store);
                break;
            case Command::RESET:
                status = runReset(store);
                break;
        }
    } catch (const core::DiscoveryError& e) {
        LOG_ERROR("Main", "Discovery failed: {} (error {})", e.what(), e.errorCode());
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Main", "Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    }

    utils::Logger::instance().resetOutput();
    return status;
}
