#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <core/Logger.hpp>
#include <config/Config.hpp>
#include <networking/UdpTransport.hpp>

#include "core/Game.hpp"
#include "network/ClientReplication.hpp"
#include "network/NetConfig.hpp"

namespace {

volatile std::sig_atomic_t g_quit = 0;

void HandleSignal(int) {
    g_quit = 1;
}

/**
 * @brief Parse command line arguments
 */
struct CommandLineArgs {
    std::string serverAddress;
    std::string configPath = "config/client.json";
    bool showHelp = false;
    bool invalid = false;

    static CommandLineArgs Parse(int argc, char* argv[]) {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.showHelp = true;
            } else if (arg == "-c" || arg == "--config") {
                if (i + 1 < argc) {
                    args.configPath = argv[++i];
                } else {
                    args.invalid = true;
                }
            } else if (args.serverAddress.empty() && !arg.starts_with('-')) {
                args.serverAddress = arg;
            } else {
                // Too many positional arguments or an unknown option
                args.invalid = true;
            }
        }

        if (!args.showHelp && args.serverAddress.empty()) {
            args.invalid = true;
        }
        return args;
    }

    static void PrintHelp() {
        std::cout << "vigilant_client - headless space-combat client\n\n";
        std::cout << "Usage: vigilant_client <host:port> [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -h, --help          Show this help message\n";
        std::cout << "  -c, --config PATH   Path to client configuration file\n";
    }
};

} // namespace

/**
 * @brief Main entry point for the headless client
 */
int main(int argc, char* argv[]) {
    auto args = CommandLineArgs::Parse(argc, argv);

    if (args.showHelp || args.invalid) {
        CommandLineArgs::PrintHelp();
        return args.invalid ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    Spacewar::NetConfig netConfig;
    auto& config = Vigilant::Config::Instance();
    if (auto loaded = config.Load(args.configPath); loaded) {
        netConfig.LoadFrom(config);
    } else {
        GAME_LOG_DEBUG("Using default configuration ({}: {})",
            args.configPath, Vigilant::ConfigErrorToString(loaded.error()));
    }

    Vigilant::Logger::Shutdown();
    Vigilant::Logger::Initialize(netConfig.logFile);
    Vigilant::Logger::SetLevel(Vigilant::Logger::ParseLevel(netConfig.logLevel));

    std::string errorMessage;
    if (!netConfig.Validate(errorMessage)) {
        GAME_LOG_CRITICAL("Invalid configuration: {}", errorMessage);
        return EXIT_FAILURE;
    }

    std::unique_ptr<Vigilant::UdpClient> transport;
    try {
        transport = std::make_unique<Vigilant::UdpClient>(args.serverAddress);
    } catch (const std::invalid_argument& e) {
        GAME_LOG_CRITICAL("Invalid address '{}': {}", args.serverAddress, e.what());
        return EXIT_FAILURE;
    } catch (const std::system_error& e) {
        GAME_LOG_CRITICAL("Cannot open client socket: {}", e.what());
        return EXIT_FAILURE;
    }

    GAME_LOG_INFO("Connecting to {} from local port {}",
        transport->GetServerAddress().ToString(), transport->GetLocalPort());

    auto replicationOwner = std::make_unique<Spacewar::ClientReplication>(std::move(transport));
    Spacewar::ClientReplication& replication = *replicationOwner;
    Spacewar::Game game(Spacewar::Role::Client, std::move(replicationOwner));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    using Clock = std::chrono::system_clock;
    const auto minStep = std::chrono::duration<double>(netConfig.clientMinStep);
    auto previous = Clock::now();
    bool wasConnected = false;

    while (!g_quit) {
        const auto now = Clock::now();
        const auto delta = now - previous;
        previous = now;

        if (delta < Clock::duration::zero()) {
            GAME_LOG_WARN("Clock jumped backward by {:.3f} seconds",
                std::chrono::duration<double>(-delta).count());
            continue;
        }

        game.Tick(std::chrono::duration<float>(delta).count());

        if (replication.IsConnected() != wasConnected) {
            wasConnected = replication.IsConnected();
            GAME_LOG_INFO("{}", wasConnected ? "Connected" : "Disconnected");
        }

        const auto frame = Clock::now() - now;
        if (frame < minStep) {
            std::this_thread::sleep_for(minStep - frame);
        }
    }

    GAME_LOG_INFO("Leaving after {} ticks (ping {:.1f} ms)",
        game.GetTickCount(), replication.GetPing().GetSeconds() * 1000.0);
    replication.Disconnect();

    Vigilant::Logger::Shutdown();
    return EXIT_SUCCESS;
}
