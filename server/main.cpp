#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include <core/Logger.hpp>
#include <config/Config.hpp>

#include "ServerManager.hpp"

namespace {

Spacewar::ServerManager* g_server = nullptr;

void HandleSignal(int) {
    if (g_server) {
        g_server->Stop();
    }
}

/**
 * @brief Parse command line arguments
 */
struct CommandLineArgs {
    std::string configPath = "config/server.json";
    std::string logPath;
    int port = 0;             // 0 keeps the configured port
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
            } else if (arg == "-p" || arg == "--port") {
                if (i + 1 < argc) {
                    try {
                        args.port = std::stoi(argv[++i]);
                    } catch (const std::exception&) {
                        args.invalid = true;
                    }
                    if (args.port <= 0 || args.port > 65535) {
                        args.invalid = true;
                    }
                } else {
                    args.invalid = true;
                }
            } else if (arg == "-l" || arg == "--log") {
                if (i + 1 < argc) {
                    args.logPath = argv[++i];
                } else {
                    args.invalid = true;
                }
            } else {
                args.invalid = true;
            }
        }

        return args;
    }

    static void PrintHelp() {
        std::cout << "vigilant_server - authoritative space-combat server\n\n";
        std::cout << "Usage: vigilant_server [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -h, --help          Show this help message\n";
        std::cout << "  -p, --port N        UDP port to listen on (default 34244)\n";
        std::cout << "  -c, --config PATH   Path to server configuration file\n";
        std::cout << "  -l, --log PATH      Also write logs to this file\n";
    }
};

} // namespace

/**
 * @brief Main entry point for the dedicated server
 */
int main(int argc, char* argv[]) {
    auto args = CommandLineArgs::Parse(argc, argv);

    if (args.showHelp || args.invalid) {
        CommandLineArgs::PrintHelp();
        return args.invalid ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    // Configuration: defaults, then the file, then the command line
    Spacewar::NetConfig netConfig;
    auto& config = Vigilant::Config::Instance();
    if (auto loaded = config.Load(args.configPath); loaded) {
        netConfig.LoadFrom(config);
    } else {
        GAME_LOG_WARN("Using default configuration ({}: {})",
            args.configPath, Vigilant::ConfigErrorToString(loaded.error()));
    }

    if (args.port != 0) {
        netConfig.port = static_cast<uint16_t>(args.port);
    }
    if (!args.logPath.empty()) {
        netConfig.logFile = args.logPath;
    }

    // Reopen the loggers with the final sinks
    Vigilant::Logger::Shutdown();
    Vigilant::Logger::Initialize(netConfig.logFile);
    Vigilant::Logger::SetLevel(Vigilant::Logger::ParseLevel(netConfig.logLevel));

    std::string errorMessage;
    if (!netConfig.Validate(errorMessage)) {
        GAME_LOG_CRITICAL("Invalid configuration: {}", errorMessage);
        return EXIT_FAILURE;
    }

    Spacewar::ServerManager server(netConfig);
    if (!server.Initialize()) {
        GAME_LOG_CRITICAL("Failed to start server");
        Vigilant::Logger::Shutdown();
        return EXIT_FAILURE;
    }

    g_server = &server;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Run();

    g_server = nullptr;
    auto stats = server.GetStats();
    GAME_LOG_INFO("Ran {} ticks in {:.1f}s (avg {:.3f} ms/tick, {} clock jumps)",
        stats.totalTicks, stats.uptime, stats.avgTickTime, stats.clockJumps);

    server.Shutdown();
    Vigilant::Logger::Shutdown();
    return EXIT_SUCCESS;
}
