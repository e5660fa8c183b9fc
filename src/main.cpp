// src/main.cpp
// udp-relay: relay UDP broadcast/multicast packets between interfaces

#include <iostream>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>

#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "core/relay/relay_service.hpp"
#include "cli/cli_parser.hpp"

// ==================== NAMESPACE ALIASES ====================
using namespace UdpRelay;
using namespace UdpRelay::Common;
using namespace UdpRelay::Relay;
namespace CLI = UdpRelay::Interface::CLI;

// ==================== GLOBAL VARIABLES ====================

std::atomic<bool> g_running{true};

// ==================== SIGNAL HANDLER ====================

void signalHandler(int)
{
    g_running = false;
}

// ==================== MAIN FUNCTION ====================

int main(int argc, char *argv[])
{
    // Console logging until the configured logger is installed
    std::string log_error;
    if (!setupLogger(LoggingOptions(), log_error))
    {
        std::cerr << "Log initialization failed: " << log_error << std::endl;
        return 1;
    }

    // Parse command line arguments
    CLI::CLIParser parser;
    CLI::CliArguments args;
    std::string error;

    if (!parser.parse(argc, argv, args, error))
    {
        spdlog::critical("{}", error);
        parser.printHelp(std::cerr, argv[0]);
        return 1;
    }

    if (args.help)
    {
        parser.printHelp(std::cout, argv[0]);
        return 0;
    }

    if (args.version)
    {
        parser.printVersion(std::cout);
        return 0;
    }

    // ==================== CONFIGURATION ====================

    RelayOptions options;
    if (!args.config_file.empty())
    {
        if (!ConfigManager::loadFromJsonFile(args.config_file, options, error))
        {
            spdlog::critical("{}", error);
            return 1;
        }
    }
    CLI::CLIParser::applyOverrides(args, options);

    if (!setupLogger(options.logging, log_error))
    {
        spdlog::critical("{}", log_error);
        return 1;
    }

    if (args.list_interfaces)
    {
        InterfaceRegistry registry;
        RelayStatus status = RelayService::listInterfaces(registry, std::cout);
        if (!status.ok())
        {
            spdlog::critical("{}", status.message);
            return 1;
        }
        return 0;
    }

    if (!ConfigManager::validate(options, error))
    {
        spdlog::critical("{}", error);
        return 1;
    }

    std::vector<EndpointConfig> configs;
    if (!RelayService::buildEndpointConfigs(options, configs, error))
    {
        spdlog::critical("{}", error);
        return 1;
    }

    spdlog::info("udp-relay starting at {}",
                 Utils::formatTimestamp(Utils::getCurrentTimestampUs()));
    spdlog::info("Capture filter: {}", configs.front().bpf_filter);
    for (const auto &config : configs)
    {
        spdlog::info("  - {} -> {}", config.interface, config.destination);
    }

    // ==================== OPEN ENDPOINTS ====================

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    RelayService service;
    RelayStatus status = service.open(configs);
    if (!status.ok())
    {
        spdlog::critical("[{}] {}", relayErrorToString(status.error), status.message);
        return 1;
    }

    if (!service.start())
    {
        spdlog::critical("Failed to start relay loops");
        return 1;
    }

    // ==================== WAIT FOR SHUTDOWN ====================

    while (g_running.load() && service.isRunning())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (!g_running.load())
    {
        spdlog::warn("Signal received. Shutting down gracefully...");
    }

    service.stop();
    service.logSummary();

    if (service.hasFailed())
    {
        RelayStatus failure = service.failure();
        spdlog::critical("[{}] {}", relayErrorToString(failure.error), failure.message);
        spdlog::shutdown();
        return 1;
    }

    spdlog::info("Shutdown complete");
    spdlog::shutdown();
    return 0;
}
