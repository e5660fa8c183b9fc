// src/core/relay/relay_service.cpp
#include "relay_service.hpp"
#include "network_utils.hpp"
#include <set>
#include <spdlog/spdlog.h>

namespace UdpRelay
{
    namespace Relay
    {
        RelayService::RelayService()
            : RelayService(std::make_unique<InterfaceRegistry>(), &Endpoint::open)
        {
        }

        RelayService::RelayService(std::unique_ptr<InterfaceRegistry> registry, EndpointFactory factory)
            : registry_(std::move(registry)),
              factory_(std::move(factory)),
              distributor_(std::make_unique<Distributor>()),
              running_(false),
              failed_(false)
        {
        }

        RelayService::~RelayService()
        {
            stop();
        }

        bool RelayService::buildEndpointConfigs(const Common::RelayOptions &options,
                                                std::vector<EndpointConfig> &configs,
                                                std::string &error)
        {
            configs.clear();

            std::vector<Common::ListenSpec> legs;
            if (!Common::ConfigManager::parseListenSpecs(options.listen, legs, error))
            {
                return false;
            }

            Common::OverflowPolicy policy;
            if (!Common::ConfigManager::parseOverflowPolicy(options.overflow_policy, policy))
            {
                error = "unknown overflow policy '" + options.overflow_policy + "'";
                return false;
            }

            std::string filter = Common::ConfigManager::buildCaptureFilter(options.ports, options.filter);

            for (const auto &leg : legs)
            {
                if (Common::NetworkUtils::isMulticastIP(leg.destination))
                {
                    spdlog::debug("{}: relaying to multicast group {}", leg.interface, leg.destination);
                }

                EndpointConfig config;
                config.interface = leg.interface;
                config.bpf_filter = filter;
                config.ports = options.ports;
                config.destination = leg.destination;
                config.destination_addr = leg.destination_addr;
                config.promiscuous = options.promiscuous;
                config.timeout_ms = options.timeout_ms;
                config.overflow_policy = policy;
                configs.push_back(config);
            }

            return true;
        }

        RelayStatus RelayService::open(const std::vector<EndpointConfig> &configs)
        {
            if (!endpoints_.empty())
            {
                return RelayStatus(RelayError::DUPLICATE_INTERFACE, "Relay service is already open");
            }

            std::set<std::string> names;
            for (const auto &config : configs)
            {
                if (!names.insert(config.interface).second)
                {
                    return RelayStatus(RelayError::DUPLICATE_INTERFACE,
                                       "Can't specify the same interface (" + config.interface + ") multiple times");
                }
            }

            for (const auto &config : configs)
            {
                std::unique_ptr<Endpoint> endpoint;
                RelayStatus status = factory_(config, *registry_, endpoint);
                if (status.ok() && !endpoint)
                {
                    status = RelayStatus(RelayError::CAPTURE_OPEN_FAILED,
                                         "No endpoint created for " + config.interface);
                }

                if (!status.ok())
                {
                    releaseEndpoints();
                    return status;
                }

                // Registered only once both handles and the queue exist
                if (!distributor_->registerTarget(endpoint->name(), endpoint->queue()))
                {
                    releaseEndpoints();
                    return RelayStatus(RelayError::DUPLICATE_INTERFACE,
                                       "Failed to register relay target " + config.interface);
                }

                endpoints_.push_back(std::move(endpoint));
            }

            spdlog::info("Opened {} relay endpoint(s)", endpoints_.size());
            return RelayStatus();
        }

        bool RelayService::start()
        {
            if (running_.load())
            {
                spdlog::warn("Relay service already running");
                return false;
            }

            if (endpoints_.empty())
            {
                spdlog::error("Relay service has no endpoints to start");
                return false;
            }

            distributor_->seal();
            running_.store(true);

            for (auto &endpoint : endpoints_)
            {
                threads_.emplace_back(&RelayService::relayWorker, this, endpoint.get());
            }

            spdlog::info("Relaying between {} interface(s)", endpoints_.size());
            return true;
        }

        void RelayService::stop()
        {
            running_.store(false);

            for (auto &thread : threads_)
            {
                if (thread.joinable())
                {
                    thread.join();
                }
            }
            threads_.clear();
        }

        RelayStatus RelayService::failure() const
        {
            std::lock_guard<std::mutex> lock(failure_mutex_);
            return failure_;
        }

        Endpoint *RelayService::findEndpoint(const std::string &interface_name) const
        {
            for (const auto &endpoint : endpoints_)
            {
                if (endpoint->name() == interface_name)
                {
                    return endpoint.get();
                }
            }
            return nullptr;
        }

        void RelayService::logSummary() const
        {
            spdlog::info("========================================");
            spdlog::info("Relay summary");
            for (const auto &endpoint : endpoints_)
            {
                EndpointStats stats = endpoint->getStats();
                spdlog::info("[{}] captured {} | relayed {} | rejected {} | sent {} | send errors {} | queue drops {}"
                             " | kernel recv {} drop {}",
                             endpoint->name(), stats.frames_captured, stats.frames_relayed,
                             stats.frames_rejected, stats.datagrams_sent, stats.send_failures,
                             stats.queue_drops, stats.kernel_received, stats.kernel_dropped);
            }
            spdlog::info("========================================");
        }

        RelayStatus RelayService::listInterfaces(InterfaceRegistry &registry, std::ostream &out)
        {
            std::vector<InterfaceEntry> entries;
            RelayStatus status = registry.all(entries);
            if (!status.ok())
            {
                return status;
            }

            for (const auto &entry : entries)
            {
                out << "Interface: " << entry.name << "\n";
                for (const auto &addr : entry.addresses)
                {
                    out << "\t- IP: " << addr.address << "/" << (addr.prefix_length < 0 ? 0 : addr.prefix_length);
                    if (!addr.broadcast.empty())
                    {
                        out << "  Broadaddr: " << addr.broadcast;
                    }
                    else if (!addr.peer.empty())
                    {
                        out << "  PointToPoint: " << addr.peer;
                    }
                    out << "\n";
                }
                out << "\n";
            }

            return RelayStatus();
        }

        void RelayService::relayWorker(Endpoint *endpoint)
        {
            RelayStatus status = endpoint->run(*distributor_, running_);
            if (!status.ok())
            {
                recordFailure(status);
            }
        }

        void RelayService::recordFailure(const RelayStatus &status)
        {
            {
                std::lock_guard<std::mutex> lock(failure_mutex_);
                if (!failed_.load())
                {
                    failure_ = status;
                    failed_.store(true);
                }
            }

            // A dead leg takes the whole relay down
            running_.store(false);
        }

        void RelayService::releaseEndpoints()
        {
            endpoints_.clear();
            distributor_ = std::make_unique<Distributor>();
        }

    } // namespace Relay
} // namespace UdpRelay
