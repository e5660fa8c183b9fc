// src/core/relay/relay_service.hpp
#ifndef UDP_RELAY_RELAY_SERVICE_HPP
#define UDP_RELAY_RELAY_SERVICE_HPP

#include "config_manager.hpp"
#include "distributor.hpp"
#include "endpoint.hpp"
#include "interface_registry.hpp"
#include "relay_types.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace UdpRelay
{
    namespace Relay
    {
        /**
         * @class RelayService
         * @brief Owns the registry, the distributor and every endpoint
         *
         * Startup is all-or-nothing: open() either brings up every leg or
         * releases everything and reports the first failure. Once started,
         * each endpoint runs its relay loop on its own thread; the first
         * runtime failure stops all of them.
         */
        class RelayService
        {
        public:
            using EndpointFactory = std::function<RelayStatus(const EndpointConfig &config,
                                                              InterfaceRegistry &registry,
                                                              std::unique_ptr<Endpoint> &endpoint)>;

            RelayService();
            RelayService(std::unique_ptr<InterfaceRegistry> registry, EndpointFactory factory);
            ~RelayService();

            RelayService(const RelayService &) = delete;
            RelayService &operator=(const RelayService &) = delete;

            /**
             * @brief Derive one EndpointConfig per leg from validated options
             */
            static bool buildEndpointConfigs(const Common::RelayOptions &options,
                                             std::vector<EndpointConfig> &configs,
                                             std::string &error);

            /**
             * @brief Open and register every leg
             *
             * A repeated interface name fails with DUPLICATE_INTERFACE before
             * anything is opened.
             */
            RelayStatus open(const std::vector<EndpointConfig> &configs);

            /**
             * @brief Seal the routing table and start one relay thread per endpoint
             */
            bool start();

            /**
             * @brief Ask every loop to stop and join the threads
             */
            void stop();

            bool isRunning() const { return running_.load(); }
            bool hasFailed() const { return failed_.load(); }
            RelayStatus failure() const;

            size_t endpointCount() const { return endpoints_.size(); }
            Endpoint *findEndpoint(const std::string &interface_name) const;
            const Distributor &distributor() const { return *distributor_; }
            InterfaceRegistry &registry() { return *registry_; }

            /**
             * @brief Per-endpoint counters at info level
             */
            void logSummary() const;

            /**
             * @brief Print every interface with an address, for --list-interfaces
             */
            static RelayStatus listInterfaces(InterfaceRegistry &registry, std::ostream &out);

        private:
            void relayWorker(Endpoint *endpoint);
            void recordFailure(const RelayStatus &status);
            void releaseEndpoints();

            std::unique_ptr<InterfaceRegistry> registry_;
            EndpointFactory factory_;
            std::unique_ptr<Distributor> distributor_;
            std::vector<std::unique_ptr<Endpoint>> endpoints_;
            std::vector<std::thread> threads_;

            std::atomic<bool> running_;
            std::atomic<bool> failed_;
            RelayStatus failure_;
            mutable std::mutex failure_mutex_;
        };

    } // namespace Relay
} // namespace UdpRelay

#endif // UDP_RELAY_RELAY_SERVICE_HPP
