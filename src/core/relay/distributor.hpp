// src/core/relay/distributor.hpp
#ifndef UDP_RELAY_DISTRIBUTOR_HPP
#define UDP_RELAY_DISTRIBUTOR_HPP

#include "relay_queue.hpp"
#include "relay_types.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace UdpRelay
{
    namespace Relay
    {
        /**
         * @class Distributor
         * @brief Routing table from interface name to send queue
         *
         * Targets are registered during startup, then the table is sealed and
         * only read. broadcast() takes no lock: every target queue has its own
         * non-blocking push, so a full queue on one leg never delays the others.
         */
        class Distributor
        {
        public:
            Distributor();

            Distributor(const Distributor &) = delete;
            Distributor &operator=(const Distributor &) = delete;

            /**
             * @brief Add an egress target
             * @return false if the name is already registered or the table is sealed
             */
            bool registerTarget(const std::string &interface_name, std::shared_ptr<RelayQueue> queue);

            /**
             * @brief Freeze the routing table before the relay loops start
             */
            void seal();
            bool isSealed() const { return sealed_.load(); }

            /**
             * @brief Enqueue @p message on every target except its source
             * @return number of targets that accepted the message without a drop
             */
            size_t broadcast(const RelayMessagePtr &message) const;

            size_t targetCount() const { return targets_.size(); }
            bool hasTarget(const std::string &interface_name) const;
            std::vector<std::string> targetNames() const;

        private:
            std::map<std::string, std::shared_ptr<RelayQueue>> targets_;
            std::atomic<bool> sealed_;
        };

    } // namespace Relay
} // namespace UdpRelay

#endif // UDP_RELAY_DISTRIBUTOR_HPP
