// src/core/relay/distributor.cpp
#include "distributor.hpp"
#include <spdlog/spdlog.h>

namespace UdpRelay
{
    namespace Relay
    {
        Distributor::Distributor()
            : sealed_(false)
        {
        }

        bool Distributor::registerTarget(const std::string &interface_name, std::shared_ptr<RelayQueue> queue)
        {
            if (sealed_.load())
            {
                spdlog::error("Distributor is sealed, cannot register {}", interface_name);
                return false;
            }

            if (!queue)
            {
                spdlog::error("Refusing to register {} without a send queue", interface_name);
                return false;
            }

            if (!targets_.emplace(interface_name, std::move(queue)).second)
            {
                spdlog::error("Interface {} is already registered", interface_name);
                return false;
            }

            spdlog::debug("Registered relay target {}", interface_name);
            return true;
        }

        void Distributor::seal()
        {
            sealed_.store(true);
            spdlog::debug("Distributor sealed with {} target(s)", targets_.size());
        }

        size_t Distributor::broadcast(const RelayMessagePtr &message) const
        {
            if (!message)
            {
                return 0;
            }

            size_t delivered = 0;
            for (const auto &target : targets_)
            {
                // Never hand a packet back to the interface it was captured on
                if (target.first == message->source_interface)
                {
                    continue;
                }

                if (target.second->push(message))
                {
                    delivered++;
                }
            }

            spdlog::trace("Broadcast from {} delivered to {} target(s)", message->source_interface, delivered);
            return delivered;
        }

        bool Distributor::hasTarget(const std::string &interface_name) const
        {
            return targets_.find(interface_name) != targets_.end();
        }

        std::vector<std::string> Distributor::targetNames() const
        {
            std::vector<std::string> names;
            for (const auto &target : targets_)
            {
                names.push_back(target.first);
            }
            return names;
        }

    } // namespace Relay
} // namespace UdpRelay
