// src/common/config_manager.hpp
#ifndef UDP_RELAY_CONFIG_MANAGER_HPP
#define UDP_RELAY_CONFIG_MANAGER_HPP

#include "logger.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace UdpRelay
{
    namespace Common
    {
        /**
         * @brief What a full relay queue does with the next message
         */
        enum class OverflowPolicy
        {
            DROP_OLDEST,    // evict the head, admit the new message
            DROP_NEWEST     // reject the new message
        };

        /**
         * @brief One relay leg parsed from "interface@destination-ip"
         */
        struct ListenSpec
        {
            std::string interface;          // e.g. eth0
            std::string destination;        // dotted quad as configured
            uint32_t destination_addr;      // network byte order

            ListenSpec() : destination_addr(0) {}
        };

        /**
         * @brief Complete process input, before validation
         */
        struct RelayOptions
        {
            std::vector<std::string> listen;    // interface@ip legs
            std::vector<int> ports;             // UDP ports of interest
            std::string filter;                 // extra BPF expression ANDed in
            bool promiscuous;
            int timeout_ms;                     // capture read timeout
            std::string overflow_policy;        // drop-oldest | drop-newest
            LoggingOptions logging;

            RelayOptions()
                : promiscuous(false),
                  timeout_ms(250),
                  overflow_policy("drop-oldest") {}
        };

        /**
         * @class ConfigManager
         * @brief Loads, validates and derives relay configuration
         *
         * Every method reports problems through @p error and a false return;
         * callers treat any failure as fatal before capture starts.
         */
        class ConfigManager
        {
        public:
            /**
             * @brief Load a JSON configuration file into @p options
             *
             * Keys present in the file replace the current values; absent keys
             * leave them untouched.
             */
            static bool loadFromJsonFile(const std::string &config_file, RelayOptions &options, std::string &error);

            /**
             * @brief Same as loadFromJsonFile() for an in-memory document
             */
            static bool loadFromJson(const std::string &json_content, RelayOptions &options, std::string &error);

            /**
             * @brief Check every field of @p options
             */
            static bool validate(const RelayOptions &options, std::string &error);

            /**
             * @brief Split "iface@ip" entries into ListenSpecs
             *
             * Fails on an entry without exactly one '@', an empty part, an invalid
             * destination, or an interface named twice. On failure @p specs is empty.
             */
            static bool parseListenSpecs(const std::vector<std::string> &entries,
                                         std::vector<ListenSpec> &specs,
                                         std::string &error);

            static bool parseOverflowPolicy(const std::string &name, OverflowPolicy &policy);
            static std::string overflowPolicyToString(OverflowPolicy policy);

            /**
             * @brief Build the capture filter shared by every endpoint
             *
             * {9003, 9004} + "" -> "udp and (port 9003 or port 9004)"
             * An extra expression is appended as "and (<extra>)".
             */
            static std::string buildCaptureFilter(const std::vector<int> &ports, const std::string &extra);

        private:
            ConfigManager() = default;
        };

    } // namespace Common
} // namespace UdpRelay

#endif // UDP_RELAY_CONFIG_MANAGER_HPP
