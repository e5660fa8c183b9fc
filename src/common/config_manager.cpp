// src/common/config_manager.cpp
#include "config_manager.hpp"
#include "network_utils.hpp"
#include "utils.hpp"
#include <fstream>
#include <set>
#include <sstream>
#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace UdpRelay
{
    namespace Common
    {
        namespace
        {
            const std::set<std::string> kKnownKeys = {
                "interfaces", "ports", "filter", "promiscuous", "timeout_ms",
                "overflow_policy", "log_level", "log_file"};
        }

        // ==================== Loading ====================

        bool ConfigManager::loadFromJsonFile(const std::string &config_file, RelayOptions &options, std::string &error)
        {
            std::ifstream file(config_file);
            if (!file.is_open())
            {
                error = "cannot open config file " + config_file;
                return false;
            }

            std::stringstream buffer;
            buffer << file.rdbuf();

            if (!loadFromJson(buffer.str(), options, error))
            {
                error = config_file + ": " + error;
                return false;
            }

            spdlog::debug("Loaded configuration from {}", config_file);
            return true;
        }

        bool ConfigManager::loadFromJson(const std::string &json_content, RelayOptions &options, std::string &error)
        {
            try
            {
                json root = json::parse(json_content);
                if (!root.is_object())
                {
                    error = "top-level JSON value must be an object";
                    return false;
                }

                for (const auto &item : root.items())
                {
                    if (kKnownKeys.find(item.key()) == kKnownKeys.end())
                    {
                        spdlog::warn("Ignoring unknown configuration key '{}'", item.key());
                    }
                }

                if (root.contains("interfaces"))
                    options.listen = root.at("interfaces").get<std::vector<std::string>>();
                if (root.contains("ports"))
                    options.ports = root.at("ports").get<std::vector<int>>();
                if (root.contains("filter"))
                    options.filter = root.at("filter").get<std::string>();
                if (root.contains("promiscuous"))
                    options.promiscuous = root.at("promiscuous").get<bool>();
                if (root.contains("timeout_ms"))
                    options.timeout_ms = root.at("timeout_ms").get<int>();
                if (root.contains("overflow_policy"))
                    options.overflow_policy = root.at("overflow_policy").get<std::string>();
                if (root.contains("log_level"))
                    options.logging.level = root.at("log_level").get<std::string>();
                if (root.contains("log_file"))
                    options.logging.file = root.at("log_file").get<std::string>();
            }
            catch (const json::exception &e)
            {
                error = std::string("invalid configuration: ") + e.what();
                return false;
            }

            return true;
        }

        // ==================== Validation ====================

        bool ConfigManager::validate(const RelayOptions &options, std::string &error)
        {
            std::vector<ListenSpec> specs;
            if (!parseListenSpecs(options.listen, specs, error))
            {
                return false;
            }

            if (specs.size() < 2)
            {
                error = "at least two interfaces are required, got " + std::to_string(specs.size());
                return false;
            }

            if (options.ports.empty())
            {
                error = "at least one port is required";
                return false;
            }

            for (int port : options.ports)
            {
                if (!NetworkUtils::isValidPort(port))
                {
                    error = "invalid port " + std::to_string(port);
                    return false;
                }
            }

            if (options.timeout_ms <= 0)
            {
                error = "timeout must be positive, got " + std::to_string(options.timeout_ms) + " ms";
                return false;
            }

            OverflowPolicy policy;
            if (!parseOverflowPolicy(options.overflow_policy, policy))
            {
                error = "unknown overflow policy '" + options.overflow_policy +
                        "' (expected drop-oldest or drop-newest)";
                return false;
            }

            spdlog::level::level_enum level;
            if (!stringToLogLevel(options.logging.level, level))
            {
                error = "unknown log level '" + options.logging.level + "'";
                return false;
            }

            return true;
        }

        bool ConfigManager::parseListenSpecs(const std::vector<std::string> &entries,
                                             std::vector<ListenSpec> &specs,
                                             std::string &error)
        {
            specs.clear();
            std::vector<ListenSpec> parsed;
            std::set<std::string> seen;

            for (const auto &entry : entries)
            {
                std::vector<std::string> parts = Utils::split(entry, "@");
                if (parts.size() != 2)
                {
                    error = entry + " is invalid. Expected: <interface>@<ipaddr>";
                    return false;
                }

                ListenSpec spec;
                spec.interface = Utils::trim(parts[0]);
                spec.destination = Utils::trim(parts[1]);

                if (spec.interface.empty() || spec.destination.empty())
                {
                    error = entry + " is invalid. Expected: <interface>@<ipaddr>";
                    return false;
                }

                if (!NetworkUtils::parseIPv4NetworkOrder(spec.destination, spec.destination_addr))
                {
                    error = entry + ": '" + spec.destination + "' is not an IPv4 address";
                    return false;
                }

                if (!seen.insert(spec.interface).second)
                {
                    error = "Can't specify the same interface (" + spec.interface + ") multiple times";
                    return false;
                }

                parsed.push_back(spec);
            }

            specs = std::move(parsed);
            return true;
        }

        bool ConfigManager::parseOverflowPolicy(const std::string &name, OverflowPolicy &policy)
        {
            std::string value = Utils::toLowerCase(Utils::trim(name));
            if (value == "drop-oldest")
            {
                policy = OverflowPolicy::DROP_OLDEST;
                return true;
            }
            if (value == "drop-newest")
            {
                policy = OverflowPolicy::DROP_NEWEST;
                return true;
            }
            return false;
        }

        std::string ConfigManager::overflowPolicyToString(OverflowPolicy policy)
        {
            return policy == OverflowPolicy::DROP_OLDEST ? "drop-oldest" : "drop-newest";
        }

        // ==================== Derived values ====================

        std::string ConfigManager::buildCaptureFilter(const std::vector<int> &ports, const std::string &extra)
        {
            std::string filter = "udp";

            if (!ports.empty())
            {
                std::vector<std::string> terms;
                for (int port : ports)
                {
                    terms.push_back("port " + std::to_string(port));
                }
                filter += " and (" + Utils::join(terms, " or ") + ")";
            }

            std::string trimmed = Utils::trim(extra);
            if (!trimmed.empty())
            {
                filter += " and (" + trimmed + ")";
            }

            return filter;
        }

    } // namespace Common
} // namespace UdpRelay
