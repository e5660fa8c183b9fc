// interfaces/cli/cli_parser.cpp
#include "cli_parser.hpp"
#include <algorithm>
#include <climits>
#include <stdexcept>

#ifndef UDP_RELAY_VERSION
#define UDP_RELAY_VERSION "0.0.0"
#endif

namespace UdpRelay
{
    namespace Interface
    {
        namespace CLI
        {
            // ==================== Constructor ====================

            CLIParser::CLIParser()
            {
                options_ = {
                    OptionInfo("interface", 'i', "IFACE@IP", "Relay leg: capture on IFACE, send to IP (repeat for each leg)"),
                    OptionInfo("port", 'p', "PORT", "UDP port to relay (repeatable)"),
                    OptionInfo("filter", 'f', "EXPR", "Extra BPF expression ANDed with the port filter"),
                    OptionInfo("promisc", 0, "", "Capture in promiscuous mode"),
                    OptionInfo("timeout", 't', "MS", "Capture read timeout in milliseconds (default 250)"),
                    OptionInfo("overflow", 0, "POLICY", "Full send queue policy: drop-oldest (default) or drop-newest"),
                    OptionInfo("level", 'l', "LEVEL", "Log level: trace, debug, info, warn, error, fatal"),
                    OptionInfo("log-file", 0, "PATH", "Also log to a rotating file"),
                    OptionInfo("config", 'c', "FILE", "Load options from a JSON file first"),
                    OptionInfo("list-interfaces", 'L', "", "List interfaces and their addresses, then exit"),
                    OptionInfo("help", 'h', "", "Show this help"),
                    OptionInfo("version", 'V', "", "Show version")
                };
            }

            // ==================== Parsing ====================

            bool CLIParser::parse(int argc, char *argv[], CliArguments &args, std::string &error) const
            {
                std::vector<std::string> tokens;
                for (int i = 1; i < argc; ++i)
                {
                    tokens.push_back(argv[i]);
                }
                return parse(tokens, args, error);
            }

            bool CLIParser::parse(const std::vector<std::string> &tokens, CliArguments &args, std::string &error) const
            {
                for (size_t i = 0; i < tokens.size(); ++i)
                {
                    const std::string &token = tokens[i];

                    if (token.size() < 2 || token[0] != '-')
                    {
                        error = "unexpected argument '" + token + "'";
                        return false;
                    }

                    const OptionInfo *info = nullptr;
                    std::string value;
                    bool has_inline_value = false;

                    if (token[1] == '-')
                    {
                        std::string name = token.substr(2);
                        size_t eq = name.find('=');
                        if (eq != std::string::npos)
                        {
                            value = name.substr(eq + 1);
                            name = name.substr(0, eq);
                            has_inline_value = true;
                        }

                        info = findLong(name);
                        if (!info)
                        {
                            error = "unknown option '--" + name + "'";
                            std::string closest = getClosestOption(name);
                            if (!closest.empty())
                            {
                                error += ", did you mean '--" + closest + "'?";
                            }
                            return false;
                        }
                    }
                    else
                    {
                        if (token.size() != 2)
                        {
                            error = "unknown option '" + token + "'";
                            return false;
                        }

                        info = findShort(token[1]);
                        if (!info)
                        {
                            error = "unknown option '" + token + "'";
                            return false;
                        }
                    }

                    if (info->takesValue())
                    {
                        if (!has_inline_value)
                        {
                            if (i + 1 >= tokens.size())
                            {
                                error = "option '" + token + "' requires a value (" + info->value_name + ")";
                                return false;
                            }
                            value = tokens[++i];
                        }
                    }
                    else if (has_inline_value)
                    {
                        error = "option '--" + info->long_name + "' does not take a value";
                        return false;
                    }

                    if (!applyOption(*info, value, args, error))
                    {
                        return false;
                    }
                }

                return true;
            }

            bool CLIParser::applyOption(const OptionInfo &info, const std::string &value,
                                        CliArguments &args, std::string &error) const
            {
                const std::string &name = info.long_name;

                if (name == "interface")
                {
                    args.interfaces.push_back(value);
                }
                else if (name == "port")
                {
                    int port = 0;
                    if (!parseInt(value, port))
                    {
                        error = "invalid port '" + value + "'";
                        return false;
                    }
                    args.ports.push_back(port);
                }
                else if (name == "filter")
                {
                    args.has_filter = true;
                    args.filter = value;
                }
                else if (name == "promisc")
                {
                    args.promiscuous = true;
                }
                else if (name == "timeout")
                {
                    if (!parseInt(value, args.timeout_ms))
                    {
                        error = "invalid timeout '" + value + "'";
                        return false;
                    }
                    args.has_timeout = true;
                }
                else if (name == "overflow")
                {
                    args.has_overflow = true;
                    args.overflow_policy = value;
                }
                else if (name == "level")
                {
                    args.has_log_level = true;
                    args.log_level = value;
                }
                else if (name == "log-file")
                {
                    args.has_log_file = true;
                    args.log_file = value;
                }
                else if (name == "config")
                {
                    args.config_file = value;
                }
                else if (name == "list-interfaces")
                {
                    args.list_interfaces = true;
                }
                else if (name == "help")
                {
                    args.help = true;
                }
                else if (name == "version")
                {
                    args.version = true;
                }

                return true;
            }

            void CLIParser::applyOverrides(const CliArguments &args, Common::RelayOptions &options)
            {
                if (!args.interfaces.empty())
                {
                    options.listen = args.interfaces;
                }
                if (!args.ports.empty())
                {
                    options.ports = args.ports;
                }
                if (args.has_filter)
                {
                    options.filter = args.filter;
                }
                if (args.promiscuous)
                {
                    options.promiscuous = true;
                }
                if (args.has_timeout)
                {
                    options.timeout_ms = args.timeout_ms;
                }
                if (args.has_overflow)
                {
                    options.overflow_policy = args.overflow_policy;
                }
                if (args.has_log_level)
                {
                    options.logging.level = args.log_level;
                }
                if (args.has_log_file)
                {
                    options.logging.file = args.log_file;
                }
            }

            // ==================== Help ====================

            void CLIParser::printHelp(std::ostream &out, const std::string &program) const
            {
                out << "Usage: " << program << " -i IFACE@IP -i IFACE@IP -p PORT [options]\n\n";
                out << "Relay UDP broadcast and multicast packets between interfaces.\n\n";
                out << "Options:\n";

                for (const auto &info : options_)
                {
                    std::string flags = info.short_name ? std::string("-") + info.short_name + ", " : "    ";
                    flags += "--" + info.long_name;
                    if (info.takesValue())
                    {
                        flags += " " + info.value_name;
                    }

                    out << "  " << flags;
                    int padding = 30 - static_cast<int>(flags.length());
                    for (int i = 0; i < std::max(padding, 1); ++i)
                    {
                        out << " ";
                    }
                    out << info.description << "\n";
                }

                out << "\nExample:\n";
                out << "  " << program << " -i eth0@192.168.1.255 -i eth1@192.168.2.255 -p 9003\n\n";
            }

            void CLIParser::printVersion(std::ostream &out) const
            {
                out << "udp-relay " << UDP_RELAY_VERSION << "\n";
            }

            std::string CLIParser::getClosestOption(const std::string &name) const
            {
                std::string closest;
                int min_distance = INT_MAX;

                for (const auto &info : options_)
                {
                    int distance = levenshteinDistance(name, info.long_name);
                    if (distance < min_distance && distance <= 3)
                    {
                        min_distance = distance;
                        closest = info.long_name;
                    }
                }

                return closest;
            }

            // ==================== Helper Functions ====================

            const OptionInfo *CLIParser::findLong(const std::string &name) const
            {
                for (const auto &info : options_)
                {
                    if (info.long_name == name)
                    {
                        return &info;
                    }
                }
                return nullptr;
            }

            const OptionInfo *CLIParser::findShort(char name) const
            {
                for (const auto &info : options_)
                {
                    if (info.short_name != 0 && info.short_name == name)
                    {
                        return &info;
                    }
                }
                return nullptr;
            }

            bool CLIParser::parseInt(const std::string &text, int &value)
            {
                try
                {
                    size_t consumed = 0;
                    int parsed = std::stoi(text, &consumed);
                    if (consumed != text.size())
                    {
                        return false;
                    }
                    value = parsed;
                    return true;
                }
                catch (const std::invalid_argument &)
                {
                    return false;
                }
                catch (const std::out_of_range &)
                {
                    return false;
                }
            }

            int CLIParser::levenshteinDistance(const std::string &s1, const std::string &s2) const
            {
                const size_t len1 = s1.size();
                const size_t len2 = s2.size();
                std::vector<std::vector<int>> d(len1 + 1, std::vector<int>(len2 + 1));

                for (size_t i = 0; i <= len1; ++i)
                {
                    d[i][0] = static_cast<int>(i);
                }

                for (size_t j = 0; j <= len2; ++j)
                {
                    d[0][j] = static_cast<int>(j);
                }

                for (size_t i = 1; i <= len1; ++i)
                {
                    for (size_t j = 1; j <= len2; ++j)
                    {
                        int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
                        d[i][j] = std::min({
                            d[i - 1][j] + 1,
                            d[i][j - 1] + 1,
                            d[i - 1][j - 1] + cost
                        });
                    }
                }

                return d[len1][len2];
            }

        } // namespace CLI
    }     // namespace Interface
} // namespace UdpRelay
