// interfaces/cli/cli_parser.hpp
#ifndef UDP_RELAY_CLI_PARSER_HPP
#define UDP_RELAY_CLI_PARSER_HPP

#include "config_manager.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace UdpRelay
{
    namespace Interface
    {
        namespace CLI
        {
            // ==================== Parsed Arguments ====================
            /**
             * @brief Command line as given, before merging with a config file
             *
             * The has_* flags tell which scalar options appeared, so only those
             * override values loaded from JSON.
             */
            struct CliArguments
            {
                std::vector<std::string> interfaces;
                std::vector<int> ports;

                bool has_filter;
                std::string filter;
                bool promiscuous;
                bool has_timeout;
                int timeout_ms;
                bool has_overflow;
                std::string overflow_policy;
                bool has_log_level;
                std::string log_level;
                bool has_log_file;
                std::string log_file;

                std::string config_file;
                bool list_interfaces;
                bool help;
                bool version;

                CliArguments()
                    : has_filter(false), promiscuous(false),
                      has_timeout(false), timeout_ms(0),
                      has_overflow(false), has_log_level(false), has_log_file(false),
                      list_interfaces(false), help(false), version(false) {}
            };

            // ==================== Option Info ====================
            struct OptionInfo
            {
                std::string long_name;      // without leading dashes
                char short_name;            // 0 if none
                std::string value_name;     // empty for switches
                std::string description;

                OptionInfo() : short_name(0) {}
                OptionInfo(const std::string &l, char s, const std::string &v, const std::string &d)
                    : long_name(l), short_name(s), value_name(v), description(d) {}

                bool takesValue() const { return !value_name.empty(); }
            };

            // ==================== CLI Parser Class ====================
            class CLIParser
            {
            public:
                CLIParser();

                /**
                 * @brief Parse argv into @p args
                 *
                 * Accepts "-x value", "--name value" and "--name=value".
                 * @return false with @p error set on an unknown option, a missing
                 *         value, a malformed number or a stray positional argument
                 */
                bool parse(int argc, char *argv[], CliArguments &args, std::string &error) const;
                bool parse(const std::vector<std::string> &tokens, CliArguments &args, std::string &error) const;

                /**
                 * @brief Overlay parsed arguments onto options loaded from a file
                 */
                static void applyOverrides(const CliArguments &args, Common::RelayOptions &options);

                // ==================== Help ====================
                void printHelp(std::ostream &out, const std::string &program) const;
                void printVersion(std::ostream &out) const;

                std::string getClosestOption(const std::string &name) const;

            private:
                bool applyOption(const OptionInfo &info, const std::string &value,
                                 CliArguments &args, std::string &error) const;
                const OptionInfo *findLong(const std::string &name) const;
                const OptionInfo *findShort(char name) const;

                static bool parseInt(const std::string &text, int &value);
                int levenshteinDistance(const std::string &s1, const std::string &s2) const;

                std::vector<OptionInfo> options_;
            };

        } // namespace CLI
    }     // namespace Interface
} // namespace UdpRelay

#endif // UDP_RELAY_CLI_PARSER_HPP
