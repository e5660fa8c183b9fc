// src/common/utils.hpp
#ifndef UDP_RELAY_UTILS_HPP
#define UDP_RELAY_UTILS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace UdpRelay
{
    namespace Common
    {
        /**
         * @brief General helpers shared by the relay modules
         */
        class Utils
        {
        public:
            // ==================== Time utilities ====================
            /**
             * @brief Current wall-clock time in microseconds since the epoch
             */
            static uint64_t getCurrentTimestampUs();

            /**
             * @brief Format a microsecond timestamp as "YYYY-MM-DD HH:MM:SS.mmm"
             */
            static std::string formatTimestamp(uint64_t timestamp_us);

            // ==================== String utilities ====================
            /**
             * @brief Split on a delimiter string, keeping empty fields
             *
             * "eth0@" yields {"eth0", ""} and "a@b@c" yields three fields.
             */
            static std::vector<std::string> split(const std::string &str, const std::string &delimiter);

            /**
             * @brief Strip leading and trailing whitespace
             */
            static std::string trim(const std::string &str);

            static std::string toLowerCase(const std::string &str);

            /**
             * @brief Join strings with a delimiter
             */
            static std::string join(const std::vector<std::string> &strings, const std::string &delimiter);

        private:
            Utils() = default;
        };

    } // namespace Common
} // namespace UdpRelay

#endif // UDP_RELAY_UTILS_HPP
