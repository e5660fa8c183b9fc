// src/common/logger.hpp
#ifndef UDP_RELAY_LOGGER_HPP
#define UDP_RELAY_LOGGER_HPP

#include <string>
#include <spdlog/spdlog.h>

namespace UdpRelay
{
    namespace Common
    {
        /**
         * @brief Process-wide logging settings
         */
        struct LoggingOptions
        {
            std::string level;          // trace, debug, info, warn, error, fatal
            std::string file;           // rotating log file, empty = console only
            size_t max_file_size;       // bytes per rotated file
            size_t max_files;           // rotated files kept

            LoggingOptions()
                : level("info"),
                  file(""),
                  max_file_size(10 * 1024 * 1024),
                  max_files(5) {}
        };

        /**
         * @brief Convert a level name to an spdlog level
         *
         * "fatal" maps to spdlog's critical level, "warning" is accepted for "warn".
         * @return false for an unknown name
         */
        bool stringToLogLevel(const std::string &level_str, spdlog::level::level_enum &level);

        /**
         * @brief Convert an spdlog level back to the name used in configuration
         */
        std::string logLevelToString(spdlog::level::level_enum level);

        /**
         * @brief Install the default multi-sink logger
         *
         * Console sink always, rotating file sink when options.file is set.
         * @return false (with @p error filled) if the level is unknown or a sink cannot be created
         */
        bool setupLogger(const LoggingOptions &options, std::string &error);

    } // namespace Common
} // namespace UdpRelay

#endif // UDP_RELAY_LOGGER_HPP
