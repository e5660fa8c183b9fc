// src/common/logger.cpp
#include "logger.hpp"
#include "utils.hpp"
#include <chrono>
#include <memory>
#include <vector>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace UdpRelay
{
    namespace Common
    {
        bool stringToLogLevel(const std::string &level_str, spdlog::level::level_enum &level)
        {
            std::string name = Utils::toLowerCase(Utils::trim(level_str));

            if (name == "trace")
                level = spdlog::level::trace;
            else if (name == "debug")
                level = spdlog::level::debug;
            else if (name == "info")
                level = spdlog::level::info;
            else if (name == "warn" || name == "warning")
                level = spdlog::level::warn;
            else if (name == "error")
                level = spdlog::level::err;
            else if (name == "fatal" || name == "critical")
                level = spdlog::level::critical;
            else
                return false;

            return true;
        }

        std::string logLevelToString(spdlog::level::level_enum level)
        {
            switch (level)
            {
                case spdlog::level::trace:    return "trace";
                case spdlog::level::debug:    return "debug";
                case spdlog::level::info:     return "info";
                case spdlog::level::warn:     return "warn";
                case spdlog::level::err:      return "error";
                case spdlog::level::critical: return "fatal";
                default:                      return "off";
            }
        }

        // ==================== SETUP LOGGER ====================
        bool setupLogger(const LoggingOptions &options, std::string &error)
        {
            spdlog::level::level_enum level;
            if (!stringToLogLevel(options.level, level))
            {
                error = "unknown log level '" + options.level + "'";
                return false;
            }

            try
            {
                auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console_sink->set_level(level);
                console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

                std::vector<spdlog::sink_ptr> sinks{console_sink};

                if (!options.file.empty())
                {
                    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        options.file, options.max_file_size, options.max_files);
                    file_sink->set_level(level);
                    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                    sinks.push_back(file_sink);
                }

                auto logger = std::make_shared<spdlog::logger>("udp-relay", sinks.begin(), sinks.end());
                logger->set_level(level);
                logger->flush_on(spdlog::level::warn);

                spdlog::set_default_logger(logger);
                spdlog::flush_every(std::chrono::seconds(5));
            }
            catch (const spdlog::spdlog_ex &ex)
            {
                error = std::string("log initialization failed: ") + ex.what();
                return false;
            }

            spdlog::debug("Logger initialized at level {}", logLevelToString(level));
            return true;
        }

    } // namespace Common
} // namespace UdpRelay
