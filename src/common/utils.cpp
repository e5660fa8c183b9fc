// src/common/utils.cpp
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace UdpRelay
{
    namespace Common
    {
        // ==================== Time utilities ====================
        uint64_t Utils::getCurrentTimestampUs()
        {
            return std::chrono::duration_cast<std::chrono::microseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        std::string Utils::formatTimestamp(uint64_t timestamp_us)
        {
            time_t seconds = static_cast<time_t>(timestamp_us / 1000000);
            uint64_t millis = (timestamp_us % 1000000) / 1000;

            struct tm timeinfo;
            localtime_r(&seconds, &timeinfo);

            char buffer[32];
            strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);

            char result[40];
            snprintf(result, sizeof(result), "%s.%03lu", buffer,
                     static_cast<unsigned long>(millis));
            return std::string(result);
        }

        // ==================== String utilities ====================
        std::vector<std::string> Utils::split(const std::string &str, const std::string &delimiter)
        {
            std::vector<std::string> tokens;
            if (delimiter.empty())
            {
                tokens.push_back(str);
                return tokens;
            }

            size_t start = 0;
            size_t end = str.find(delimiter);

            while (end != std::string::npos)
            {
                tokens.push_back(str.substr(start, end - start));
                start = end + delimiter.length();
                end = str.find(delimiter, start);
            }
            tokens.push_back(str.substr(start));
            return tokens;
        }

        std::string Utils::trim(const std::string &str)
        {
            const char *whitespace = " \t\n\r\f\v";
            size_t start = str.find_first_not_of(whitespace);
            if (start == std::string::npos)
                return "";

            size_t end = str.find_last_not_of(whitespace);
            return str.substr(start, end - start + 1);
        }

        std::string Utils::toLowerCase(const std::string &str)
        {
            std::string result = str;
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        std::string Utils::join(const std::vector<std::string> &strings, const std::string &delimiter)
        {
            if (strings.empty())
                return "";

            std::stringstream ss;
            for (size_t i = 0; i < strings.size(); ++i)
            {
                if (i > 0)
                    ss << delimiter;
                ss << strings[i];
            }
            return ss.str();
        }

    } // namespace Common
} // namespace UdpRelay
