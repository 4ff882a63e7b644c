#ifndef __LOGGER_HPP__
#define __LOGGER_HPP__

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace blockring
{
    enum class LogLevel
    {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Accepts "debug", "info", "warn"/"warning" and "error" in any case.
    inline bool logLevelFromString(const std::string &text, LogLevel &level)
    {
        std::string lower(text);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (lower == "debug")
            level = LogLevel::DEBUG;
        else if (lower == "info")
            level = LogLevel::INFO;
        else if (lower == "warn" || lower == "warning")
            level = LogLevel::WARN;
        else if (lower == "error")
            level = LogLevel::ERROR;
        else
            return false;
        return true;
    }

    class Logger
    {
    public:
        static Logger &getInstance()
        {
            static Logger instance;
            return instance;
        }

        void setLevel(LogLevel level)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _level = level;
        }

        LogLevel getLevel() const
        {
            std::lock_guard<std::mutex> lock(_mutex);
            return _level;
        }

        template <typename... Args>
        void log(LogLevel level, const std::string &format, Args &&...args)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (level < _level)
            {
                return;
            }

            auto now = std::chrono::system_clock::now();
            auto time_t = std::chrono::system_clock::to_time_t(now);
            std::tm local_tm{};
            localtime_r(&time_t, &local_tm);

            std::ostringstream oss;
            oss << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "] ";
            oss << "[" << levelToString(level) << "] ";
            oss << formatString(format, std::forward<Args>(args)...);

            std::cerr << oss.str() << std::endl;
        }

        template <typename... Args>
        void debug(const std::string &format, Args &&...args)
        {
            log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void info(const std::string &format, Args &&...args)
        {
            log(LogLevel::INFO, format, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(const std::string &format, Args &&...args)
        {
            log(LogLevel::WARN, format, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(const std::string &format, Args &&...args)
        {
            log(LogLevel::ERROR, format, std::forward<Args>(args)...);
        }

        // Substitutes each "{}" in order; arguments left over are appended.
        template <typename... Args>
        static std::string formatString(const std::string &format, Args &&...args)
        {
            std::ostringstream oss;
            std::size_t pos = 0;
            ((appendArgument(oss, format, pos, args)), ...);
            if (pos < format.size())
            {
                oss << format.substr(pos);
            }
            return oss.str();
        }

    private:
        Logger() = default;
        mutable std::mutex _mutex;
        LogLevel _level = LogLevel::INFO;

        static const char *levelToString(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARN:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            default:
                return "UNKNOWN";
            }
        }

        template <typename Arg>
        static void appendArgument(std::ostringstream &oss, const std::string &format, std::size_t &pos, const Arg &arg)
        {
            const auto marker = pos < format.size() ? format.find("{}", pos) : std::string::npos;
            if (marker == std::string::npos)
            {
                if (pos < format.size())
                {
                    oss << format.substr(pos);
                    pos = format.size();
                }
                oss << " " << arg;
                return;
            }
            oss << format.substr(pos, marker - pos) << arg;
            pos = marker + 2;
        }
    };

#define LOG_DEBUG(...) ::blockring::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::blockring::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) ::blockring::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::blockring::Logger::getInstance().error(__VA_ARGS__)

} // namespace blockring

#endif // __LOGGER_HPP__
