#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    static void init(const std::string &log_level = "INFO")
    {
        auto logger = getLogger();
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");

        // Convert string log level to spdlog level, INFO when unknown
        spdlog::level::level_enum level;
        bool known = parseLevel(log_level, level);
        if (!known)
            level = spdlog::level::info;

        logger->set_level(level);
        if (!known)
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
    }

    static void setLevel(const std::string &log_level)
    {
        auto logger = getLogger();

        spdlog::level::level_enum level;
        if (!parseLevel(log_level, level))
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
            level = spdlog::level::info;
        }

        logger->set_level(level);
        debug("Log level changed to: " + log_level);
    }

    static bool isValidLevel(const std::string &log_level)
    {
        spdlog::level::level_enum ignored;
        return parseLevel(log_level, ignored);
    }

    static void trace(const std::string &message)
    {
        log(Level::TRACE, message);
    }

    static void debug(const std::string &message)
    {
        log(Level::DEBUG, message);
    }

    static void info(const std::string &message)
    {
        log(Level::INFO, message);
    }

    static void warn(const std::string &message)
    {
        log(Level::WARN, message);
    }

    static void error(const std::string &message)
    {
        log(Level::ERROR, message);
    }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = []
        {
            auto existing = spdlog::get("metaclean");
            return existing ? existing : spdlog::stdout_color_mt("metaclean");
        }();
        return logger;
    }

    static bool parseLevel(const std::string &log_level, spdlog::level::level_enum &level)
    {
        if (log_level == "TRACE")
            level = spdlog::level::trace;
        else if (log_level == "DEBUG")
            level = spdlog::level::debug;
        else if (log_level == "INFO")
            level = spdlog::level::info;
        else if (log_level == "WARN")
            level = spdlog::level::warn;
        else if (log_level == "ERROR")
            level = spdlog::level::err;
        else
            return false;
        return true;
    }

    static void log(Level level, const std::string &message)
    {
        auto logger = getLogger();
        switch (level)
        {
        case Level::TRACE:
            logger->trace(message);
            break;
        case Level::DEBUG:
            logger->debug(message);
            break;
        case Level::INFO:
            logger->info(message);
            break;
        case Level::WARN:
            logger->warn(message);
            break;
        case Level::ERROR:
            logger->error(message);
            break;
        }
    }
};
