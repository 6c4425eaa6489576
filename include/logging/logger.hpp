#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
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

    /**
     * @brief Configure the process-wide logger
     * @param log_level One of TRACE, DEBUG, INFO, WARN, ERROR
     * @param log_file Optional file that receives a copy of every message
     */
    static void init(const std::string &log_level = "INFO", const std::string &log_file = "")
    {
        auto logger = getLogger();

        if (!log_file.empty())
        {
            try
            {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
                logger->sinks().push_back(file_sink);
            }
            catch (const spdlog::spdlog_ex &e)
            {
                logger->warn("Could not open log file " + log_file + ": " + e.what());
            }
        }

        logger->set_level(parseLevel(log_level));
    }

    static void setLevel(const std::string &log_level)
    {
        getLogger()->set_level(parseLevel(log_level));
        info("Log level changed to: " + log_level);
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
        static auto logger = spdlog::stdout_color_mt("crosspost");
        return logger;
    }

    static spdlog::level::level_enum parseLevel(const std::string &log_level)
    {
        if (log_level == "TRACE")
            return spdlog::level::trace;
        if (log_level == "DEBUG")
            return spdlog::level::debug;
        if (log_level == "INFO")
            return spdlog::level::info;
        if (log_level == "WARN")
            return spdlog::level::warn;
        if (log_level == "ERROR")
            return spdlog::level::err;

        getLogger()->warn("Invalid log level: " + log_level + ", defaulting to INFO");
        return spdlog::level::info;
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
