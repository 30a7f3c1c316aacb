#pragma once
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace Log
{
    inline spdlog::level::level_enum levelFromName(const std::string& name)
    {
        // spdlog maps unknown names to "off"; keep info as the fallback instead
        auto lvl = spdlog::level::from_str(name);
        if (lvl == spdlog::level::off && name != "off")
            return spdlog::level::info;
        return lvl;
    }

    inline void init(const std::string& logFile, const std::string& level = "info")
    {
        std::shared_ptr<spdlog::logger> logger;
        try {
            // Create file logger
            logger = spdlog::basic_logger_mt("hidemail", logFile);
            logger->set_level(levelFromName(level));
        }
        catch (const spdlog::spdlog_ex& ex) {
            // Log directory not writable: only warnings and errors reach stderr
            logger = spdlog::stderr_color_mt("hidemail_stderr");
            logger->set_level(spdlog::level::warn);
            logger->warn("Cannot open log file '{}': {}", logFile, ex.what());
        }

        // Make it the default
        spdlog::set_default_logger(logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::flush_on(spdlog::level::info);
    }
}
