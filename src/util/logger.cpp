// logger.cpp

#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include "text.hpp"

namespace loadopts::util
{
    static spdlog::level::level_enum
    to_spdlog_level(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warning:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        }

        return spdlog::level::info;
    }

    std::shared_ptr<spdlog::logger> logger()
    {
        static const std::shared_ptr<spdlog::logger> instance = []
        {
            // stderr keeps stdout free for command output
            auto existing = spdlog::get("loadopts");
            if (existing)
                return existing;
            auto created = spdlog::stderr_color_mt("loadopts");
            created->set_level(spdlog::level::warn);
            return created;
        }();
        return instance;
    }

    void set_level(LogLevel level)
    {
        logger()->set_level(to_spdlog_level(level));
    }

    bool parse_level(std::string_view name, LogLevel& level)
    {
        const std::string lowered = to_lower(trim(name));

        if (lowered == "debug")
            level = LogLevel::Debug;
        else if (lowered == "info")
            level = LogLevel::Info;
        else if (lowered == "warning" || lowered == "warn")
            level = LogLevel::Warning;
        else if (lowered == "error")
            level = LogLevel::Error;
        else
            return false;
        return true;
    }

} // namespace loadopts::util
