// logger.hpp
#pragma once

#include <memory>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace loadopts::util
{

    enum class LogLevel
    {
        Debug,
        Info,
        Warning,
        Error,
    };

    /// Shared "loadopts" logger, created on first use.
    std::shared_ptr<spdlog::logger> logger();

    void set_level(LogLevel level);

    /// "debug", "info", "warning"/"warn", "error"; false when unknown.
    bool parse_level(std::string_view name, LogLevel& level);

    template <typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        logger()->debug(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        logger()->info(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warning(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        logger()->warn(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        logger()->error(fmt, std::forward<Args>(args)...);
    }

} // namespace loadopts::util
