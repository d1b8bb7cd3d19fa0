/**
 * @file logger.cpp
 */
#include "dagcheck/service/logger.hpp"

#include <mutex>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace dagcheck
{

namespace
{

std::mutex g_logger_mutex;

} // namespace

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;

void Logger::init(spdlog::level::level_enum level)
{
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (s_logger)
    {
        s_logger->set_level(level);
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    s_logger = std::make_shared<spdlog::logger>("dagcheck", console_sink);
    s_logger->set_level(level);

    // [HH:MM:SS.ms] [LEVEL] [thread ID] message
    s_logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    s_logger->flush_on(spdlog::level::warn);
}

void Logger::shutdown()
{
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (s_logger)
    {
        s_logger->flush();
        s_logger = nullptr;
    }
}

std::shared_ptr<spdlog::logger> Logger::get()
{
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (s_logger)
        {
            return s_logger;
        }
    }
    init();
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return s_logger;
}

spdlog::level::level_enum Logger::parse_level(const std::string& name)
{
    auto level = spdlog::level::from_str(name);
    // from_str() maps unknown names to off
    if (level == spdlog::level::off && name != "off")
    {
        throw std::invalid_argument("Unknown log level '" + name + "'");
    }
    return level;
}

} // namespace dagcheck
