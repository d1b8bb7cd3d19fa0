/**
 * @file logger.hpp
 */
#pragma once
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace dagcheck
{

/**
 * @brief Process-wide logger for the service.
 *
 * @details
 * Wraps a single spdlog logger with a colour console sink. Call
 * `Logger::init()` once at startup; `get()` initializes with defaults if that
 * has not happened yet, so library code and tests can log unconditionally.
 */
class Logger
{
public:
    /**
     * @brief Initialize the logger.
     * @param level Log level (trace, debug, info, warn, err, critical, off).
     * @note A second call only changes the level.
     */
    static void init(spdlog::level::level_enum level = spdlog::level::info);

    /**
     * @brief Flush and drop the logger.
     */
    static void shutdown();

    /**
     * @brief Get the process logger.
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * @brief Parse a level name such as "debug" or "warn".
     * @throw std::invalid_argument if the name is not a spdlog level.
     */
    static spdlog::level::level_enum parse_level(const std::string& name);

private:
    static std::shared_ptr<spdlog::logger> s_logger;

    Logger() = delete;
    ~Logger() = delete;
};

#define DAGCHECK_LOG_TRACE(...) ::dagcheck::Logger::get()->trace(__VA_ARGS__)
#define DAGCHECK_LOG_DEBUG(...) ::dagcheck::Logger::get()->debug(__VA_ARGS__)
#define DAGCHECK_LOG_INFO(...) ::dagcheck::Logger::get()->info(__VA_ARGS__)
#define DAGCHECK_LOG_WARN(...) ::dagcheck::Logger::get()->warn(__VA_ARGS__)
#define DAGCHECK_LOG_ERROR(...) ::dagcheck::Logger::get()->error(__VA_ARGS__)
#define DAGCHECK_LOG_CRITICAL(...) ::dagcheck::Logger::get()->critical(__VA_ARGS__)

} // namespace dagcheck
