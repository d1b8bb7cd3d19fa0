/**
 * @file service_config.hpp
 * @brief Start-up configuration of the HTTP service.
 */
#pragma once
#include "dagcheck/common/common.hpp"

#include <iosfwd>

namespace dagcheck
{

/**
 * @brief Exception thrown when the service configuration is invalid.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Function used to read one configuration variable.
 * @details Returns `std::nullopt` if the variable is not set.
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief A `KEY=VALUE` assignment read from a dotenv file.
 */
using EnvAssignment = std::pair<std::string, std::string>;

/**
 * @brief Parse dotenv-formatted text.
 *
 * @details
 * Accepts blank lines, `#` comment lines, an optional `export ` prefix, and
 * values that are bare, single-quoted or double-quoted. Bare values end at an
 * unquoted ` #`. Double-quoted values understand `\n`, `\t`, `\"` and `\\`.
 * Lines without `=` are ignored.
 *
 * @param in The stream to read.
 * @return Assignments in file order.
 */
std::vector<EnvAssignment> parse_dotenv(std::istream& in);

/**
 * @brief Apply a dotenv file to the process environment.
 * @param path Path of the file. A missing file is not an error.
 * @return Number of variables set; variables already present are kept.
 * @throw ConfigError if the file exists but cannot be read.
 */
size_t load_dotenv_file(const std::string& path);

/**
 * @brief Immutable configuration, loaded once before the server starts.
 *
 * @par Variables
 * - `FRONTEND_URL`: allowed CORS origins, comma-separated
 *   (default `http://localhost:3000`).
 * - `DAGCHECK_HOST`: listen address (default `127.0.0.1`).
 * - `DAGCHECK_PORT`: listen port (default `8000`).
 * - `DAGCHECK_LOG_LEVEL`: spdlog level name (default `info`).
 * - `DAGCHECK_MAX_BODY_BYTES`: request body limit (default 1 MiB).
 * - `DAGCHECK_READ_TIMEOUT_SECONDS`: idle connection timeout (default 30).
 * - `DAGCHECK_THREADS`: I/O threads, 0 for one per hardware thread (default 1).
 */
struct ServiceConfig
{
    std::string host{"127.0.0.1"};

    uint16_t port{8000};

    std::vector<std::string> allowed_origins{"http://localhost:3000"};

    std::string log_level{"info"};

    uint64_t max_body_bytes{1024 * 1024};

    /**
     * @brief Seconds a connection may stay silent before it is closed.
     * @details Applies while waiting for a request and while writing a response.
     */
    uint32_t read_timeout_seconds{30};

    /**
     * @brief Number of threads running the I/O context.
     * @details 0 means use std::thread::hardware_concurrency().
     */
    size_t thread_count{1};

    /**
     * @brief Build a configuration from a variable lookup.
     * @throw ConfigError if a variable holds an invalid value.
     */
    static ServiceConfig from_lookup(const EnvLookup& lookup);

    /**
     * @brief Load `.env` (or `DAGCHECK_ENV_FILE`) and read the process environment.
     * @throw ConfigError if the file cannot be read or a value is invalid.
     */
    static ServiceConfig load();
};

} // namespace dagcheck
