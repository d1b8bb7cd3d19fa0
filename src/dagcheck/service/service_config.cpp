/**
 * @file service_config.cpp
 */
#include "dagcheck/service/service_config.hpp"
#include "dagcheck/service/logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <istream>
#include <limits>
#include <system_error>

namespace dagcheck
{

namespace
{

const char* const k_whitespace = " \t\r";

std::string trim(const std::string& s)
{
    auto first = s.find_first_not_of(k_whitespace);
    if (first == std::string::npos)
    {
        return {};
    }
    auto last = s.find_last_not_of(k_whitespace);
    return s.substr(first, last - first + 1);
}

std::string unescape_double_quoted(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\\' || i + 1 == s.size())
        {
            out.push_back(s[i]);
            continue;
        }
        char next = s[++i];
        switch (next)
        {
        case 'n':
            out.push_back('\n');
            break;
        case 't':
            out.push_back('\t');
            break;
        case '"':
        case '\\':
            out.push_back(next);
            break;
        default:
            out.push_back('\\');
            out.push_back(next);
            break;
        }
    }
    return out;
}

std::string parse_value(const std::string& raw)
{
    std::string value = trim(raw);
    if (value.empty())
    {
        return value;
    }

    char quote = value.front();
    if (quote == '"' || quote == '\'')
    {
        // Find the closing quote, skipping escaped ones in double quotes
        for (size_t i = 1; i < value.size(); ++i)
        {
            if (quote == '"' && value[i] == '\\')
            {
                ++i;
                continue;
            }
            if (value[i] == quote)
            {
                std::string inner = value.substr(1, i - 1);
                return quote == '"' ? unescape_double_quoted(inner) : inner;
            }
        }
        // Unterminated quote: keep the text as written
        return value;
    }

    auto comment = value.find(" #");
    if (comment != std::string::npos)
    {
        value = trim(value.substr(0, comment));
    }
    return value;
}

uint64_t parse_unsigned(const std::string& name, const std::string& text, uint64_t min,
                        uint64_t max)
{
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
    {
        throw ConfigError(name + " must be a non-negative integer, got '" + text + "'");
    }
    uint64_t value = 0;
    try
    {
        value = std::stoull(text);
    }
    catch (const std::out_of_range&)
    {
        throw ConfigError(name + " is out of range: " + text);
    }
    if (value < min || value > max)
    {
        throw ConfigError(name + " must be between " + std::to_string(min) + " and " +
                          std::to_string(max) + ", got " + text);
    }
    return value;
}

std::vector<std::string> split_origins(const std::string& text)
{
    std::vector<std::string> origins;
    size_t start = 0;
    while (start <= text.size())
    {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos)
        {
            comma = text.size();
        }
        std::string origin = trim(text.substr(start, comma - start));
        // Browsers never send a trailing slash in Origin
        while (origin.size() > 1 && origin.back() == '/')
        {
            origin.pop_back();
        }
        if (!origin.empty())
        {
            origins.push_back(std::move(origin));
        }
        start = comma + 1;
    }
    return origins;
}

} // namespace

// ============================================================================
// Dotenv
// ============================================================================

std::vector<EnvAssignment> parse_dotenv(std::istream& in)
{
    std::vector<EnvAssignment> assignments;
    std::string line;
    while (std::getline(in, line))
    {
        std::string text = trim(line);
        if (text.empty() || text.front() == '#')
        {
            continue;
        }
        if (text.compare(0, 7, "export ") == 0)
        {
            text = trim(text.substr(7));
        }

        auto eq = text.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        std::string key = trim(text.substr(0, eq));
        if (key.empty())
        {
            continue;
        }
        assignments.emplace_back(std::move(key), parse_value(text.substr(eq + 1)));
    }
    return assignments;
}

size_t load_dotenv_file(const std::string& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        return 0;
    }

    std::ifstream in(path);
    if (!in.is_open())
    {
        throw ConfigError("Cannot read environment file '" + path + "'");
    }

    size_t applied = 0;
    for (const auto& [key, value] : parse_dotenv(in))
    {
        if (std::getenv(key.c_str()) != nullptr)
        {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 0) != 0)
        {
            throw ConfigError("Cannot set environment variable '" + key + "'");
        }
        ++applied;
    }
    return applied;
}

// ============================================================================
// ServiceConfig
// ============================================================================

ServiceConfig ServiceConfig::from_lookup(const EnvLookup& lookup)
{
    ServiceConfig config;

    if (auto v = lookup("FRONTEND_URL"))
    {
        config.allowed_origins = split_origins(*v);
        if (config.allowed_origins.empty())
        {
            throw ConfigError("FRONTEND_URL does not name any origin");
        }
    }
    if (auto v = lookup("DAGCHECK_HOST"))
    {
        if (trim(*v).empty())
        {
            throw ConfigError("DAGCHECK_HOST must not be empty");
        }
        config.host = trim(*v);
    }
    if (auto v = lookup("DAGCHECK_PORT"))
    {
        config.port = static_cast<uint16_t>(parse_unsigned("DAGCHECK_PORT", trim(*v), 1, 65535));
    }
    if (auto v = lookup("DAGCHECK_LOG_LEVEL"))
    {
        config.log_level = trim(*v);
        try
        {
            Logger::parse_level(config.log_level);
        }
        catch (const std::invalid_argument& e)
        {
            throw ConfigError(std::string("DAGCHECK_LOG_LEVEL: ") + e.what());
        }
    }
    if (auto v = lookup("DAGCHECK_MAX_BODY_BYTES"))
    {
        config.max_body_bytes = parse_unsigned("DAGCHECK_MAX_BODY_BYTES", trim(*v), 1,
                                               std::numeric_limits<uint32_t>::max());
    }
    if (auto v = lookup("DAGCHECK_READ_TIMEOUT_SECONDS"))
    {
        config.read_timeout_seconds = static_cast<uint32_t>(
            parse_unsigned("DAGCHECK_READ_TIMEOUT_SECONDS", trim(*v), 1, 86400));
    }
    if (auto v = lookup("DAGCHECK_THREADS"))
    {
        config.thread_count =
            static_cast<size_t>(parse_unsigned("DAGCHECK_THREADS", trim(*v), 0, 256));
    }
    return config;
}

ServiceConfig ServiceConfig::load()
{
    const char* env_file = std::getenv("DAGCHECK_ENV_FILE");
    load_dotenv_file(env_file != nullptr ? env_file : ".env");

    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr)
        {
            return std::nullopt;
        }
        return std::string(value);
    });
}

} // namespace dagcheck
