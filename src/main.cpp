#include "dagcheck/service/cors_policy.hpp"
#include "dagcheck/service/http_server.hpp"
#include "dagcheck/service/logger.hpp"
#include "dagcheck/service/request_router.hpp"
#include "dagcheck/service/service_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

int main()
{
    try
    {
        dagcheck::ServiceConfig config = dagcheck::ServiceConfig::load();
        dagcheck::Logger::init(dagcheck::Logger::parse_level(config.log_level));

        std::string origins;
        for (const auto& origin : config.allowed_origins)
        {
            origins += origins.empty() ? origin : ", " + origin;
        }
        DAGCHECK_LOG_INFO("dagcheck starting (allowed origins: {})", origins);

        auto router = std::make_shared<const dagcheck::RequestRouter>(
            dagcheck::CorsPolicy(config.allowed_origins));
        {
            dagcheck::HttpServer server(config, router);
            server.run();
        }

        DAGCHECK_LOG_INFO("dagcheck stopped");
        dagcheck::Logger::shutdown();
    }
    catch (const dagcheck::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nError:\n" << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
