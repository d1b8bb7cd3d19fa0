/**
 * @file request_router.hpp
 */
#pragma once
#include "dagcheck/common/common.hpp"
#include "dagcheck/common/graph_validator.hpp"
#include "dagcheck/common/validation_result.hpp"
#include "dagcheck/service/cors_policy.hpp"
#include "dagcheck/service/http_types.hpp"

#include <nlohmann/json.hpp>

namespace dagcheck
{

/**
 * @brief Serialize the client-facing fields of a ValidationResult.
 * @details Produces `{num_nodes, num_edges, is_dag, message}`.
 */
void to_json(nlohmann::json& j, const ValidationResult& result);

/**
 * @brief Maps HTTP requests to the service routes.
 *
 * @details
 * Routes:
 * - `GET /` returns `{"Ping": "Pong"}`.
 * - `GET|POST /pipelines/parse` validates the form fields `nodes` and
 *   `edges`, read from an urlencoded body or else from the query string.
 * - `OPTIONS` preflights are answered by the CORS policy.
 *
 * Validation failures of any kind are returned as `{"error": ...}` with
 * status 200; only routing problems (404, 405) use other statuses.
 *
 * @par Thread safety
 * - Immutable after construction; `handle()` may be called concurrently.
 */
class RequestRouter
{
public:
    explicit RequestRouter(CorsPolicy cors);

    /**
     * @brief Produce the response for one request.
     * @note Never throws for request content; failures become response bodies.
     */
    HttpResponse handle(const HttpRequest& req) const;

    /**
     * @brief Validate the JSON texts of the two form fields.
     * @return The result object, or `{"error": ...}` on any failure.
     */
    nlohmann::json check_pipeline(const std::string& nodes_text, const std::string& edges_text) const;

private:
    HttpResponse handle_parse(const HttpRequest& req) const;

    static HttpResponse json_response(const HttpRequest& req, http::status status,
                                      const nlohmann::json& body);

    CorsPolicy m_cors;
    GraphValidator m_validator;
};

} // namespace dagcheck
