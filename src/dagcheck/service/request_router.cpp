/**
 * @file request_router.cpp
 */
#include "dagcheck/service/request_router.hpp"
#include "dagcheck/common/pipeline_decoder.hpp"
#include "dagcheck/service/form_data.hpp"
#include "dagcheck/service/logger.hpp"

#include <cctype>
#include <string_view>

namespace dagcheck
{

namespace
{

const char* const k_root_path = "/";
const char* const k_parse_path = "/pipelines/parse";
const char* const k_form_content_type = "application/x-www-form-urlencoded";
const char* const k_multipart_content_type = "multipart/form-data";

std::string_view to_std(beast::string_view sv)
{
    return std::string_view(sv.data(), sv.size());
}

nlohmann::json error_body(const std::string& message)
{
    return nlohmann::json{{"error", message}};
}

/// Case-insensitive prefix match; media types are case-insensitive.
bool starts_with(std::string_view s, std::string_view prefix)
{
    if (s.size() < prefix.size())
    {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i])))
        {
            return false;
        }
    }
    return true;
}

} // namespace

void to_json(nlohmann::json& j, const ValidationResult& result)
{
    j = nlohmann::json{
        {"num_nodes", result.num_nodes},
        {"num_edges", result.num_edges},
        {"is_dag", result.is_dag},
        {"message", result.message}};
}

RequestRouter::RequestRouter(CorsPolicy cors)
    : m_cors(std::move(cors))
    , m_validator()
{
}

// ============================================================================
// Dispatch
// ============================================================================

HttpResponse RequestRouter::handle(const HttpRequest& req) const
{
    if (CorsPolicy::is_preflight(req))
    {
        return m_cors.preflight_response(req);
    }

    std::string_view target = to_std(req.target());
    std::string_view path = target.substr(0, target.find('?'));

    HttpResponse res;
    if (path == k_root_path)
    {
        if (req.method() == http::verb::get)
        {
            res = json_response(req, http::status::ok, nlohmann::json{{"Ping", "Pong"}});
        }
        else
        {
            res = json_response(req, http::status::method_not_allowed,
                                nlohmann::json{{"detail", "Method Not Allowed"}});
        }
    }
    else if (path == k_parse_path)
    {
        if (req.method() == http::verb::get || req.method() == http::verb::post)
        {
            res = handle_parse(req);
        }
        else
        {
            res = json_response(req, http::status::method_not_allowed,
                                nlohmann::json{{"detail", "Method Not Allowed"}});
        }
    }
    else
    {
        res = json_response(req, http::status::not_found, nlohmann::json{{"detail", "Not Found"}});
    }

    m_cors.apply(req, res);
    return res;
}

HttpResponse RequestRouter::handle_parse(const HttpRequest& req) const
{
    FormData form;
    std::string_view content_type = to_std(req[http::field::content_type]);
    if (!req.body().empty())
    {
        if (starts_with(content_type, k_form_content_type))
        {
            form = FormData::parse(req.body());
        }
        else if (starts_with(content_type, k_multipart_content_type))
        {
            auto boundary = FormData::multipart_boundary(content_type);
            if (!boundary)
            {
                return json_response(req, http::status::ok,
                                     error_body("Multipart form data has no boundary"));
            }
            try
            {
                form = FormData::parse_multipart(req.body(), *boundary);
            }
            catch (const FormDataError& e)
            {
                DAGCHECK_LOG_DEBUG("Rejected multipart body: {}", e.what());
                return json_response(req, http::status::ok, error_body(e.what()));
            }
        }
        else
        {
            return json_response(req, http::status::ok,
                                 error_body(std::string("Form data must be sent as ") +
                                            k_form_content_type + " or " +
                                            k_multipart_content_type));
        }
    }
    else
    {
        std::string_view target = to_std(req.target());
        auto query = target.find('?');
        if (query != std::string_view::npos)
        {
            form = FormData::parse(target.substr(query + 1));
        }
    }

    auto nodes = form.get("nodes");
    if (!nodes)
    {
        return json_response(req, http::status::ok, error_body("Missing form field 'nodes'"));
    }
    auto edges = form.get("edges");
    if (!edges)
    {
        return json_response(req, http::status::ok, error_body("Missing form field 'edges'"));
    }

    return json_response(req, http::status::ok, check_pipeline(*nodes, *edges));
}

// ============================================================================
// Validation entry point
// ============================================================================

nlohmann::json RequestRouter::check_pipeline(const std::string& nodes_text,
                                             const std::string& edges_text) const
{
    try
    {
        auto nodes_raw = decode_pipeline_field(nodes_text, PipelineSide::Nodes);
        auto edges_raw = decode_pipeline_field(edges_text, PipelineSide::Edges);

        ValidationResult result = m_validator.validate(nodes_raw, edges_raw);
        DAGCHECK_LOG_DEBUG("Pipeline checked: {}", result.summary());
        return nlohmann::json(result);
    }
    catch (const PipelineError& e)
    {
        DAGCHECK_LOG_DEBUG("Pipeline input error ({}): {}", to_string(e.code()), e.what());
        return error_body(e.what());
    }
    catch (const std::exception& e)
    {
        DAGCHECK_LOG_ERROR("Unexpected failure while checking pipeline: {}", e.what());
        return error_body(std::string("Error processing pipeline: ") + e.what());
    }
}

HttpResponse RequestRouter::json_response(const HttpRequest& req, http::status status,
                                          const nlohmann::json& body)
{
    HttpResponse res{status, req.version()};
    res.set(http::field::server, "dagcheck");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    // Replace invalid UTF-8 from client text instead of throwing
    res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

} // namespace dagcheck
