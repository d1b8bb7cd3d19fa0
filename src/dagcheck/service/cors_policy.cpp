/**
 * @file cors_policy.cpp
 */
#include "dagcheck/service/cors_policy.hpp"

#include <algorithm>

namespace dagcheck
{

namespace
{

const char* const k_allowed_methods = "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT";
const char* const k_preflight_max_age = "600";

} // namespace

CorsPolicy::CorsPolicy(std::vector<std::string> allowed_origins)
    : m_allowed_origins(std::move(allowed_origins))
{
    m_allow_any = std::find(m_allowed_origins.begin(), m_allowed_origins.end(), "*") !=
                  m_allowed_origins.end();
}

bool CorsPolicy::is_allowed(std::string_view origin) const
{
    if (origin.empty())
    {
        return false;
    }
    if (m_allow_any)
    {
        return true;
    }
    return std::find(m_allowed_origins.begin(), m_allowed_origins.end(), origin) !=
           m_allowed_origins.end();
}

bool CorsPolicy::is_preflight(const HttpRequest& req)
{
    return req.method() == http::verb::options &&
           req.find(http::field::origin) != req.end() &&
           req.find(http::field::access_control_request_method) != req.end();
}

HttpResponse CorsPolicy::preflight_response(const HttpRequest& req) const
{
    HttpResponse res{http::status::ok, req.version()};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.set(http::field::vary, "Origin");
    res.keep_alive(req.keep_alive());

    auto origin = req[http::field::origin];
    if (!is_allowed(std::string_view(origin.data(), origin.size())))
    {
        res.result(http::status::bad_request);
        res.body() = "Disallowed CORS origin";
        res.prepare_payload();
        return res;
    }

    res.set(http::field::access_control_allow_origin, origin);
    res.set(http::field::access_control_allow_credentials, "true");
    res.set(http::field::access_control_allow_methods, k_allowed_methods);
    res.set(http::field::access_control_max_age, k_preflight_max_age);

    auto requested_headers = req[http::field::access_control_request_headers];
    if (!requested_headers.empty())
    {
        res.set(http::field::access_control_allow_headers, requested_headers);
    }

    res.body() = "OK";
    res.prepare_payload();
    return res;
}

void CorsPolicy::apply(const HttpRequest& req, HttpResponse& res) const
{
    auto origin = req[http::field::origin];
    if (!is_allowed(std::string_view(origin.data(), origin.size())))
    {
        return;
    }
    res.set(http::field::access_control_allow_origin, origin);
    res.set(http::field::access_control_allow_credentials, "true");
    res.set(http::field::vary, "Origin");
}

} // namespace dagcheck
