/**
 * @file cors_policy.hpp
 */
#pragma once
#include "dagcheck/common/common.hpp"
#include "dagcheck/service/http_types.hpp"

#include <string_view>

namespace dagcheck
{

/**
 * @brief Cross-origin policy applied to every response.
 *
 * @details
 * Origins are allow-listed; credentials, all methods and all request headers
 * are allowed. An entry of `*` allows every origin. Because credentials are
 * allowed, the request's own origin is echoed instead of `*`.
 *
 * @par Thread safety
 * - Immutable after construction; safe to share between connection threads.
 */
class CorsPolicy
{
public:
    explicit CorsPolicy(std::vector<std::string> allowed_origins);

    /**
     * @brief Check whether an `Origin` header value is allowed.
     */
    bool is_allowed(std::string_view origin) const;

    /**
     * @brief Check whether a request is a CORS preflight.
     * @details An `OPTIONS` request carrying both `Origin` and
     *          `Access-Control-Request-Method`.
     */
    static bool is_preflight(const HttpRequest& req);

    /**
     * @brief Build the response to a preflight request.
     * @return 200 for an allowed origin, 400 `Disallowed CORS origin` otherwise.
     */
    HttpResponse preflight_response(const HttpRequest& req) const;

    /**
     * @brief Add CORS headers to a response for an allowed origin.
     * @details Does nothing if the request has no `Origin` or it is not allowed.
     */
    void apply(const HttpRequest& req, HttpResponse& res) const;

    const std::vector<std::string>& allowed_origins() const noexcept
    {
        return m_allowed_origins;
    }

private:
    std::vector<std::string> m_allowed_origins;
    bool m_allow_any = false;
};

} // namespace dagcheck
