/**
 * @file http_types.hpp
 */
#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace dagcheck
{

namespace beast = boost::beast;
namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

} // namespace dagcheck
