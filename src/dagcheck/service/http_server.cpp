/**
 * @file http_server.cpp
 */
#include "dagcheck/service/http_server.hpp"
#include "dagcheck/service/logger.hpp"

#include <algorithm>
#include <csignal>
#include <optional>
#include <thread>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

namespace dagcheck
{

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace
{

HttpResponse detail_response(http::status status, unsigned version, const char* body)
{
    HttpResponse res{status, version};
    res.set(http::field::server, "dagcheck");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = body;
    res.prepare_payload();
    return res;
}

// ============================================================================
// HttpSession
// ============================================================================

/**
 * @brief One client connection.
 *
 * @details
 * Owned by its pending asynchronous operation; it is destroyed once no read
 * or write is outstanding. All handlers run on the connection's strand.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession>
{
public:
    HttpSession(tcp::socket&& socket, std::shared_ptr<const RequestRouter> router,
                uint64_t max_body_bytes, std::chrono::seconds read_timeout)
        : m_stream(std::move(socket))
        , m_router(std::move(router))
        , m_max_body_bytes(max_body_bytes)
        , m_read_timeout(read_timeout)
    {
    }

    void start()
    {
        net::dispatch(m_stream.get_executor(),
                      beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

private:
    void do_read()
    {
        // A parser handles exactly one message
        m_parser.emplace();
        m_parser->body_limit(m_max_body_bytes);

        m_stream.expires_after(m_read_timeout);
        http::async_read(m_stream, m_buffer, *m_parser,
                         beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t)
    {
        if (ec == http::error::end_of_stream)
        {
            do_close();
            return;
        }
        if (ec == http::error::body_limit)
        {
            DAGCHECK_LOG_DEBUG("Request body exceeds {} bytes", m_max_body_bytes);
            send(detail_response(http::status::payload_too_large, 11,
                                 R"({"detail":"Request body too large"})"));
            return;
        }
        if (ec == beast::error::timeout)
        {
            DAGCHECK_LOG_DEBUG("Closing idle connection");
            return;
        }
        if (ec)
        {
            DAGCHECK_LOG_DEBUG("Connection read ended: {}", ec.message());
            return;
        }

        const HttpRequest& req = m_parser->get();
        HttpResponse res;
        try
        {
            res = m_router->handle(req);
        }
        catch (const std::exception& e)
        {
            DAGCHECK_LOG_ERROR("Request handling failed: {}", e.what());
            res = detail_response(http::status::internal_server_error, req.version(),
                                  R"({"detail":"Internal Server Error"})");
        }
        DAGCHECK_LOG_DEBUG("{} {} -> {}",
                           std::string(req.method_string().data(), req.method_string().size()),
                           std::string(req.target().data(), req.target().size()),
                           res.result_int());
        send(std::move(res));
    }

    void send(HttpResponse&& res)
    {
        m_response = std::move(res);
        bool keep_alive = m_response.keep_alive();

        m_stream.expires_after(m_read_timeout);
        http::async_write(m_stream, m_response,
                          beast::bind_front_handler(&HttpSession::on_write, shared_from_this(),
                                                    keep_alive));
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t)
    {
        if (ec)
        {
            DAGCHECK_LOG_WARN("Write failed: {}", ec.message());
            return;
        }
        if (!keep_alive)
        {
            do_close();
            return;
        }
        do_read();
    }

    void do_close()
    {
        beast::error_code ec;
        m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    HttpResponse m_response;
    std::shared_ptr<const RequestRouter> m_router;
    uint64_t m_max_body_bytes;
    std::chrono::seconds m_read_timeout;
};

} // namespace

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(const ServiceConfig& config, std::shared_ptr<const RequestRouter> router)
    : m_router(std::move(router))
    , m_max_body_bytes(config.max_body_bytes)
    , m_read_timeout(config.read_timeout_seconds)
    , m_thread_count(config.thread_count != 0 ? config.thread_count
                                              : std::max(1u, std::thread::hardware_concurrency()))
    , m_ioc(static_cast<int>(m_thread_count))
    , m_acceptor(net::make_strand(m_ioc))
    , m_signals(m_ioc, SIGINT, SIGTERM)
{
    tcp::endpoint endpoint{net::ip::make_address(config.host), config.port};
    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(net::socket_base::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen(net::socket_base::max_listen_connections);
    m_port = m_acceptor.local_endpoint().port();
}

void HttpServer::run()
{
    m_signals.async_wait([this](const beast::error_code& ec, int signal_number) {
        if (!ec)
        {
            DAGCHECK_LOG_INFO("Received signal {}, shutting down", signal_number);
            stop();
        }
    });

    DAGCHECK_LOG_INFO("Listening on http://{}:{} ({} thread(s))",
                      m_acceptor.local_endpoint().address().to_string(), m_port, m_thread_count);
    do_accept();

    std::vector<std::thread> workers;
    workers.reserve(m_thread_count - 1);
    for (size_t i = 1; i < m_thread_count; ++i)
    {
        workers.emplace_back([this]() { m_ioc.run(); });
    }
    m_ioc.run();
    for (auto& worker : workers)
    {
        worker.join();
    }
}

void HttpServer::stop()
{
    net::post(m_acceptor.get_executor(), [this]() {
        beast::error_code ec;
        m_acceptor.close(ec);
        m_signals.cancel(ec);
        m_ioc.stop();
    });
}

void HttpServer::do_accept()
{
    // Each session gets its own strand
    m_acceptor.async_accept(net::make_strand(m_ioc),
                            beast::bind_front_handler(&HttpServer::on_accept, this));
}

void HttpServer::on_accept(const beast::error_code& ec, tcp::socket socket)
{
    if (ec == net::error::operation_aborted)
    {
        return;
    }
    if (ec)
    {
        DAGCHECK_LOG_WARN("Accept failed: {}", ec.message());
    }
    else
    {
        std::make_shared<HttpSession>(std::move(socket), m_router, m_max_body_bytes,
                                      m_read_timeout)
            ->start();
    }

    if (m_acceptor.is_open())
    {
        do_accept();
    }
}

} // namespace dagcheck
