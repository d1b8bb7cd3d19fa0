/**
 * @file http_server.hpp
 */
#pragma once
#include "dagcheck/common/common.hpp"
#include "dagcheck/service/http_types.hpp"
#include "dagcheck/service/request_router.hpp"
#include "dagcheck/service/service_config.hpp"

#include <chrono>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

namespace dagcheck
{

/**
 * @brief HTTP/1.1 listener serving a RequestRouter.
 *
 * @details
 * Every connection is an asynchronous session on one io_context, which is
 * run by `ServiceConfig::thread_count` threads. Sessions read requests with
 * keep-alive until the client closes, a response asks to close, or the
 * connection stays silent for `ServiceConfig::read_timeout_seconds`.
 * Requests whose body exceeds `ServiceConfig::max_body_bytes` get 413 and the
 * connection is closed.
 *
 * @par Lifecycle
 * The constructor opens and binds the listening socket. `run()` blocks until
 * SIGINT, SIGTERM or `stop()`; when it returns, no thread touches the server
 * any more. Open sessions are dropped with the io_context.
 *
 * @par Thread safety
 * - `stop()` and `port()` may be called from any thread.
 * - `run()` must be called at most once.
 */
class HttpServer
{
public:
    /**
     * @brief Bind the listening socket.
     * @throw boost::system::system_error if the address cannot be bound.
     */
    HttpServer(const ServiceConfig& config, std::shared_ptr<const RequestRouter> router);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Serve until stopped.
     */
    void run();

    /**
     * @brief Request the server to stop; `run()` returns shortly after.
     */
    void stop();

    /**
     * @brief The bound port (useful when configured with an ephemeral port).
     */
    uint16_t port() const noexcept
    {
        return m_port;
    }

private:
    void do_accept();

    void on_accept(const beast::error_code& ec, boost::asio::ip::tcp::socket socket);

    std::shared_ptr<const RequestRouter> m_router;
    uint64_t m_max_body_bytes;
    std::chrono::seconds m_read_timeout;
    size_t m_thread_count;
    boost::asio::io_context m_ioc;
    boost::asio::ip::tcp::acceptor m_acceptor;
    boost::asio::signal_set m_signals;
    uint16_t m_port = 0;
};

} // namespace dagcheck
