/**
 * @file http_server_tests.cpp
 * @brief HttpServer tests over loopback TCP on an ephemeral port
 */
#include <gtest/gtest.h>
#include "dagcheck/service/http_server.hpp"

#include <chrono>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>

using namespace dagcheck;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// =============================================================================
// Fixture
// =============================================================================

class HttpServerTests : public ::testing::Test
{
protected:
    void start(ServiceConfig config)
    {
        config.host = "127.0.0.1";
        config.port = 0;
        auto router = std::make_shared<const RequestRouter>(CorsPolicy(config.allowed_origins));
        m_server = std::make_unique<HttpServer>(config, router);
        m_thread = std::thread([this]() { m_server->run(); });
    }

    void TearDown() override
    {
        if (m_server)
        {
            m_server->stop();
            m_thread.join();
        }
    }

    tcp::socket connect()
    {
        tcp::socket socket(m_client_ioc);
        socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), m_server->port()));
        return socket;
    }

    static HttpResponse round_trip(tcp::socket& socket, beast::flat_buffer& buffer,
                                   const HttpRequest& req)
    {
        http::write(socket, req);
        HttpResponse res;
        http::read(socket, buffer, res);
        return res;
    }

    net::io_context m_client_ioc;
    std::unique_ptr<HttpServer> m_server;
    std::thread m_thread;
};

// =============================================================================
// Tests
// =============================================================================

TEST_F(HttpServerTests, Binds_EphemeralPort)
{
    start(ServiceConfig{});
    EXPECT_NE(m_server->port(), 0);
}

TEST_F(HttpServerTests, KeepAlive_TwoRequestsOnOneConnection)
{
    start(ServiceConfig{});
    auto socket = connect();
    beast::flat_buffer buffer;

    HttpRequest ping{http::verb::get, "/", 11};
    ping.set(http::field::host, "localhost");
    ping.keep_alive(true);

    auto first = round_trip(socket, buffer, ping);
    EXPECT_EQ(first.result(), http::status::ok);
    EXPECT_TRUE(first.keep_alive());
    EXPECT_EQ(first.body(), R"({"Ping":"Pong"})");

    HttpRequest parse{http::verb::post, "/pipelines/parse", 11};
    parse.set(http::field::host, "localhost");
    parse.set(http::field::content_type, "application/x-www-form-urlencoded");
    parse.keep_alive(true);
    parse.body() = "nodes=%5B%7B%22id%22%3A1%7D%5D&edges=%5B%5D";
    parse.prepare_payload();

    auto second = round_trip(socket, buffer, parse);
    EXPECT_EQ(second.result(), http::status::ok);
    auto body = nlohmann::json::parse(second.body());
    EXPECT_EQ(body["num_nodes"], 1);
    EXPECT_EQ(body["is_dag"], true);
}

TEST_F(HttpServerTests, BodyLimit_OversizedRequestGets413)
{
    ServiceConfig config;
    config.max_body_bytes = 64;
    start(config);
    auto socket = connect();

    // The declared length already exceeds the limit, so the body is never sent
    const std::string head =
        "POST /pipelines/parse HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Type: application/x-www-form-urlencoded\r\n"
        "Content-Length: 1000\r\n"
        "\r\n";
    net::write(socket, net::buffer(head));

    beast::flat_buffer buffer;
    HttpResponse res;
    http::read(socket, buffer, res);
    EXPECT_EQ(res.result(), http::status::payload_too_large);
    EXPECT_FALSE(res.keep_alive());
    EXPECT_EQ(nlohmann::json::parse(res.body())["detail"], "Request body too large");
}

TEST_F(HttpServerTests, IdleTimeout_SilentConnectionIsClosed)
{
    ServiceConfig config;
    config.read_timeout_seconds = 1;
    start(config);
    auto socket = connect();

    bool completed = false;
    beast::error_code read_ec;
    char byte = 0;
    socket.async_read_some(net::buffer(&byte, 1),
                           [&](const beast::error_code& ec, std::size_t) {
                               completed = true;
                               read_ec = ec;
                           });

    auto started = std::chrono::steady_clock::now();
    m_client_ioc.run_for(std::chrono::seconds(10));
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(completed) << "server kept the idle connection open";
    EXPECT_TRUE(read_ec == net::error::eof || read_ec == net::error::connection_reset)
        << read_ec.message();
    EXPECT_GE(elapsed, std::chrono::milliseconds(900));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(HttpServerTests, Stop_WithOpenConnection)
{
    start(ServiceConfig{});
    auto socket = connect();

    // TearDown must not wait for the idle connection
    m_server->stop();
    m_thread.join();
    m_server.reset();
    SUCCEED();
}
