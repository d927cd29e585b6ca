#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

namespace podbridge::server {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Accepts HTTP/1.1 connections on one port. Plain requests go to the request
// handler; WebSocket upgrade requests hand the socket to the upgrade handler.
class HttpServer {
public:
    using Responder = std::function<void(HttpResponse)>;
    using RequestHandler = std::function<void(const HttpRequest&, Responder)>;
    using UpgradeHandler = std::function<void(boost::asio::ip::tcp::socket, HttpRequest)>;

    explicit HttpServer(boost::asio::io_context& io_context);

    void set_request_handler(RequestHandler handler);
    void set_upgrade_handler(UpgradeHandler handler);

    void start(const std::string& host, std::uint16_t port);
    void stop();

    // Bound port; differs from the configured one when 0 was requested.
    std::uint16_t port() const;

private:
    void do_accept();

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    RequestHandler request_handler_;
    UpgradeHandler upgrade_handler_;
    bool running_{false};
};

}  // namespace podbridge::server
