#include "podbridge/server/http_server.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <utility>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "podbridge/util/logging.hpp"

namespace podbridge::server {

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

constexpr std::size_t kMaxBodyBytes = 64 * 1024;

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, HttpServer::RequestHandler request_handler,
                HttpServer::UpgradeHandler upgrade_handler)
        : stream_(std::move(socket)),
          request_handler_(std::move(request_handler)),
          upgrade_handler_(std::move(upgrade_handler)) {}

    void run() { do_read(); }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(kMaxBodyBytes);
        stream_.expires_after(std::chrono::seconds(30));
        http::async_read(stream_, buffer_, *parser_,
                         [self = shared_from_this()](beast::error_code ec, std::size_t) { self->on_read(ec); });
    }

    void on_read(beast::error_code ec) {
        if (ec == http::error::end_of_stream) {
            close();
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout) {
                util::log::debug("[http] Read error: " + ec.message());
            }
            return;
        }

        auto request = parser_->release();
        if (websocket::is_upgrade(request)) {
            stream_.expires_never();
            if (upgrade_handler_) {
                upgrade_handler_(stream_.release_socket(), std::move(request));
            }
            return;
        }

        if (!request_handler_) {
            return;
        }
        const bool keep_alive = request.keep_alive();
        request_handler_(request, [self = shared_from_this(), keep_alive](HttpResponse response) {
            response.keep_alive(keep_alive);
            response.prepare_payload();
            asio::post(self->stream_.get_executor(), [self, response = std::move(response)]() mutable {
                self->write(std::move(response));
            });
        });
    }

    void write(HttpResponse response) {
        auto shared = std::make_shared<HttpResponse>(std::move(response));
        http::async_write(stream_, *shared,
                          [self = shared_from_this(), shared](beast::error_code ec, std::size_t) {
                              if (ec) {
                                  util::log::debug("[http] Write error: " + ec.message());
                                  return;
                              }
                              if (shared->need_eof()) {
                                  self->close();
                                  return;
                              }
                              self->do_read();
                          });
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    HttpServer::RequestHandler request_handler_;
    HttpServer::UpgradeHandler upgrade_handler_;
};

}  // namespace

HttpServer::HttpServer(asio::io_context& io_context) : io_context_(io_context), acceptor_(io_context) {}

void HttpServer::set_request_handler(RequestHandler handler) {
    request_handler_ = std::move(handler);
}

void HttpServer::set_upgrade_handler(UpgradeHandler handler) {
    upgrade_handler_ = std::move(handler);
}

void HttpServer::start(const std::string& host, std::uint16_t port) {
    const tcp::endpoint endpoint(asio::ip::make_address(host), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    running_ = true;
    util::log::info("[http] Listening on " + host + ":" + std::to_string(this->port()));
    do_accept();
}

void HttpServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        util::log::warn("[http] Acceptor close error: " + ec.message());
    }
}

std::uint16_t HttpServer::port() const {
    beast::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_context_), [this](beast::error_code ec, tcp::socket socket) {
        if (!running_) {
            return;
        }
        if (ec) {
            util::log::warn("[http] Accept error: " + ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), request_handler_, upgrade_handler_)->run();
        }
        do_accept();
    });
}

}  // namespace podbridge::server
