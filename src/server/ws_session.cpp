#include "podbridge/server/ws_session.hpp"

#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>

#include "podbridge/util/logging.hpp"

namespace podbridge::server {

namespace {
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
}  // namespace

WsSession::WsSession(asio::ip::tcp::socket socket, std::size_t max_queue)
    : ws_(std::move(socket)), max_queue_(max_queue) {}

void WsSession::run(HttpRequest request) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, "podbridge");
    }));
    ws_.async_accept(request, [self = shared_from_this()](beast::error_code ec) {
        if (ec) {
            self->fail("accept", ec);
            return;
        }
        self->open_ = true;
        util::log::info("[websocket] Client connected");
        if (self->open_handler_) {
            self->open_handler_(self);
        }
        self->do_read();
    });
}

void WsSession::close() {
    asio::post(ws_.get_executor(), [self = shared_from_this()] {
        if (!self->open_) {
            return;
        }
        self->open_ = false;
        beast::get_lowest_layer(self->ws_).close();
    });
}

void WsSession::deliver(std::shared_ptr<const std::string> message) {
    asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
        if (!self->open_) {
            return;
        }
        if (self->outbox_.size() >= self->max_queue_) {
            if (self->dropped_++ == 0) {
                util::log::warn("[websocket] Outbound queue full, dropping messages");
            }
            return;
        }
        self->outbox_.push_back(std::move(message));
        if (self->outbox_.size() == 1) {
            self->do_write();
        }
    });
}

void WsSession::do_read() {
    ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed) {
                self->fail("read", ec);
            } else {
                self->fail("closed", {});
            }
            return;
        }
        auto text = beast::buffers_to_string(self->buffer_.data());
        self->buffer_.consume(self->buffer_.size());
        if (self->message_handler_) {
            self->message_handler_(*self, text);
        }
        self->do_read();
    });
}

void WsSession::do_write() {
    ws_.text(true);
    ws_.async_write(asio::buffer(*outbox_.front()), [self = shared_from_this()](beast::error_code ec, std::size_t) {
        if (ec) {
            self->outbox_.clear();
            self->fail("write", ec);
            return;
        }
        self->outbox_.pop_front();
        if (!self->open_) {
            self->outbox_.clear();
            return;
        }
        if (!self->outbox_.empty()) {
            self->do_write();
        }
    });
}

void WsSession::fail(const std::string& what, const beast::error_code& ec) {
    open_ = false;
    if (ec) {
        util::log::debug("[websocket] " + what + ": " + ec.message());
    }
    if (closed_notified_) {
        return;
    }
    closed_notified_ = true;
    util::log::info("[websocket] Client disconnected");
    if (close_handler_) {
        close_handler_(*this);
    }
}

}  // namespace podbridge::server
