#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "podbridge/bluetooth/event_broadcaster.hpp"
#include "podbridge/server/http_server.hpp"

namespace podbridge::server {

// One WebSocket client. Outbound messages are queued and written one at a
// time; when the queue is full further messages are dropped.
class WsSession : public bluetooth::EventSubscriber, public std::enable_shared_from_this<WsSession> {
public:
    using OpenHandler = std::function<void(const std::shared_ptr<WsSession>&)>;
    using MessageHandler = std::function<void(WsSession&, const std::string&)>;
    using CloseHandler = std::function<void(WsSession&)>;

    static constexpr std::size_t kDefaultMaxQueue = 256;

    WsSession(boost::asio::ip::tcp::socket socket, std::size_t max_queue = kDefaultMaxQueue);

    void set_open_handler(OpenHandler handler) { open_handler_ = std::move(handler); }
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }

    // Completes the upgrade handshake for the already-read request.
    void run(HttpRequest request);
    void close();

    void deliver(std::shared_ptr<const std::string> message) override;
    bool is_open() const override { return open_; }

    std::uint64_t subscription() const { return subscription_; }
    void set_subscription(std::uint64_t id) { subscription_ = id; }
    std::size_t dropped() const { return dropped_; }

private:
    void do_read();
    void do_write();
    void fail(const std::string& what, const boost::beast::error_code& ec);

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::shared_ptr<const std::string>> outbox_;
    std::size_t max_queue_;
    std::atomic<bool> open_{false};
    bool closed_notified_{false};
    std::size_t dropped_{0};
    std::uint64_t subscription_{0};

    OpenHandler open_handler_;
    MessageHandler message_handler_;
    CloseHandler close_handler_;
};

}  // namespace podbridge::server
