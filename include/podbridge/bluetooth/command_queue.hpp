#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "podbridge/util/config_loader.hpp"

namespace podbridge::bluetooth {

// Line-oriented input of the control tool.
class CommandChannel {
public:
    virtual ~CommandChannel() = default;

    virtual bool is_running() const = 0;
    // Throws std::system_error when the line cannot be written.
    virtual void write_line(const std::string& line) = 0;
};

struct CommandReply {
    std::string command;
    std::string output;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

// Single-worker FIFO of tool commands. Exactly one command is in flight; it
// collects the tool output that arrives while it is active and resolves when
// its timeout elapses. Consecutive commands are separated by a short gap.
class CommandQueue {
public:
    using Handler = std::function<void(CommandReply)>;

    static constexpr const char* kNotConnected = "bluetoothctl not connected";

    CommandQueue(boost::asio::io_context& io_context, CommandChannel& channel, CommandTimeouts timeouts,
                 std::chrono::milliseconds gap);
    ~CommandQueue();

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    void submit(std::string command, Handler handler);
    void submit(std::string command, std::chrono::milliseconds timeout, Handler handler);

    // Appends tool output to the in-flight command, if any.
    void capture(std::string_view chunk);

    // Fails the in-flight command and everything queued behind it.
    void abort_all(const std::string& reason);

    std::size_t pending() const { return queue_.size(); }
    bool busy() const { return active_.has_value(); }

    std::chrono::milliseconds timeout_for(std::string_view command) const;

private:
    struct Request {
        std::string command;
        std::chrono::milliseconds timeout{0};
        Handler handler;
        std::string output;
    };

    void pump();
    void finish(std::optional<std::string> error);
    void reject(Request request, const std::string& reason);

    boost::asio::io_context& io_context_;
    CommandChannel& channel_;
    CommandTimeouts timeouts_;
    std::chrono::milliseconds gap_;

    std::deque<Request> queue_;
    std::optional<Request> active_;
    boost::asio::steady_timer timeout_timer_;
    boost::asio::steady_timer gap_timer_;
    bool in_gap_{false};
    std::uint64_t generation_{0};
};

}  // namespace podbridge::bluetooth
